#pragma once

#include <string>

namespace magiclink::domain {

/**
 * @brief Ошибка проверки ссылки, как её видит клиент
 */
enum class VerifyError {
    NONE,
    INVALID_OR_EXPIRED_LINK,
    TIMEOUT
};

inline std::string toString(VerifyError error) {
    switch (error) {
        case VerifyError::NONE: return "NONE";
        case VerifyError::INVALID_OR_EXPIRED_LINK: return "INVALID_OR_EXPIRED_LINK";
        case VerifyError::TIMEOUT: return "TIMEOUT";
        default: return "UNKNOWN";
    }
}

} // namespace magiclink::domain
