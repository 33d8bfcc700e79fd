#pragma once

#include <string>

namespace magiclink::domain {

/**
 * @brief Назначение одноразового токена
 *
 * Пока используется только MAGIC_LINK, остальные виды зарезервированы.
 */
enum class TokenPurpose {
    MAGIC_LINK
};

inline std::string toString(TokenPurpose purpose) {
    switch (purpose) {
        case TokenPurpose::MAGIC_LINK: return "MAGIC_LINK";
        default: return "UNKNOWN";
    }
}

inline TokenPurpose parseTokenPurpose(const std::string& str) {
    // Других видов пока нет
    (void)str;
    return TokenPurpose::MAGIC_LINK;
}

} // namespace magiclink::domain
