#pragma once

#include <string>

namespace magiclink::domain {

/**
 * @brief Ошибки аутентификации сессии
 */
enum class AuthError {
    NONE,
    BAD_SIGNATURE,
    EXPIRED,
    UNAUTHENTICATED,
    TIMEOUT
};

inline std::string toString(AuthError error) {
    switch (error) {
        case AuthError::NONE: return "NONE";
        case AuthError::BAD_SIGNATURE: return "BAD_SIGNATURE";
        case AuthError::EXPIRED: return "EXPIRED";
        case AuthError::UNAUTHENTICATED: return "UNAUTHENTICATED";
        case AuthError::TIMEOUT: return "TIMEOUT";
        default: return "UNKNOWN";
    }
}

} // namespace magiclink::domain
