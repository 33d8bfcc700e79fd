#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace magiclink::domain {

/**
 * @brief Содержимое session cookie
 *
 * На сервере не хранится: cookie самодостаточна и защищена MAC/AEAD.
 */
struct SessionClaims {
    std::string subject;                                            ///< email пользователя
    std::chrono::system_clock::time_point issuedAt;
    std::optional<std::chrono::system_clock::time_point> expiresAt; ///< Горизонт жизни (если задан)
};

} // namespace magiclink::domain
