#pragma once

#include "enums/TokenPurpose.hpp"
#include <string>
#include <chrono>

namespace magiclink::domain {

/**
 * @brief Одноразовый токен magic-link
 *
 * В хранилище попадает только SHA-256 от идентификатора, сам идентификатор
 * живёт лишь в ссылке из письма.
 */
struct Token {
    std::string tokenHash;      ///< hex(SHA-256(identifier)), первичный ключ
    std::string identity;       ///< Владелец (нормализованный email)
    TokenPurpose purpose = TokenPurpose::MAGIC_LINK;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;
    bool consumed = false;
    std::chrono::system_clock::time_point consumedAt;

    Token() = default;

    Token(const std::string& tokenHash,
          const std::string& identity,
          std::chrono::system_clock::time_point createdAt,
          std::chrono::seconds ttl,
          TokenPurpose purpose = TokenPurpose::MAGIC_LINK)
        : tokenHash(tokenHash)
        , identity(identity)
        , purpose(purpose)
        , createdAt(createdAt)
        , expiresAt(createdAt + ttl)
    {}

    bool isExpiredAt(std::chrono::system_clock::time_point now) const {
        return now >= expiresAt;
    }

    /**
     * @brief Токен можно погасить только пока now < expiresAt и он не использован
     */
    bool isUsableAt(std::chrono::system_clock::time_point now) const {
        return !consumed && !isExpiredAt(now);
    }
};

/**
 * @brief Результат выпуска токена
 *
 * identifier отдаётся вызывающему ровно один раз и нигде не сохраняется.
 */
struct IssuedToken {
    std::string identifier;
    Token token;
};

} // namespace magiclink::domain
