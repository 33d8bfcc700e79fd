#pragma once

#include "domain/SessionClaims.hpp"
#include "domain/enums/AuthError.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <chrono>
#include <cstdint>

namespace magiclink::adapters::secondary::claims {

namespace detail {

inline int64_t toNanos(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromNanos(int64_t nanos) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos)));
}

} // namespace detail

/**
 * @brief Компактный JSON {"sub":..., "iat":..., "exp":...}, время в наносекундах от эпохи
 *
 * Полная точность iat нужна checkLifetime(): округлённый вниз iat
 * сдвигает границу срока жизни на долю секунды раньше.
 */
inline std::string toJson(const domain::SessionClaims& claims) {
    nlohmann::json json;
    json["sub"] = claims.subject;
    json["iat"] = detail::toNanos(claims.issuedAt);
    if (claims.expiresAt) {
        json["exp"] = detail::toNanos(*claims.expiresAt);
    }
    return json.dump();
}

/**
 * @return std::nullopt если JSON битый или поля не того типа
 */
inline std::optional<domain::SessionClaims> fromJson(const std::string& text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    auto sub = json.find("sub");
    auto iat = json.find("iat");
    if (sub == json.end() || !sub->is_string() ||
        iat == json.end() || !iat->is_number_integer()) {
        return std::nullopt;
    }

    domain::SessionClaims claims;
    claims.subject = sub->get<std::string>();
    if (claims.subject.empty()) {
        return std::nullopt;
    }
    claims.issuedAt = detail::fromNanos(iat->get<int64_t>());

    auto exp = json.find("exp");
    if (exp != json.end()) {
        if (!exp->is_number_integer()) {
            return std::nullopt;
        }
        claims.expiresAt = detail::fromNanos(exp->get<int64_t>());
    }
    return claims;
}

/**
 * @brief Новые claims: iat = now, exp = iat + lifetime
 */
inline domain::SessionClaims issue(const std::string& subject,
                                   std::chrono::system_clock::time_point now,
                                   std::chrono::seconds lifetime) {
    domain::SessionClaims claims;
    claims.subject = subject;
    claims.issuedAt = now;
    claims.expiresAt = claims.issuedAt + lifetime;
    return claims;
}

/**
 * @brief Проверка срока жизни: now - iat <= lifetime и now <= exp
 */
inline domain::AuthError checkLifetime(const domain::SessionClaims& claims,
                                       std::chrono::system_clock::time_point now,
                                       std::chrono::seconds lifetime) {
    if (now - claims.issuedAt > lifetime) {
        return domain::AuthError::EXPIRED;
    }
    if (claims.expiresAt && now > *claims.expiresAt) {
        return domain::AuthError::EXPIRED;
    }
    return domain::AuthError::NONE;
}

} // namespace magiclink::adapters::secondary::claims
