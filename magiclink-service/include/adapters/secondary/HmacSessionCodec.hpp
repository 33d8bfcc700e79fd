#pragma once

#include "ports/output/ISessionCodec.hpp"
#include "ports/output/IClock.hpp"
#include "SessionSettings.hpp"
#include "SessionClaimsJson.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Encoding.hpp"
#include <memory>
#include <iostream>

namespace magiclink::adapters::secondary {

/**
 * @brief Подписанная (но читаемая) session cookie
 *
 * Формат: v1.<b64url(claims)>.<b64url(HMAC-SHA256(macKey, "v1." + b64url(claims)))>
 * MAC проверяется до разбора claims, поэтому любое изменение значения
 * даёт BAD_SIGNATURE, а не EXPIRED.
 */
class HmacSessionCodec : public ports::output::ISessionCodec {
public:
    static constexpr const char* PREFIX = "v1.";

    HmacSessionCodec(
        std::shared_ptr<SessionSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , clock_(std::move(clock))
      , macKey_(crypto::hmacSha256(settings_->getSecret(), "magiclink/session/mac/v1"))
    {
        std::cout << "[HmacSessionCodec] Created, lifetime="
                  << settings_->getLifetime().count() << "s" << std::endl;
    }

    std::string mint(const std::string& identity) override {
        auto sessionClaims = claims::issue(identity, clock_->now(), settings_->getLifetime());
        std::string signedPart = PREFIX + crypto::base64UrlEncode(claims::toJson(sessionClaims));
        return signedPart + "." + crypto::base64UrlEncode(crypto::hmacSha256(macKey_, signedPart));
    }

    ports::output::SessionAuthResult authenticate(const std::string& cookieValue) override {
        const ports::output::SessionAuthResult bad{false, "", domain::AuthError::BAD_SIGNATURE};

        const std::string prefix = PREFIX;
        if (cookieValue.compare(0, prefix.size(), prefix) != 0) {
            return bad;
        }

        auto dot = cookieValue.find('.', prefix.size());
        if (dot == std::string::npos || cookieValue.find('.', dot + 1) != std::string::npos) {
            return bad;
        }

        std::string signedPart = cookieValue.substr(0, dot);
        auto mac = crypto::base64UrlDecode(cookieValue.substr(dot + 1));
        if (!mac || !crypto::constantTimeEquals(*mac, crypto::hmacSha256(macKey_, signedPart))) {
            return bad;
        }

        auto json = crypto::base64UrlDecode(signedPart.substr(prefix.size()));
        if (!json) {
            return bad;
        }
        auto sessionClaims = claims::fromJson(*json);
        if (!sessionClaims) {
            return bad;
        }

        auto error = claims::checkLifetime(*sessionClaims, clock_->now(), settings_->getLifetime());
        if (error != domain::AuthError::NONE) {
            return {false, "", error};
        }
        return {true, sessionClaims->subject, domain::AuthError::NONE};
    }

private:
    std::shared_ptr<SessionSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::string macKey_;
};

} // namespace magiclink::adapters::secondary
