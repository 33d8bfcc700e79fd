#pragma once

#include "Env.hpp"
#include "crypto/Encoding.hpp"
#include <string>
#include <chrono>

namespace magiclink::adapters::secondary {

/**
 * @brief Режим защиты session cookie
 */
enum class SessionMode {
    ENCRYPTED,  ///< AES-256-GCM (по умолчанию)
    SIGNED      ///< HMAC-SHA256, содержимое читаемо
};

/**
 * @brief Настройки сессий из ENV
 *
 * MAGICLINK_SESSION_SECRET: base64, после декодирования не меньше 32 байт.
 */
class SessionSettings {
public:
    static constexpr size_t MIN_SECRET_BYTES = 32;

    SessionSettings() {
        secret_ = decodeSecret(env::getEnvOrThrow("MAGICLINK_SESSION_SECRET"));
        lifetime_ = std::chrono::seconds(env::getIntOrDefault("MAGICLINK_SESSION_LIFETIME", 86400));
        cookieName_ = env::getEnvOrDefault("MAGICLINK_SESSION_COOKIE", "session");
        mode_ = parseMode(env::getEnvOrDefault("MAGICLINK_SESSION_MODE", "encrypted"));
        validate();
    }

    /**
     * @param secret Уже декодированный секрет (сырые байты)
     */
    SessionSettings(std::string secret,
                    std::chrono::seconds lifetime,
                    std::string cookieName = "session",
                    SessionMode mode = SessionMode::ENCRYPTED)
        : secret_(std::move(secret))
        , lifetime_(lifetime)
        , cookieName_(std::move(cookieName))
        , mode_(mode)
    {
        validate();
    }

    const std::string& getSecret() const { return secret_; }
    std::chrono::seconds getLifetime() const { return lifetime_; }
    std::string getCookieName() const { return cookieName_; }
    SessionMode getMode() const { return mode_; }

private:
    std::string secret_;
    std::chrono::seconds lifetime_;
    std::string cookieName_;
    SessionMode mode_;

    void validate() const {
        if (secret_.size() < MIN_SECRET_BYTES) {
            throw domain::ConfigurationError("Session secret must be at least 32 bytes");
        }
        if (lifetime_.count() <= 0) {
            throw domain::ConfigurationError("Session lifetime must be positive");
        }
        if (cookieName_.empty()) {
            throw domain::ConfigurationError("Session cookie name is empty");
        }
    }

    static std::string decodeSecret(const std::string& encoded) {
        auto decoded = crypto::base64Decode(encoded);
        if (!decoded) {
            throw domain::ConfigurationError("MAGICLINK_SESSION_SECRET is not valid base64");
        }
        return *decoded;
    }

    static SessionMode parseMode(const std::string& mode) {
        if (mode == "encrypted") return SessionMode::ENCRYPTED;
        if (mode == "signed") return SessionMode::SIGNED;
        throw domain::ConfigurationError("MAGICLINK_SESSION_MODE must be 'encrypted' or 'signed'");
    }
};

} // namespace magiclink::adapters::secondary
