#pragma once

#include "Env.hpp"
#include <string>
#include <chrono>
#include <cstddef>

namespace magiclink::adapters::secondary {

/**
 * @brief Настройки выпуска и погашения ссылок из ENV
 */
class LinkSettings {
public:
    LinkSettings() {
        tokenTtl_ = std::chrono::seconds(env::getIntOrDefault("MAGICLINK_TOKEN_TTL", 900));
        issueCooldown_ = std::chrono::seconds(env::getIntOrDefault("MAGICLINK_ISSUE_COOLDOWN", 120));
        baseUrl_ = env::getEnvOrThrow("MAGICLINK_BASE_URL");
        verifyPath_ = env::getEnvOrDefault("MAGICLINK_VERIFY_PATH", "/auth/verify");
        mailFrom_ = env::getEnvOrThrow("MAGICLINK_MAIL_FROM");
        mailSubject_ = env::getEnvOrDefault("MAGICLINK_MAIL_SUBJECT", "Your sign-in link");
        operationTimeout_ = std::chrono::milliseconds(
            env::getIntOrDefault("MAGICLINK_OPERATION_TIMEOUT_MS", 5000));
        sweepInterval_ = std::chrono::seconds(env::getIntOrDefault("MAGICLINK_SWEEP_INTERVAL", 3600));
        verifyWorkers_ = env::getIntOrDefault("MAGICLINK_VERIFY_WORKERS", 4);
        verifyMaxInFlight_ = env::getIntOrDefault("MAGICLINK_VERIFY_MAX_IN_FLIGHT", 32);
        validate();
    }

    LinkSettings(std::string baseUrl,
                 std::string mailFrom,
                 std::chrono::seconds tokenTtl = std::chrono::seconds(900),
                 std::chrono::seconds issueCooldown = std::chrono::seconds(120),
                 std::chrono::milliseconds operationTimeout = std::chrono::milliseconds(5000),
                 int verifyWorkers = 4,
                 int verifyMaxInFlight = 32)
        : tokenTtl_(tokenTtl)
        , issueCooldown_(issueCooldown)
        , baseUrl_(std::move(baseUrl))
        , verifyPath_("/auth/verify")
        , mailFrom_(std::move(mailFrom))
        , mailSubject_("Your sign-in link")
        , operationTimeout_(operationTimeout)
        , sweepInterval_(std::chrono::seconds(3600))
        , verifyWorkers_(verifyWorkers)
        , verifyMaxInFlight_(verifyMaxInFlight)
    {
        validate();
    }

    std::chrono::seconds getTokenTtl() const { return tokenTtl_; }
    std::chrono::seconds getIssueCooldown() const { return issueCooldown_; }
    std::string getBaseUrl() const { return baseUrl_; }
    std::string getVerifyPath() const { return verifyPath_; }
    std::string getMailFrom() const { return mailFrom_; }
    std::string getMailSubject() const { return mailSubject_; }
    std::chrono::milliseconds getOperationTimeout() const { return operationTimeout_; }
    std::chrono::seconds getSweepInterval() const { return sweepInterval_; }
    size_t getVerifyWorkers() const { return static_cast<size_t>(verifyWorkers_); }
    size_t getVerifyMaxInFlight() const { return static_cast<size_t>(verifyMaxInFlight_); }

    /// Адрес отправителя без display name: "Name <a@b>" -> "a@b"
    std::string getMailFromAddress() const {
        auto open = mailFrom_.find('<');
        auto close = mailFrom_.find('>', open == std::string::npos ? 0 : open);
        if (open == std::string::npos || close == std::string::npos) {
            return mailFrom_;
        }
        return mailFrom_.substr(open + 1, close - open - 1);
    }

    /// <baseUrl><verifyPath>?token=<identifier>
    std::string buildLink(const std::string& identifier) const {
        std::string base = baseUrl_;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base + verifyPath_ + "?token=" + identifier;
    }

private:
    std::chrono::seconds tokenTtl_;
    std::chrono::seconds issueCooldown_;
    std::string baseUrl_;
    std::string verifyPath_;
    std::string mailFrom_;
    std::string mailSubject_;
    std::chrono::milliseconds operationTimeout_;
    std::chrono::seconds sweepInterval_;
    int verifyWorkers_;
    int verifyMaxInFlight_;

    void validate() const {
        if (tokenTtl_.count() <= 0) {
            throw domain::ConfigurationError("MAGICLINK_TOKEN_TTL must be positive");
        }
        if (issueCooldown_.count() < 0) {
            throw domain::ConfigurationError("MAGICLINK_ISSUE_COOLDOWN must not be negative");
        }
        if (operationTimeout_.count() <= 0) {
            throw domain::ConfigurationError("MAGICLINK_OPERATION_TIMEOUT_MS must be positive");
        }
        if (sweepInterval_.count() < 0) {
            throw domain::ConfigurationError("MAGICLINK_SWEEP_INTERVAL must not be negative");
        }
        if (verifyWorkers_ <= 0 || verifyMaxInFlight_ < verifyWorkers_) {
            throw domain::ConfigurationError(
                "MAGICLINK_VERIFY_WORKERS must be positive and not exceed MAGICLINK_VERIFY_MAX_IN_FLIGHT");
        }
        if (baseUrl_.empty() || mailFrom_.empty()) {
            throw domain::ConfigurationError("Base URL and mail sender are required");
        }
        if (verifyPath_.empty() || verifyPath_.front() != '/') {
            throw domain::ConfigurationError("MAGICLINK_VERIFY_PATH must start with '/'");
        }
    }
};

} // namespace magiclink::adapters::secondary
