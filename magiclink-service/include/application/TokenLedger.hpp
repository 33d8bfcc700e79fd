#pragma once

#include "ports/input/ITokenLedger.hpp"
#include "ports/output/ITokenRepository.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Encoding.hpp"
#include <memory>
#include <stdexcept>
#include <iostream>

namespace magiclink::application {

/**
 * @brief Учёт одноразовых токенов magic-link
 *
 * Идентификатор: 32 байта из CSPRNG в base64url (43 символа).
 * В хранилище кладётся только hex(SHA-256(identifier)).
 */
class TokenLedger : public ports::input::ITokenLedger {
public:
    static constexpr size_t IDENTIFIER_BYTES = 32;

    TokenLedger(
        std::shared_ptr<adapters::secondary::LinkSettings> settings,
        std::shared_ptr<ports::output::ITokenRepository> repository,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , repository_(std::move(repository))
      , clock_(std::move(clock))
    {
        std::cout << "[TokenLedger] Created, ttl=" << settings_->getTokenTtl().count() << "s" << std::endl;
    }

    domain::IssuedToken issue(
        const std::string& identity,
        domain::TokenPurpose purpose = domain::TokenPurpose::MAGIC_LINK
    ) override {
        std::string identifier = crypto::base64UrlEncode(crypto::randomBytes(IDENTIFIER_BYTES));

        domain::Token token(
            hashIdentifier(identifier),
            identity,
            clock_->now(),
            settings_->getTokenTtl(),
            purpose
        );

        if (!repository_->insert(token)) {
            throw std::runtime_error("Token hash collision");
        }

        return {identifier, token};
    }

    ports::input::RedeemResult redeem(const std::string& identifier) override {
        // Чужой формат не может совпасть ни с одним выпущенным hash
        auto raw = crypto::base64UrlDecode(identifier);
        if (!raw || raw->size() != IDENTIFIER_BYTES) {
            return {false, "", domain::RedemptionError::NOT_FOUND};
        }

        auto outcome = repository_->consume(hashIdentifier(identifier), clock_->now());
        return {outcome.success, outcome.identity, outcome.error};
    }

    std::optional<std::chrono::system_clock::time_point> latestIssuedAt(
        const std::string& identity
    ) override {
        auto latest = repository_->findLatestByIdentity(identity);
        if (!latest) {
            return std::nullopt;
        }
        return latest->createdAt;
    }

    size_t sweep() override {
        return repository_->deleteInactive(clock_->now());
    }

    static std::string hashIdentifier(const std::string& identifier) {
        return crypto::sha256Hex(identifier);
    }

private:
    std::shared_ptr<adapters::secondary::LinkSettings> settings_;
    std::shared_ptr<ports::output::ITokenRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace magiclink::application
