#pragma once

#include "ports/output/ITokenRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <iostream>

namespace magiclink::adapters::secondary {

/**
 * @brief Хранилище токенов в памяти процесса
 *
 * Для MAGICLINK_STORAGE=memory и тестов. Погашение выполняется как
 * compare-and-set под эксклюзивной блокировкой ThreadSafeMap::update.
 */
class InMemoryTokenRepository : public ports::output::ITokenRepository {
public:
    InMemoryTokenRepository() {
        std::cout << "[InMemoryTokenRepository] Created" << std::endl;
    }

    bool insert(const domain::Token& token) override {
        return tokens_.insertIfAbsent(token.tokenHash, std::make_shared<domain::Token>(token));
    }

    std::optional<domain::Token> findByHash(const std::string& tokenHash) override {
        return tokens_.get(tokenHash);
    }

    ports::output::ConsumeOutcome consume(const std::string& tokenHash,
                                          std::chrono::system_clock::time_point now) override {
        ports::output::ConsumeOutcome outcome{false, "", domain::RedemptionError::NOT_FOUND};

        tokens_.update(tokenHash, [&outcome, now](domain::Token& token) {
            if (!token.isUsableAt(now)) {
                // Погашенный раньше истёкшего
                outcome.error = token.consumed ? domain::RedemptionError::ALREADY_CONSUMED
                                               : domain::RedemptionError::EXPIRED;
                return false;
            }
            token.consumed = true;
            token.consumedAt = now;
            outcome = {true, token.identity, domain::RedemptionError::NONE};
            return true;
        });

        return outcome;
    }

    std::optional<domain::Token> findLatestByIdentity(const std::string& identity) override {
        std::optional<domain::Token> latest;
        tokens_.forEach([&](const std::string&, const domain::Token& token) {
            if (token.identity != identity) return;
            if (!latest || token.createdAt > latest->createdAt) {
                latest = token;
            }
        });
        return latest;
    }

    size_t deleteInactive(std::chrono::system_clock::time_point now) override {
        return tokens_.eraseIf([now](const domain::Token& token) {
            return !token.isUsableAt(now);
        });
    }

    // Test helpers
    void clear() { tokens_.clear(); }
    size_t size() const { return tokens_.size(); }

private:
    ThreadSafeMap<std::string, domain::Token> tokens_;
};

} // namespace magiclink::adapters::secondary
