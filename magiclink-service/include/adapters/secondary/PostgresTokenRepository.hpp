#pragma once

#include "ports/output/ITokenRepository.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <cstdint>
#include <memory>
#include <mutex>
#include <iostream>

namespace magiclink::adapters::secondary {

/**
 * @brief Хранилище токенов в PostgreSQL
 *
 * Ожидаемая таблица:
 *   magic_tokens(token_hash TEXT PRIMARY KEY, identity TEXT, purpose TEXT,
 *                created_at TIMESTAMPTZ, expires_at TIMESTAMPTZ,
 *                consumed BOOLEAN, consumed_at TIMESTAMPTZ)
 *
 * Погашение одним UPDATE ... WHERE consumed = FALSE: БД гарантирует,
 * что строку переведёт в consumed только одна транзакция.
 * Ошибки БД пробрасываются вызывающему.
 */
class PostgresTokenRepository : public ports::output::ITokenRepository {
public:
    explicit PostgresTokenRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTokenRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresTokenRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresTokenRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool insert(const domain::Token& token) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    INSERT INTO magic_tokens
                        (token_hash, identity, purpose, created_at, expires_at, consumed)
                    VALUES ($1, $2, $3, to_timestamp($4), to_timestamp($5), FALSE)
                    ON CONFLICT (token_hash) DO NOTHING
                )",
                token.tokenHash,
                token.identity,
                domain::toString(token.purpose),
                toEpoch(token.createdAt),
                toEpoch(token.expiresAt)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] insert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Token> findByHash(const std::string& tokenHash) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + " WHERE token_hash = $1",
                tokenHash
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToToken(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] findByHash() failed: " << e.what() << std::endl;
            throw;
        }
    }

    ports::output::ConsumeOutcome consume(const std::string& tokenHash,
                                          std::chrono::system_clock::time_point now) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto updated = txn.exec_params(
                R"(
                    UPDATE magic_tokens
                    SET consumed = TRUE, consumed_at = to_timestamp($2)
                    WHERE token_hash = $1
                      AND consumed = FALSE
                      AND expires_at > to_timestamp($2)
                    RETURNING identity
                )",
                tokenHash,
                toEpoch(now)
            );

            if (!updated.empty()) {
                txn.commit();
                return {true, updated[0]["identity"].as<std::string>(), domain::RedemptionError::NONE};
            }

            // Причина отказа
            auto existing = txn.exec_params(
                "SELECT consumed FROM magic_tokens WHERE token_hash = $1",
                tokenHash
            );
            txn.commit();

            if (existing.empty()) {
                return {false, "", domain::RedemptionError::NOT_FOUND};
            }
            if (existing[0]["consumed"].as<bool>()) {
                return {false, "", domain::RedemptionError::ALREADY_CONSUMED};
            }
            return {false, "", domain::RedemptionError::EXPIRED};

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] consume() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Token> findLatestByIdentity(const std::string& identity) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                    " WHERE identity = $1 ORDER BY created_at DESC LIMIT 1",
                identity
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToToken(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] findLatestByIdentity() failed: " << e.what() << std::endl;
            throw;
        }
    }

    size_t deleteInactive(std::chrono::system_clock::time_point now) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "DELETE FROM magic_tokens WHERE consumed = TRUE OR expires_at <= to_timestamp($1)",
                toEpoch(now)
            );

            txn.commit();
            return static_cast<size_t>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTokenRepository] deleteInactive() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT token_hash, identity, purpose, consumed,
               EXTRACT(EPOCH FROM created_at)::double precision AS created_epoch,
               EXTRACT(EPOCH FROM expires_at)::double precision AS expires_epoch,
               COALESCE(EXTRACT(EPOCH FROM consumed_at)::double precision, 0) AS consumed_epoch
        FROM magic_tokens)";

    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    /// Секунды с микросекундной точностью (точность TIMESTAMPTZ)
    static double toEpoch(std::chrono::system_clock::time_point tp) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            tp.time_since_epoch()).count();
        return static_cast<double>(micros) / 1e6;
    }

    static std::chrono::system_clock::time_point fromEpoch(double seconds) {
        auto micros = static_cast<int64_t>(seconds * 1e6 + (seconds >= 0 ? 0.5 : -0.5));
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros)));
    }

    domain::Token rowToToken(const pqxx::row& row) const {
        domain::Token token;
        token.tokenHash = row["token_hash"].as<std::string>();
        token.identity = row["identity"].as<std::string>();
        token.purpose = domain::parseTokenPurpose(row["purpose"].as<std::string>());
        token.consumed = row["consumed"].as<bool>();
        token.createdAt = fromEpoch(row["created_epoch"].as<double>());
        token.expiresAt = fromEpoch(row["expires_epoch"].as<double>());
        token.consumedAt = fromEpoch(row["consumed_epoch"].as<double>());
        return token;
    }
};

} // namespace magiclink::adapters::secondary
