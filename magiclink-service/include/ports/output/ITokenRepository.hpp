#pragma once

#include "domain/Token.hpp"
#include "domain/enums/RedemptionError.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace magiclink::ports::output {

/**
 * @brief Результат атомарного погашения токена
 */
struct ConsumeOutcome {
    bool success;
    std::string identity;
    domain::RedemptionError error;
};

/**
 * @brief Интерфейс хранилища одноразовых токенов
 *
 * Ключ хранилища это hash идентификатора, сам идентификатор сюда не попадает.
 */
class ITokenRepository {
public:
    virtual ~ITokenRepository() = default;

    /**
     * @return false если токен с таким hash уже есть
     */
    virtual bool insert(const domain::Token& token) = 0;

    virtual std::optional<domain::Token> findByHash(const std::string& tokenHash) = 0;

    /**
     * @brief Погасить токен одной атомарной операцией
     *
     * Успех только если токен существует, не погашен и now < expiresAt.
     * Из конкурирующих вызовов для одного hash успешен не более чем один.
     * Отказ классифицируется в порядке NOT_FOUND, ALREADY_CONSUMED, EXPIRED.
     */
    virtual ConsumeOutcome consume(const std::string& tokenHash,
                                   std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief Последний выпущенный токен владельца (по createdAt)
     */
    virtual std::optional<domain::Token> findLatestByIdentity(const std::string& identity) = 0;

    /**
     * @brief Удалить погашенные и просроченные токены
     * @return сколько удалено
     */
    virtual size_t deleteInactive(std::chrono::system_clock::time_point now) = 0;
};

} // namespace magiclink::ports::output
