#pragma once

#include "domain/Token.hpp"
#include "domain/enums/TokenPurpose.hpp"
#include "domain/enums/RedemptionError.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

namespace magiclink::ports::input {

/**
 * @brief Результат погашения токена
 */
struct RedeemResult {
    bool success;
    std::string identity;
    domain::RedemptionError error;
};

/**
 * @brief Учёт одноразовых токенов
 */
class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    /**
     * @brief Выпустить новый токен
     * @return идентификатор (отдаётся только здесь) и метаданные сохранённого токена
     */
    virtual domain::IssuedToken issue(
        const std::string& identity,
        domain::TokenPurpose purpose = domain::TokenPurpose::MAGIC_LINK
    ) = 0;

    /**
     * @brief Погасить токен по идентификатору из ссылки
     */
    virtual RedeemResult redeem(const std::string& identifier) = 0;

    /**
     * @brief Когда identity последний раз получала токен
     */
    virtual std::optional<std::chrono::system_clock::time_point> latestIssuedAt(
        const std::string& identity
    ) = 0;

    /**
     * @brief Удалить погашенные и просроченные токены
     */
    virtual size_t sweep() = 0;
};

} // namespace magiclink::ports::input
