#pragma once

#include "domain/enums/AuthError.hpp"
#include <string>

namespace magiclink::ports::output {

/**
 * @brief Результат проверки session cookie
 */
struct SessionAuthResult {
    bool success;
    std::string identity;
    domain::AuthError error;
};

/**
 * @brief Выпуск и проверка session cookie
 *
 * Сессии нигде не хранятся: всё состояние внутри значения cookie.
 */
class ISessionCodec {
public:
    virtual ~ISessionCodec() = default;

    /**
     * @brief Выпустить значение cookie для identity
     */
    virtual std::string mint(const std::string& identity) = 0;

    /**
     * @brief Проверить значение cookie
     *
     * BAD_SIGNATURE для любого изменённого или неразборчивого значения,
     * EXPIRED если подпись верна, но срок жизни вышел.
     */
    virtual SessionAuthResult authenticate(const std::string& cookieValue) = 0;
};

} // namespace magiclink::ports::output
