#pragma once

#include "domain/OutgoingEmail.hpp"
#include "domain/enums/IssueError.hpp"
#include <string>

namespace magiclink::ports::input {

/**
 * @brief Результат подготовки письма со ссылкой
 */
struct IssueLinkResult {
    bool success;
    domain::OutgoingEmail email;
    domain::IssueError error;
    std::string message;
    int retryAfterSeconds = 0;  ///< Для RATE_LIMITED
};

/**
 * @brief Результат запроса ссылки (подготовка + отправка)
 */
struct RequestLinkResult {
    bool success;
    domain::IssueError error;
    std::string message;
    int retryAfterSeconds = 0;
};

/**
 * @brief Выпуск magic-link писем
 */
class ILinkIssuer {
public:
    virtual ~ILinkIssuer() = default;

    /**
     * @brief Выпустить токен и собрать подписанное письмо (без отправки)
     */
    virtual IssueLinkResult issueLink(const std::string& identity) = 0;

    /**
     * @brief issueLink + передача письма транспорту
     *
     * Ошибка транспорта не откатывает выпущенный токен.
     */
    virtual RequestLinkResult requestLink(const std::string& identity) = 0;
};

} // namespace magiclink::ports::input
