#pragma once

#include "MailHeader.hpp"
#include <string>

namespace magiclink::domain {

/**
 * @brief Полностью сформированное и подписанное письмо
 *
 * from/to/subject дублируются в headers: подписываются именно заголовки,
 * а отдельные поля нужны Mailer для SMTP envelope.
 */
struct OutgoingEmail {
    std::string from;
    std::string to;
    std::string subject;
    std::string body;          ///< Тело в CRLF, готовое к отправке
    MailHeaders headers;       ///< Все заголовки, DKIM-Signature первым

    /**
     * @brief Заголовки, которые Mailer должен добавить сам (всё, кроме From/To/Subject)
     */
    MailHeaders extraHeaders() const {
        MailHeaders extra;
        for (const auto& header : headers) {
            if (header.name == "From" || header.name == "To" || header.name == "Subject") {
                continue;
            }
            extra.push_back(header);
        }
        return extra;
    }

    /**
     * @brief Письмо в формате RFC 5322 (заголовки + пустая строка + тело)
     */
    std::string toRfc5322() const {
        std::string message;
        for (const auto& header : headers) {
            message += header.name + ": " + header.value + "\r\n";
        }
        message += "\r\n";
        message += body;
        return message;
    }
};

} // namespace magiclink::domain
