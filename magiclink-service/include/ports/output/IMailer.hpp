#pragma once

#include "domain/MailHeader.hpp"
#include <string>

namespace magiclink::ports::output {

/**
 * @brief Результат передачи письма транспорту
 */
struct TransportResult {
    bool success;
    std::string message;
};

/**
 * @brief Доставка письма (SMTP или заглушка)
 *
 * Письмо уже подписано: транспорт не должен менять подписанные заголовки и тело.
 */
class IMailer {
public:
    virtual ~IMailer() = default;

    virtual TransportResult send(const std::string& from,
                                 const std::string& to,
                                 const std::string& subject,
                                 const std::string& body,
                                 const domain::MailHeaders& extraHeaders) = 0;
};

} // namespace magiclink::ports::output
