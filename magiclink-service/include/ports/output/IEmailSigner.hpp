#pragma once

#include "domain/MailHeader.hpp"
#include <string>
#include <chrono>

namespace magiclink::ports::output {

/**
 * @brief DKIM подпись исходящих писем
 */
class IEmailSigner {
public:
    virtual ~IEmailSigner() = default;

    /**
     * @return значение заголовка DKIM-Signature
     * @throws domain::SigningError
     */
    virtual std::string sign(const domain::MailHeaders& headers,
                             const std::string& body,
                             std::chrono::system_clock::time_point timestamp) = 0;
};

} // namespace magiclink::ports::output
