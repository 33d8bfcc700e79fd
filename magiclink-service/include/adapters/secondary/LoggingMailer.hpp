#pragma once

#include "ports/output/IMailer.hpp"
#include <atomic>
#include <cstdint>
#include <iostream>

namespace magiclink::adapters::secondary {

/**
 * @brief Mailer без доставки: только пишет в лог
 *
 * Тело письма в лог не попадает, в нём ссылка со входом.
 */
class LoggingMailer : public ports::output::IMailer {
public:
    LoggingMailer() : sentCount_(0) {
        std::cout << "[LoggingMailer] Created (email delivery is simulated)" << std::endl;
    }

    ports::output::TransportResult send(const std::string& from,
                                        const std::string& to,
                                        const std::string& subject,
                                        const std::string& body,
                                        const domain::MailHeaders& extraHeaders) override {
        ++sentCount_;
        std::cout << "[LoggingMailer] Email send simulated: from=" << from
                  << ", to=" << to
                  << ", subject=" << subject
                  << ", headers=" << extraHeaders.size()
                  << ", body=" << body.size() << " bytes" << std::endl;
        return {true, "simulated"};
    }

    uint64_t getSentCount() const { return sentCount_; }

private:
    std::atomic<uint64_t> sentCount_;
};

} // namespace magiclink::adapters::secondary
