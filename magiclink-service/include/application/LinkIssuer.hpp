#pragma once

#include "ports/input/ILinkIssuer.hpp"
#include "ports/input/ITokenLedger.hpp"
#include "ports/output/IEmailSigner.hpp"
#include "ports/output/IMailer.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "domain/errors/SigningError.hpp"
#include "utils/EmailAddress.hpp"
#include <memory>
#include <iostream>

namespace magiclink::application {

/**
 * @brief Выпуск magic-link писем
 *
 * Порядок: нормализация email -> cooldown -> токен в ledger -> письмо
 * (multipart/alternative) -> DKIM подпись -> (requestLink) транспорт.
 */
class LinkIssuer : public ports::input::ILinkIssuer {
public:
    LinkIssuer(
        std::shared_ptr<adapters::secondary::LinkSettings> settings,
        std::shared_ptr<ports::input::ITokenLedger> ledger,
        std::shared_ptr<ports::output::IEmailSigner> signer,
        std::shared_ptr<ports::output::IMailer> mailer,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , ledger_(std::move(ledger))
      , signer_(std::move(signer))
      , mailer_(std::move(mailer))
      , clock_(std::move(clock))
    {
        std::cout << "[LinkIssuer] Created" << std::endl;
    }

    ports::input::IssueLinkResult issueLink(const std::string& identity) override;

    ports::input::RequestLinkResult requestLink(const std::string& identity) override {
        auto issued = issueLink(identity);
        if (!issued.success) {
            return {false, issued.error, issued.message, issued.retryAfterSeconds};
        }

        const auto& email = issued.email;
        auto transport = mailer_->send(email.from, email.to, email.subject, email.body,
                                       email.extraHeaders());
        if (!transport.success) {
            std::cerr << "[LinkIssuer] Transport failed for " << email.to
                      << ": " << transport.message << std::endl;
            return {false, domain::IssueError::TRANSPORT_FAILED, "Failed to send email", 0};
        }

        std::cout << "[LinkIssuer] Link sent to " << email.to << std::endl;
        return {true, domain::IssueError::NONE, "success", 0};
    }

    /// RFC 5322 date-time в UTC, например "Mon, 19 Oct 2026 12:00:00 +0000"
    static std::string formatDate(std::chrono::system_clock::time_point tp);

private:
    std::shared_ptr<adapters::secondary::LinkSettings> settings_;
    std::shared_ptr<ports::input::ITokenLedger> ledger_;
    std::shared_ptr<ports::output::IEmailSigner> signer_;
    std::shared_ptr<ports::output::IMailer> mailer_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::string renderText(const std::string& link) const;
    std::string renderHtml(const std::string& link) const;
    std::string messageId() const;
};

} // namespace magiclink::application
