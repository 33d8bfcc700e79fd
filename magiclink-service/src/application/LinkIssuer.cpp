#include "application/LinkIssuer.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Encoding.hpp"

#include <ctime>
#include <cstdio>

namespace magiclink::application {

namespace {

std::string escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string domainOf(const std::string& address) {
    auto at = address.rfind('@');
    return at == std::string::npos ? "localhost" : address.substr(at + 1);
}

} // namespace

ports::input::IssueLinkResult LinkIssuer::issueLink(const std::string& identity) {
    auto email = utils::normalizeEmail(identity);
    if (!email) {
        return {false, {}, domain::IssueError::INVALID_IDENTITY, "Invalid email", 0};
    }

    auto now = clock_->now();

    auto cooldown = settings_->getIssueCooldown();
    if (cooldown.count() > 0) {
        auto latest = ledger_->latestIssuedAt(*email);
        if (latest && now - *latest < cooldown) {
            auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
                cooldown - (now - *latest));
            int retryAfter = static_cast<int>(remaining.count());
            if (retryAfter < 1) retryAfter = 1;
            return {false, {}, domain::IssueError::RATE_LIMITED,
                    "Wait before requesting a new link", retryAfter};
        }
    }

    auto issued = ledger_->issue(*email);
    std::string link = settings_->buildLink(issued.identifier);

    std::string boundary = "=_ml_" + crypto::hexEncode(crypto::randomBytes(12));

    domain::OutgoingEmail message;
    message.from = settings_->getMailFrom();
    message.to = *email;
    message.subject = settings_->getMailSubject();
    message.body =
        "--" + boundary + "\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "Content-Transfer-Encoding: 8bit\r\n"
        "\r\n" +
        renderText(link) +
        "\r\n--" + boundary + "\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Transfer-Encoding: 8bit\r\n"
        "\r\n" +
        renderHtml(link) +
        "\r\n--" + boundary + "--\r\n";

    message.headers = {
        {"From", message.from},
        {"To", message.to},
        {"Subject", message.subject},
        {"Date", formatDate(now)},
        {"Message-ID", messageId()},
        {"MIME-Version", "1.0"},
        {"Content-Type", "multipart/alternative; boundary=\"" + boundary + "\""},
    };

    try {
        auto signature = signer_->sign(message.headers, message.body, now);
        message.headers.insert(message.headers.begin(), {"DKIM-Signature", signature});
    } catch (const domain::SigningError& e) {
        std::cerr << "[LinkIssuer] DKIM signing failed: " << e.what() << std::endl;
        return {false, {}, domain::IssueError::SIGNING_FAILED, "Failed to sign email", 0};
    }

    return {true, std::move(message), domain::IssueError::NONE, "success", 0};
}

std::string LinkIssuer::formatDate(std::chrono::system_clock::time_point tp) {
    static const char* const days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d +0000",
                  days[utc.tm_wday], utc.tm_mday, months[utc.tm_mon], utc.tm_year + 1900,
                  utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buffer;
}

std::string LinkIssuer::renderText(const std::string& link) const {
    auto minutes = settings_->getTokenTtl().count() / 60;
    return "Open this link to sign in:\r\n" +
           link + "\r\n"
           "\r\n"
           "The link can be used once and expires in " + std::to_string(minutes) + " minutes.\r\n"
           "If you did not request it, you can ignore this email.\r\n";
}

std::string LinkIssuer::renderHtml(const std::string& link) const {
    auto minutes = settings_->getTokenTtl().count() / 60;
    std::string href = escapeHtml(link);
    return "<!DOCTYPE html>\r\n"
           "<html><body>\r\n"
           "<p>Open this link to sign in:</p>\r\n"
           "<p><a href=\"" + href + "\">" + href + "</a></p>\r\n"
           "<p>The link can be used once and expires in " + std::to_string(minutes) + " minutes.</p>\r\n"
           "<p>If you did not request it, you can ignore this email.</p>\r\n"
           "</body></html>\r\n";
}

std::string LinkIssuer::messageId() const {
    return "<" + crypto::hexEncode(crypto::randomBytes(16)) + "@" +
           domainOf(settings_->getMailFromAddress()) + ">";
}

} // namespace magiclink::application
