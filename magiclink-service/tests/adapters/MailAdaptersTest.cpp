#include <gtest/gtest.h>

#include "adapters/secondary/DkimEmailSigner.hpp"
#include "adapters/secondary/LoggingMailer.hpp"
#include "domain/OutgoingEmail.hpp"
#include "domain/errors/SigningError.hpp"
#include "crypto/Dkim.hpp"
#include "fixtures/TestKeys.hpp"

#include <sstream>

using namespace magiclink;
using namespace magiclink::adapters::secondary;

namespace {

std::shared_ptr<DkimSettings> dkimSettings(const std::string& publicKeyPem) {
    return std::make_shared<DkimSettings>(
        tests::fixtures::privateKeyPem(), publicKeyPem, "example.com", "mail");
}

} // namespace

// ============================================
// DKIM EMAIL SIGNER
// ============================================

TEST(DkimEmailSignerTest, SelfCheckPasses) {
    EXPECT_NO_THROW(DkimEmailSigner{dkimSettings(tests::fixtures::publicKeyPem())});
}

TEST(DkimEmailSignerTest, SelfCheckSkippedWithoutPublicKey) {
    EXPECT_NO_THROW(DkimEmailSigner{dkimSettings("")});
}

TEST(DkimEmailSignerTest, InvalidPrivateKeyFailsAtStartup) {
    auto settings = std::make_shared<DkimSettings>("not a pem", "", "example.com", "mail");
    EXPECT_THROW(DkimEmailSigner{settings}, domain::SigningError);

    auto ecSettings = std::make_shared<DkimSettings>(
        tests::fixtures::ecPrivateKeyPem(), "", "example.com", "mail");
    EXPECT_THROW(DkimEmailSigner{ecSettings}, domain::SigningError);
}

TEST(DkimEmailSignerTest, SignUsesConfiguredDomainAndSelector) {
    DkimEmailSigner signer(dkimSettings(""));
    domain::MailHeaders headers = {{"From", "login@example.com"}, {"Subject", "Hi"}};

    auto value = signer.sign(headers, "Hello\r\n",
                             std::chrono::system_clock::time_point(std::chrono::seconds(1792411200)));

    EXPECT_NE(value.find("d=example.com"), std::string::npos);
    EXPECT_NE(value.find("s=mail"), std::string::npos);
    EXPECT_NE(value.find("t=1792411200"), std::string::npos);
}

TEST(DkimEmailSignerTest, InvalidDomainOrSelectorFailsAtStartup) {
    auto badDomain = std::make_shared<DkimSettings>(
        tests::fixtures::privateKeyPem(), "", "example.com; x=1", "mail");
    EXPECT_THROW(DkimEmailSigner{badDomain}, domain::SigningError);

    auto emptySelector = std::make_shared<DkimSettings>(
        tests::fixtures::privateKeyPem(), "", "example.com", "");
    EXPECT_THROW(DkimEmailSigner{emptySelector}, domain::SigningError);
}

TEST(DkimEmailSignerTest, SignatureIsFoldedIntoShortLines) {
    DkimEmailSigner signer(dkimSettings(""));
    domain::MailHeaders headers = {{"From", "login@example.com"}, {"Subject", "Hi"}};
    const std::string body = "Hello\r\n";

    auto value = signer.sign(headers, body,
                             std::chrono::system_clock::time_point(std::chrono::seconds(1792411200)));

    ASSERT_NE(value.find("\r\n "), std::string::npos);

    // "DKIM-Signature: " + первая строка тоже укладывается в 78 символов
    std::istringstream lines(value);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        size_t length = line.size() + (first ? std::string("DKIM-Signature: ").size() : 0);
        EXPECT_LE(length, 78u) << line;
        first = false;
    }

    headers.insert(headers.begin(), {"DKIM-Signature", value});
    auto result = crypto::dkim::verify(
        headers, body, crypto::RsaPublicKey::fromPem(tests::fixtures::publicKeyPem()));
    EXPECT_TRUE(result.valid) << result.message;
}

// ============================================
// LOGGING MAILER / OUTGOING EMAIL
// ============================================

TEST(LoggingMailerTest, SendAlwaysSucceeds) {
    LoggingMailer mailer;

    auto result = mailer.send("login@example.com", "alice@example.com", "Hi", "body", {});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(mailer.getSentCount(), 1u);
}

TEST(OutgoingEmailTest, ToRfc5322) {
    domain::OutgoingEmail email;
    email.body = "Hello\r\n";
    email.headers = {{"DKIM-Signature", "v=1"}, {"From", "a@example.com"}, {"To", "b@example.com"}};

    EXPECT_EQ(email.toRfc5322(),
              "DKIM-Signature: v=1\r\nFrom: a@example.com\r\nTo: b@example.com\r\n\r\nHello\r\n");

    auto extra = email.extraHeaders();
    ASSERT_EQ(extra.size(), 1u);
    EXPECT_EQ(extra.front().name, "DKIM-Signature");
}
