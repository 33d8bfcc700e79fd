#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SendLinkHandler.hpp"
#include "adapters/primary/VerifyLinkHandler.hpp"
#include "adapters/primary/SessionMiddleware.hpp"
#include "adapters/primary/GetSessionHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/AuthGuard.hpp"

#include "application/TokenLedger.hpp"
#include "application/LinkIssuer.hpp"
#include "application/LinkVerifier.hpp"
#include "adapters/secondary/InMemoryTokenRepository.hpp"
#include "adapters/secondary/AesGcmSessionCodec.hpp"
#include "adapters/secondary/DkimEmailSigner.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "mocks/ManualClock.hpp"
#include "mocks/RecordingMailer.hpp"
#include "fixtures/TestKeys.hpp"

#include "SimpleRequest.hpp"
#include "SimpleResponse.hpp"

#include <nlohmann/json.hpp>

using namespace magiclink;
using namespace magiclink::tests::mocks;
using namespace magiclink::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MockLinkIssuer : public ports::input::ILinkIssuer {
public:
    MOCK_METHOD(ports::input::IssueLinkResult, issueLink, (const std::string& identity), (override));
    MOCK_METHOD(ports::input::RequestLinkResult, requestLink, (const std::string& identity), (override));
};

class MockLinkVerifier : public ports::input::ILinkVerifier {
public:
    MOCK_METHOD(ports::input::VerifyLinkResult, verify, (const std::string& identifier), (override));
};

// ============================================
// TEST FIXTURE
// ============================================

class MagicLinkEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        linkSettings_ = std::make_shared<adapters::secondary::LinkSettings>(
            "https://app.example.com", "Magic Link <login@example.com>");
        sessionSettings_ = std::make_shared<adapters::secondary::SessionSettings>(
            tests::fixtures::sessionSecret(), std::chrono::seconds(86400));
        clock_ = std::make_shared<ManualClock>();
        repo_ = std::make_shared<adapters::secondary::InMemoryTokenRepository>();
        mailer_ = std::make_shared<RecordingMailer>();

        ledger_ = std::make_shared<application::TokenLedger>(linkSettings_, repo_, clock_);
        codec_ = std::make_shared<adapters::secondary::AesGcmSessionCodec>(sessionSettings_, clock_);
        auto signer = std::make_shared<adapters::secondary::DkimEmailSigner>(
            std::make_shared<adapters::secondary::DkimSettings>(
                tests::fixtures::privateKeyPem(), "", "example.com", "default"));

        issuer_ = std::make_shared<application::LinkIssuer>(linkSettings_, ledger_, signer, mailer_, clock_);
        executor_ = std::make_shared<utils::DeadlineExecutor>(2, 8);
        verifier_ = std::make_shared<application::LinkVerifier>(linkSettings_, ledger_, codec_, executor_);

        sendLink_ = std::make_shared<SendLinkHandler>(issuer_);
        verifyLink_ = std::make_shared<VerifyLinkHandler>(verifier_, sessionSettings_);
        session_ = std::make_shared<ChainHandler>(
            std::make_shared<SessionMiddleware>(std::make_shared<AuthGuard>(sessionSettings_, codec_)),
            std::make_shared<GetSessionHandler>());
        logout_ = std::make_shared<LogoutHandler>(sessionSettings_);
    }

    void TearDown() override {
        repo_->clear();
        mailer_->clear();
    }

    SimpleResponse postSendLink(const std::string& body) {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/api/session/send-link");
        req.setBody(body);
        SimpleResponse res;
        sendLink_->handle(req, res);
        return res;
    }

    SimpleResponse getVerify(const std::string& token) {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath("/auth/verify");
        if (!token.empty()) {
            req.setQueryParam("token", token);
        }
        SimpleResponse res;
        verifyLink_->handle(req, res);
        return res;
    }

    SimpleResponse getSession(const std::string& cookieHeader) {
        SimpleRequest req;
        req.setMethod("GET");
        req.setPath("/api/session");
        req.setHeader("Cookie", cookieHeader);
        SimpleResponse res;
        session_->handle(req, res);
        return res;
    }

    // Токен из ссылки в последнем отправленном письме
    std::string lastSentIdentifier() const {
        auto sent = mailer_->sent();
        if (sent.empty()) return "";
        const std::string marker = "?token=";
        const auto& body = sent.back().body;
        auto pos = body.find(marker);
        return pos == std::string::npos ? "" : body.substr(pos + marker.size(), 43);
    }

    // "session=<value>; Path=/..." -> "session=<value>"
    static std::string cookiePair(const std::string& setCookie) {
        return setCookie.substr(0, setCookie.find(';'));
    }

    std::shared_ptr<adapters::secondary::LinkSettings> linkSettings_;
    std::shared_ptr<adapters::secondary::SessionSettings> sessionSettings_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<adapters::secondary::InMemoryTokenRepository> repo_;
    std::shared_ptr<RecordingMailer> mailer_;
    std::shared_ptr<application::TokenLedger> ledger_;
    std::shared_ptr<adapters::secondary::AesGcmSessionCodec> codec_;
    std::shared_ptr<application::LinkIssuer> issuer_;
    std::shared_ptr<utils::DeadlineExecutor> executor_;
    std::shared_ptr<application::LinkVerifier> verifier_;

    std::shared_ptr<SendLinkHandler> sendLink_;
    std::shared_ptr<VerifyLinkHandler> verifyLink_;
    std::shared_ptr<ChainHandler> session_;
    std::shared_ptr<LogoutHandler> logout_;
};

// ============================================
// FULL FLOW
// ============================================

TEST_F(MagicLinkEndpointTest, FullFlow_SendVerifySessionLogout) {
    auto sendRes = postSendLink(R"({"email": "Alice@Example.com"})");
    ASSERT_EQ(sendRes.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(sendRes.getBody())["message"].get<std::string>(), "success");
    ASSERT_EQ(mailer_->size(), 1u);
    EXPECT_EQ(mailer_->sent().front().to, "alice@example.com");

    auto verifyRes = getVerify(lastSentIdentifier());
    ASSERT_EQ(verifyRes.getStatus(), 200);
    auto verifyJson = nlohmann::json::parse(verifyRes.getBody());
    EXPECT_EQ(verifyJson["email"].get<std::string>(), "alice@example.com");

    auto setCookie = verifyRes.getHeader("Set-Cookie");
    ASSERT_TRUE(setCookie.has_value());
    EXPECT_EQ(setCookie->rfind("session=v2.", 0), 0u);
    EXPECT_NE(setCookie->find("Max-Age=86400"), std::string::npos);
    EXPECT_NE(setCookie->find("HttpOnly"), std::string::npos);
    EXPECT_EQ(verifyRes.getHeader("Cache-Control").value_or(""), "no-store");

    auto sessionRes = getSession(cookiePair(*setCookie));
    ASSERT_EQ(sessionRes.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(sessionRes.getBody())["email"].get<std::string>(), "alice@example.com");

    SimpleRequest logoutReq;
    logoutReq.setMethod("POST");
    logoutReq.setPath("/api/session/logout");
    SimpleResponse logoutRes;
    logout_->handle(logoutReq, logoutRes);

    EXPECT_EQ(logoutRes.getStatus(), 200);
    auto cleared = logoutRes.getHeader("Set-Cookie");
    ASSERT_TRUE(cleared.has_value());
    EXPECT_NE(cleared->find("Max-Age=0"), std::string::npos);

    // Повторный переход по той же ссылке
    auto replayRes = getVerify(lastSentIdentifier());
    EXPECT_EQ(replayRes.getStatus(), 401);
    EXPECT_FALSE(replayRes.getHeader("Set-Cookie").has_value());
}

TEST_F(MagicLinkEndpointTest, Session_ExpiresAfterLifetime) {
    postSendLink(R"({"email": "alice@example.com"})");
    auto verifyRes = getVerify(lastSentIdentifier());
    auto cookie = cookiePair(verifyRes.getHeader("Set-Cookie").value_or(""));

    clock_->advance(std::chrono::seconds(86401));

    EXPECT_EQ(getSession(cookie).getStatus(), 401);
}

// ============================================
// SEND LINK HANDLER
// ============================================

TEST_F(MagicLinkEndpointTest, SendLink_InvalidBodies) {
    EXPECT_EQ(postSendLink("not json").getStatus(), 400);
    EXPECT_EQ(postSendLink(R"({})").getStatus(), 400);
    EXPECT_EQ(postSendLink(R"({"email": 42})").getStatus(), 400);
    EXPECT_EQ(postSendLink(R"(["alice@example.com"])").getStatus(), 400);

    auto res = postSendLink(R"({"email": "not-an-email"})");
    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"].get<std::string>(), "invalid email");

    EXPECT_EQ(mailer_->size(), 0u);
    EXPECT_EQ(repo_->size(), 0u);
}

TEST_F(MagicLinkEndpointTest, SendLink_RateLimited) {
    ASSERT_EQ(postSendLink(R"({"email": "alice@example.com"})").getStatus(), 200);
    clock_->advance(std::chrono::seconds(20));

    auto res = postSendLink(R"({"email": "alice@example.com"})");

    EXPECT_EQ(res.getStatus(), 429);
    EXPECT_EQ(res.getHeader("Retry-After").value_or(""), "100");
    EXPECT_EQ(mailer_->size(), 1u);
}

TEST_F(MagicLinkEndpointTest, SendLink_TransportFailure) {
    mailer_->setFailing(true);

    auto res = postSendLink(R"({"email": "alice@example.com"})");

    EXPECT_EQ(res.getStatus(), 502);
    EXPECT_EQ(repo_->size(), 1u);
}

TEST_F(MagicLinkEndpointTest, SendLink_SigningFailure) {
    auto issuer = std::make_shared<MockLinkIssuer>();
    EXPECT_CALL(*issuer, requestLink("alice@example.com"))
        .WillOnce(Return(ports::input::RequestLinkResult{
            false, domain::IssueError::SIGNING_FAILED, "Failed to sign email", 0}));

    SendLinkHandler handler(issuer);
    SimpleRequest req;
    req.setMethod("POST");
    req.setPath("/api/session/send-link");
    req.setBody(R"({"email": "alice@example.com"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

TEST_F(MagicLinkEndpointTest, SendLink_StorageFailure) {
    auto issuer = std::make_shared<MockLinkIssuer>();
    EXPECT_CALL(*issuer, requestLink(_))
        .WillOnce(Throw(std::runtime_error("connection lost")));

    SendLinkHandler handler(issuer);
    SimpleRequest req;
    req.setMethod("POST");
    req.setPath("/api/session/send-link");
    req.setBody(R"({"email": "alice@example.com"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"].get<std::string>(), "Internal server error");
}

// ============================================
// VERIFY LINK HANDLER
// ============================================

TEST_F(MagicLinkEndpointTest, Verify_MissingToken) {
    auto res = getVerify("");

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"].get<std::string>(), "token is required");
}

TEST_F(MagicLinkEndpointTest, Verify_ExpiredLink) {
    postSendLink(R"({"email": "alice@example.com"})");
    clock_->advance(std::chrono::seconds(900));

    auto res = getVerify(lastSentIdentifier());

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"].get<std::string>(), "Invalid or expired link");
}

TEST_F(MagicLinkEndpointTest, Verify_UnknownLinkSameAsExpired) {
    postSendLink(R"({"email": "alice@example.com"})");
    clock_->advance(std::chrono::seconds(900));
    auto expired = getVerify(lastSentIdentifier());

    auto unknown = getVerify(crypto::base64UrlEncode(crypto::randomBytes(32)));

    EXPECT_EQ(unknown.getStatus(), expired.getStatus());
    EXPECT_EQ(unknown.getBody(), expired.getBody());
}

TEST_F(MagicLinkEndpointTest, Verify_Timeout) {
    auto verifier = std::make_shared<MockLinkVerifier>();
    EXPECT_CALL(*verifier, verify("abc"))
        .WillOnce(Return(ports::input::VerifyLinkResult{false, "", "", domain::VerifyError::TIMEOUT}));

    VerifyLinkHandler handler(verifier, sessionSettings_);
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/auth/verify");
    req.setQueryParam("token", "abc");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
    EXPECT_FALSE(res.getHeader("Set-Cookie").has_value());
}

// ============================================
// HEALTH
// ============================================

TEST_F(MagicLinkEndpointTest, Health) {
    HealthHandler handler;
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"].get<std::string>(), "healthy");
    EXPECT_EQ(json["service"].get<std::string>(), "magiclink-service");
}
