#include <gtest/gtest.h>

#include "adapters/secondary/InMemoryTokenRepository.hpp"

using namespace magiclink;
using magiclink::domain::RedemptionError;

class InMemoryTokenRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<adapters::secondary::InMemoryTokenRepository>();
        now_ = std::chrono::system_clock::time_point(std::chrono::seconds(1792411200));
    }

    domain::Token makeToken(const std::string& hash, const std::string& identity,
                            std::chrono::seconds offset = std::chrono::seconds(0)) const {
        return domain::Token(hash, identity, now_ + offset, std::chrono::seconds(900));
    }

    std::shared_ptr<adapters::secondary::InMemoryTokenRepository> repo_;
    std::chrono::system_clock::time_point now_;
};

TEST_F(InMemoryTokenRepositoryTest, Token_UsableUntilExpiryOrConsumption) {
    auto token = makeToken("h1", "alice@example.com");

    EXPECT_TRUE(token.isUsableAt(now_));
    EXPECT_TRUE(token.isUsableAt(now_ + std::chrono::seconds(899)));
    EXPECT_FALSE(token.isUsableAt(now_ + std::chrono::seconds(900)));

    token.consumed = true;
    EXPECT_FALSE(token.isUsableAt(now_));
}

TEST_F(InMemoryTokenRepositoryTest, Consume_ConsumedAndExpiredReportsConsumed) {
    repo_->insert(makeToken("h1", "alice@example.com"));
    ASSERT_TRUE(repo_->consume("h1", now_).success);

    auto late = repo_->consume("h1", now_ + std::chrono::seconds(1000));
    EXPECT_FALSE(late.success);
    EXPECT_EQ(late.error, RedemptionError::ALREADY_CONSUMED);
}

TEST_F(InMemoryTokenRepositoryTest, Insert_RejectsDuplicateHash) {
    EXPECT_TRUE(repo_->insert(makeToken("h1", "alice@example.com")));
    EXPECT_FALSE(repo_->insert(makeToken("h1", "bob@example.com")));

    auto stored = repo_->findByHash("h1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->identity, "alice@example.com");
}

TEST_F(InMemoryTokenRepositoryTest, Consume_Outcomes) {
    repo_->insert(makeToken("h1", "alice@example.com"));

    EXPECT_EQ(repo_->consume("missing", now_).error, RedemptionError::NOT_FOUND);

    auto first = repo_->consume("h1", now_);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.identity, "alice@example.com");

    auto second = repo_->consume("h1", now_);
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, RedemptionError::ALREADY_CONSUMED);
}

TEST_F(InMemoryTokenRepositoryTest, Consume_ExpiredLeavesTokenUnconsumed) {
    repo_->insert(makeToken("h1", "alice@example.com"));

    auto result = repo_->consume("h1", now_ + std::chrono::seconds(900));

    EXPECT_EQ(result.error, RedemptionError::EXPIRED);
    EXPECT_FALSE(repo_->findByHash("h1")->consumed);
}

TEST_F(InMemoryTokenRepositoryTest, FindLatestByIdentity) {
    repo_->insert(makeToken("h1", "alice@example.com"));
    repo_->insert(makeToken("h2", "alice@example.com", std::chrono::seconds(10)));
    repo_->insert(makeToken("h3", "bob@example.com", std::chrono::seconds(20)));

    auto latest = repo_->findLatestByIdentity("alice@example.com");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->tokenHash, "h2");

    EXPECT_FALSE(repo_->findLatestByIdentity("carol@example.com").has_value());
}

TEST_F(InMemoryTokenRepositoryTest, DeleteInactive) {
    repo_->insert(makeToken("used", "alice@example.com"));
    repo_->insert(makeToken("old", "alice@example.com"));
    repo_->insert(makeToken("fresh", "alice@example.com", std::chrono::seconds(600)));
    repo_->consume("used", now_);

    EXPECT_EQ(repo_->deleteInactive(now_ + std::chrono::seconds(900)), 2u);
    EXPECT_EQ(repo_->size(), 1u);
    EXPECT_TRUE(repo_->findByHash("fresh").has_value());
}
