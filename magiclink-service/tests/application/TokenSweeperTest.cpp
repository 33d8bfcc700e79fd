#include <gtest/gtest.h>

#include "application/TokenSweeper.hpp"
#include "application/TokenLedger.hpp"
#include "adapters/secondary/InMemoryTokenRepository.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "mocks/ManualClock.hpp"

#include <thread>

using namespace magiclink;
using namespace magiclink::tests::mocks;

class TokenSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<adapters::secondary::LinkSettings>(
            "https://app.example.com", "login@example.com", std::chrono::seconds(900));
        repo_ = std::make_shared<adapters::secondary::InMemoryTokenRepository>();
        clock_ = std::make_shared<ManualClock>();
        ledger_ = std::make_shared<application::TokenLedger>(settings_, repo_, clock_);
    }

    std::shared_ptr<adapters::secondary::LinkSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryTokenRepository> repo_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<application::TokenLedger> ledger_;
};

TEST_F(TokenSweeperTest, ManualSweep_PurgesInactive) {
    application::TokenSweeper sweeper(ledger_, std::chrono::seconds(0));

    auto used = ledger_->issue("alice@example.com");
    ledger_->redeem(used.identifier);
    ledger_->issue("bob@example.com");

    EXPECT_EQ(sweeper.manualSweep(), 1u);
    EXPECT_EQ(repo_->size(), 1u);

    clock_->advance(std::chrono::seconds(900));
    EXPECT_EQ(sweeper.manualSweep(), 1u);
    EXPECT_EQ(repo_->size(), 0u);

    EXPECT_EQ(sweeper.getSweepCount(), 2u);
    EXPECT_EQ(sweeper.getPurgedTotal(), 2u);
}

TEST_F(TokenSweeperTest, ZeroInterval_DoesNotStart) {
    application::TokenSweeper sweeper(ledger_, std::chrono::seconds(0));

    sweeper.start();

    EXPECT_FALSE(sweeper.isRunning());
    sweeper.stop();
}

TEST_F(TokenSweeperTest, Background_SweepsOnInterval) {
    auto used = ledger_->issue("alice@example.com");
    ledger_->redeem(used.identifier);

    application::TokenSweeper sweeper(ledger_, std::chrono::seconds(1));
    sweeper.start();
    EXPECT_TRUE(sweeper.isRunning());

    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    EXPECT_GE(sweeper.getSweepCount(), 1u);
    EXPECT_EQ(repo_->size(), 0u);

    sweeper.stop();
    EXPECT_FALSE(sweeper.isRunning());
}

TEST_F(TokenSweeperTest, Stop_ReturnsPromptly) {
    application::TokenSweeper sweeper(ledger_, std::chrono::seconds(3600));
    sweeper.start();

    auto started = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_EQ(sweeper.getSweepCount(), 0u);
}
