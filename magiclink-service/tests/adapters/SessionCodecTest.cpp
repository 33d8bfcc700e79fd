#include <gtest/gtest.h>

#include "adapters/secondary/HmacSessionCodec.hpp"
#include "adapters/secondary/AesGcmSessionCodec.hpp"
#include "crypto/Encoding.hpp"
#include "mocks/ManualClock.hpp"
#include "fixtures/TestKeys.hpp"

#include <cctype>
#include <vector>

using namespace magiclink;
using namespace magiclink::adapters::secondary;
using namespace magiclink::tests::mocks;
using magiclink::domain::AuthError;

class SessionCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        settings_ = std::make_shared<SessionSettings>(
            tests::fixtures::sessionSecret(), std::chrono::seconds(3600));
        otherSettings_ = std::make_shared<SessionSettings>(
            std::string(32, 'z'), std::chrono::seconds(3600));

        signed_ = std::make_shared<HmacSessionCodec>(settings_, clock_);
        encrypted_ = std::make_shared<AesGcmSessionCodec>(settings_, clock_);
    }

    std::vector<std::shared_ptr<ports::output::ISessionCodec>> codecs() const {
        return {signed_, encrypted_};
    }

    // Все варианты значения с одним инвертированным битом
    static std::vector<std::string> singleBitFlips(const std::string& value) {
        std::vector<std::string> variants;
        for (size_t i = 0; i < value.size(); ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                std::string copy = value;
                copy[i] = static_cast<char>(copy[i] ^ (1 << bit));
                variants.push_back(copy);
            }
        }
        return variants;
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<SessionSettings> settings_;
    std::shared_ptr<SessionSettings> otherSettings_;
    std::shared_ptr<HmacSessionCodec> signed_;
    std::shared_ptr<AesGcmSessionCodec> encrypted_;
};

// ============================================
// ROUND TRIP
// ============================================

TEST_F(SessionCodecTest, MintAndAuthenticate) {
    for (const auto& codec : codecs()) {
        auto cookie = codec->mint("alice@example.com");
        auto result = codec->authenticate(cookie);

        EXPECT_TRUE(result.success);
        EXPECT_EQ(result.identity, "alice@example.com");
        EXPECT_EQ(result.error, AuthError::NONE);
    }
}

TEST_F(SessionCodecTest, Prefixes) {
    EXPECT_EQ(signed_->mint("alice@example.com").rfind("v1.", 0), 0u);
    EXPECT_EQ(encrypted_->mint("alice@example.com").rfind("v2.", 0), 0u);
}

TEST_F(SessionCodecTest, CookieValueIsHeaderSafe) {
    for (const auto& codec : codecs()) {
        auto cookie = codec->mint("alice@example.com");
        for (char c : cookie) {
            bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
            EXPECT_TRUE(allowed) << cookie;
        }
    }
}

// ============================================
// LIFETIME
// ============================================

TEST_F(SessionCodecTest, Lifetime_Boundary) {
    for (const auto& codec : codecs()) {
        clock_->set(std::chrono::system_clock::time_point(std::chrono::seconds(ManualClock::DEFAULT_EPOCH)));
        auto cookie = codec->mint("alice@example.com");

        clock_->advance(std::chrono::seconds(3599));
        EXPECT_TRUE(codec->authenticate(cookie).success);

        clock_->advance(std::chrono::seconds(2));
        auto expired = codec->authenticate(cookie);
        EXPECT_FALSE(expired.success);
        EXPECT_EQ(expired.error, AuthError::EXPIRED);
        EXPECT_TRUE(expired.identity.empty());
    }
}

// Выпуск в середине секунды: граница считается от точного момента выпуска
TEST_F(SessionCodecTest, Lifetime_BoundaryWithSubSecondIssue) {
    for (const auto& codec : codecs()) {
        clock_->set(std::chrono::system_clock::time_point(std::chrono::seconds(ManualClock::DEFAULT_EPOCH)) +
                    std::chrono::milliseconds(900));
        auto cookie = codec->mint("alice@example.com");

        clock_->advance(std::chrono::seconds(3600));
        auto atBoundary = codec->authenticate(cookie);
        EXPECT_TRUE(atBoundary.success);
        EXPECT_EQ(atBoundary.identity, "alice@example.com");

        clock_->advance(std::chrono::milliseconds(1));
        auto expired = codec->authenticate(cookie);
        EXPECT_FALSE(expired.success);
        EXPECT_EQ(expired.error, AuthError::EXPIRED);
    }
}

// ============================================
// TAMPERING
// ============================================

TEST_F(SessionCodecTest, SingleBitFlip_Signed) {
    auto cookie = signed_->mint("alice@example.com");

    for (const auto& variant : singleBitFlips(cookie)) {
        auto result = signed_->authenticate(variant);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, AuthError::BAD_SIGNATURE);
    }
}

TEST_F(SessionCodecTest, SingleBitFlip_Encrypted) {
    auto cookie = encrypted_->mint("alice@example.com");

    for (const auto& variant : singleBitFlips(cookie)) {
        auto result = encrypted_->authenticate(variant);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, AuthError::BAD_SIGNATURE);
    }
}

TEST_F(SessionCodecTest, TamperedCookieExpiredStillBadSignature) {
    auto cookie = signed_->mint("alice@example.com");
    cookie.back() = cookie.back() == 'A' ? 'B' : 'A';
    clock_->advance(std::chrono::hours(48));

    EXPECT_EQ(signed_->authenticate(cookie).error, AuthError::BAD_SIGNATURE);
}

TEST_F(SessionCodecTest, Garbage) {
    for (const auto& codec : codecs()) {
        for (const std::string& value : {"", "v1.", "v2.", "v1..", "v1.abc.def", "v2.abc",
                                         "session", "v1.a.b.c", "v3.AAAA"}) {
            auto result = codec->authenticate(value);
            EXPECT_FALSE(result.success) << value;
            EXPECT_EQ(result.error, AuthError::BAD_SIGNATURE) << value;
        }
    }
}

TEST_F(SessionCodecTest, CrossModeRejected) {
    EXPECT_EQ(signed_->authenticate(encrypted_->mint("alice@example.com")).error,
              AuthError::BAD_SIGNATURE);
    EXPECT_EQ(encrypted_->authenticate(signed_->mint("alice@example.com")).error,
              AuthError::BAD_SIGNATURE);
}

TEST_F(SessionCodecTest, OtherSecretRejected) {
    HmacSessionCodec otherSigned(otherSettings_, clock_);
    AesGcmSessionCodec otherEncrypted(otherSettings_, clock_);

    EXPECT_EQ(signed_->authenticate(otherSigned.mint("alice@example.com")).error,
              AuthError::BAD_SIGNATURE);
    EXPECT_EQ(encrypted_->authenticate(otherEncrypted.mint("alice@example.com")).error,
              AuthError::BAD_SIGNATURE);
}

// Подделка claims с пересчётом MAC чужим ключом не проходит
TEST_F(SessionCodecTest, ForgedClaimsRejected) {
    std::string payload = crypto::base64UrlEncode(
        R"({"sub":"mallory@example.com","iat":1792411200000000000,"exp":1792414800000000000})");
    std::string signedPart = "v1." + payload;
    std::string forged = signedPart + "." +
        crypto::base64UrlEncode(crypto::hmacSha256("guessed-key", signedPart));

    EXPECT_EQ(signed_->authenticate(forged).error, AuthError::BAD_SIGNATURE);
}

// ============================================
// CONFIDENTIALITY
// ============================================

TEST_F(SessionCodecTest, SignedPayloadIsReadable) {
    auto cookie = signed_->mint("alice@example.com");
    auto first = cookie.find('.');
    auto second = cookie.find('.', first + 1);

    auto json = crypto::base64UrlDecode(cookie.substr(first + 1, second - first - 1));
    ASSERT_TRUE(json.has_value());
    EXPECT_NE(json->find("\"sub\":\"alice@example.com\""), std::string::npos);
}

TEST_F(SessionCodecTest, EncryptedPayloadIsOpaque) {
    auto cookie = encrypted_->mint("alice@example.com");

    auto sealed = crypto::base64UrlDecode(cookie.substr(3));
    ASSERT_TRUE(sealed.has_value());
    EXPECT_GT(sealed->size(), AesGcmSessionCodec::NONCE_BYTES + AesGcmSessionCodec::TAG_BYTES);
    EXPECT_EQ(sealed->find("alice"), std::string::npos);
    EXPECT_EQ(cookie.find("alice"), std::string::npos);
}

TEST_F(SessionCodecTest, EncryptedCookiesDiffer) {
    EXPECT_NE(encrypted_->mint("alice@example.com"), encrypted_->mint("alice@example.com"));
}
