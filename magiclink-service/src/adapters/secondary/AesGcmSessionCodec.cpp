#include "adapters/secondary/AesGcmSessionCodec.hpp"
#include "adapters/secondary/SessionClaimsJson.hpp"
#include "crypto/Digest.hpp"
#include "crypto/Encoding.hpp"

#include <openssl/evp.h>

#include <iostream>
#include <stdexcept>

namespace magiclink::adapters::secondary {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const std::string kAad = "v2";

CipherCtxPtr newContext() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Cannot allocate cipher context");
    }
    return ctx;
}

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

AesGcmSessionCodec::AesGcmSessionCodec(
    std::shared_ptr<SessionSettings> settings,
    std::shared_ptr<ports::output::IClock> clock
) : settings_(std::move(settings))
  , clock_(std::move(clock))
  , key_(crypto::hmacSha256(settings_->getSecret(), "magiclink/session/enc/v2"))
{
    std::cout << "[AesGcmSessionCodec] Created, lifetime="
              << settings_->getLifetime().count() << "s" << std::endl;
}

std::string AesGcmSessionCodec::mint(const std::string& identity) {
    auto sessionClaims = claims::issue(identity, clock_->now(), settings_->getLifetime());
    return PREFIX + crypto::base64UrlEncode(seal(claims::toJson(sessionClaims)));
}

ports::output::SessionAuthResult AesGcmSessionCodec::authenticate(const std::string& cookieValue) {
    const ports::output::SessionAuthResult bad{false, "", domain::AuthError::BAD_SIGNATURE};

    const std::string prefix = PREFIX;
    if (cookieValue.compare(0, prefix.size(), prefix) != 0) {
        return bad;
    }

    auto sealed = crypto::base64UrlDecode(cookieValue.substr(prefix.size()));
    if (!sealed) {
        return bad;
    }

    auto plaintext = open(*sealed);
    if (!plaintext) {
        return bad;
    }

    auto sessionClaims = claims::fromJson(*plaintext);
    if (!sessionClaims) {
        return bad;
    }

    auto error = claims::checkLifetime(*sessionClaims, clock_->now(), settings_->getLifetime());
    if (error != domain::AuthError::NONE) {
        return {false, "", error};
    }
    return {true, sessionClaims->subject, domain::AuthError::NONE};
}

std::string AesGcmSessionCodec::seal(const std::string& plaintext) const {
    std::string nonce = crypto::randomBytes(NONCE_BYTES);
    auto ctx = newContext();

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_BYTES), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }

    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, bytes(kAad), static_cast<int>(kAad.size())) != 1) {
        throw std::runtime_error("AES-GCM AAD failed");
    }

    std::string ciphertext(plaintext.size(), '\0');
    auto* out = reinterpret_cast<unsigned char*>(&ciphertext[0]);
    if (EVP_EncryptUpdate(ctx.get(), out, &len, bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("AES-GCM encrypt failed");
    }
    int total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), out + total, &len) != 1) {
        throw std::runtime_error("AES-GCM final failed");
    }
    total += len;
    ciphertext.resize(static_cast<size_t>(total));

    std::string tag(TAG_BYTES, '\0');
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_BYTES), &tag[0]) != 1) {
        throw std::runtime_error("AES-GCM tag failed");
    }

    return nonce + ciphertext + tag;
}

std::optional<std::string> AesGcmSessionCodec::open(const std::string& sealed) const {
    if (sealed.size() < NONCE_BYTES + TAG_BYTES) {
        return std::nullopt;
    }

    std::string nonce = sealed.substr(0, NONCE_BYTES);
    std::string ciphertext = sealed.substr(NONCE_BYTES, sealed.size() - NONCE_BYTES - TAG_BYTES);
    std::string tag = sealed.substr(sealed.size() - TAG_BYTES);

    auto ctx = newContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_BYTES), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        throw std::runtime_error("AES-GCM init failed");
    }

    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytes(kAad), static_cast<int>(kAad.size())) != 1) {
        return std::nullopt;
    }

    std::string plaintext(ciphertext.size(), '\0');
    auto* out = reinterpret_cast<unsigned char*>(&plaintext[0]);
    if (EVP_DecryptUpdate(ctx.get(), out, &len, bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        return std::nullopt;
    }
    int total = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_BYTES), &tag[0]) != 1) {
        return std::nullopt;
    }
    // Проверка тега
    if (EVP_DecryptFinal_ex(ctx.get(), out + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

} // namespace magiclink::adapters::secondary
