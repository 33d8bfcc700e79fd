#include "crypto/RsaKey.hpp"
#include "domain/errors/SigningError.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <vector>

namespace magiclink::crypto {

namespace {

constexpr int kMinimumRsaBits = 1024;

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::shared_ptr<EVP_PKEY> wrap(EVP_PKEY* key) {
    return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

void requireRsa(const std::shared_ptr<EVP_PKEY>& key) {
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        throw domain::SigningError("DKIM key is not an RSA key");
    }
    if (EVP_PKEY_get_bits(key.get()) < kMinimumRsaBits) {
        throw domain::SigningError("DKIM key is shorter than 1024 bits");
    }
}

BioPtr memoryBio(const std::string& data) {
    return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
}

std::string encodePublicDer(EVP_PKEY* key) {
    int length = i2d_PUBKEY(key, nullptr);
    if (length <= 0) {
        throw domain::SigningError("Cannot encode RSA public key");
    }
    std::string der(static_cast<size_t>(length), '\0');
    auto* out = reinterpret_cast<unsigned char*>(&der[0]);
    i2d_PUBKEY(key, &out);
    return der;
}

} // namespace

RsaPrivateKey::RsaPrivateKey(std::shared_ptr<EVP_PKEY> key)
    : key_(std::move(key))
{}

RsaPrivateKey RsaPrivateKey::fromPem(const std::string& pem) {
    auto bio = memoryBio(pem);
    if (!bio) {
        throw domain::SigningError("Cannot allocate BIO for DKIM key");
    }

    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        throw domain::SigningError("Malformed DKIM private key");
    }

    auto key = wrap(raw);
    requireRsa(key);
    return RsaPrivateKey(std::move(key));
}

std::string RsaPrivateKey::signSha256(const std::string& data) const {
    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1) {
        throw domain::SigningError("EVP_DigestSignInit failed");
    }

    if (EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw domain::SigningError("EVP_DigestSignUpdate failed");
    }

    size_t sigLen = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sigLen) != 1) {
        throw domain::SigningError("EVP_DigestSignFinal failed");
    }

    std::vector<unsigned char> sig(sigLen);
    if (EVP_DigestSignFinal(ctx.get(), sig.data(), &sigLen) != 1) {
        throw domain::SigningError("EVP_DigestSignFinal failed");
    }

    return std::string(reinterpret_cast<const char*>(sig.data()), sigLen);
}

std::string RsaPrivateKey::publicKeyDer() const {
    return encodePublicDer(key_.get());
}

int RsaPrivateKey::bits() const {
    return EVP_PKEY_get_bits(key_.get());
}

RsaPublicKey::RsaPublicKey(std::shared_ptr<EVP_PKEY> key)
    : key_(std::move(key))
{}

RsaPublicKey RsaPublicKey::fromPem(const std::string& pem) {
    auto bio = memoryBio(pem);
    if (!bio) {
        throw domain::SigningError("Cannot allocate BIO for DKIM public key");
    }

    EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        throw domain::SigningError("Malformed DKIM public key");
    }

    auto key = wrap(raw);
    requireRsa(key);
    return RsaPublicKey(std::move(key));
}

RsaPublicKey RsaPublicKey::fromDer(const std::string& der) {
    const auto* in = reinterpret_cast<const unsigned char*>(der.data());
    EVP_PKEY* raw = d2i_PUBKEY(nullptr, &in, static_cast<long>(der.size()));
    if (!raw) {
        throw domain::SigningError("Malformed DKIM public key");
    }

    auto key = wrap(raw);
    requireRsa(key);
    return RsaPublicKey(std::move(key));
}

bool RsaPublicKey::verifySha256(const std::string& data, const std::string& signature) const {
    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1) {
        return false;
    }

    if (EVP_DigestVerifyUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return false;
    }

    return EVP_DigestVerifyFinal(ctx.get(),
                                 reinterpret_cast<const unsigned char*>(signature.data()),
                                 signature.size()) == 1;
}

std::string RsaPublicKey::der() const {
    return encodePublicDer(key_.get());
}

} // namespace magiclink::crypto
