#pragma once

#include <openssl/types.h>

#include <memory>
#include <string>

namespace magiclink::crypto {

/**
 * @brief Приватный RSA ключ для DKIM
 *
 * Загружается один раз при старте и дальше только читается, поэтому
 * один экземпляр безопасно разделять между потоками.
 */
class RsaPrivateKey {
public:
    /**
     * @brief Загрузить ключ из PEM (PKCS#1 или PKCS#8)
     * @throws domain::SigningError если PEM битый, ключ не RSA или короче 1024 бит
     */
    static RsaPrivateKey fromPem(const std::string& pem);

    /**
     * @brief Подпись RSASSA-PKCS1-v1_5 с SHA-256
     * @throws domain::SigningError
     */
    std::string signSha256(const std::string& data) const;

    /// SubjectPublicKeyInfo в DER
    std::string publicKeyDer() const;

    int bits() const;

private:
    explicit RsaPrivateKey(std::shared_ptr<EVP_PKEY> key);

    std::shared_ptr<EVP_PKEY> key_;
};

/**
 * @brief Публичный RSA ключ (то, что публикуется в DNS)
 */
class RsaPublicKey {
public:
    /// PEM "BEGIN PUBLIC KEY"
    static RsaPublicKey fromPem(const std::string& pem);

    /// SubjectPublicKeyInfo в DER (значение p= из DNS записи после base64)
    static RsaPublicKey fromDer(const std::string& der);

    bool verifySha256(const std::string& data, const std::string& signature) const;

    std::string der() const;

private:
    explicit RsaPublicKey(std::shared_ptr<EVP_PKEY> key);

    std::shared_ptr<EVP_PKEY> key_;
};

} // namespace magiclink::crypto
