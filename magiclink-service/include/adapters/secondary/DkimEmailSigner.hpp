#pragma once

#include "ports/output/IEmailSigner.hpp"
#include "DkimSettings.hpp"
#include "crypto/Dkim.hpp"
#include "crypto/RsaKey.hpp"
#include <memory>
#include <iostream>

namespace magiclink::adapters::secondary {

/**
 * @brief DKIM подпись ключом из настроек
 *
 * Ключ разбирается один раз в конструкторе: битый PEM останавливает
 * сервис при старте, а не при первом письме. Так же проверяются d= и s=.
 * Если задан публичный ключ, пара проверяется пробной подписью.
 *
 * Значение заголовка возвращается уже свёрнутым по строкам.
 */
class DkimEmailSigner : public ports::output::IEmailSigner {
public:
    explicit DkimEmailSigner(std::shared_ptr<DkimSettings> settings)
        : settings_(std::move(settings))
        , privateKey_(crypto::RsaPrivateKey::fromPem(settings_->getPrivateKeyPem()))
    {
        crypto::dkim::validateSigningDomain(settings_->getDomain(), settings_->getSelector());

        std::cout << "[DkimEmailSigner] Loaded " << privateKey_.bits() << "-bit key for "
                  << settings_->getSelector() << "._domainkey." << settings_->getDomain() << std::endl;

        if (settings_->hasPublicKey()) {
            selfCheck();
        }
    }

    std::string sign(const domain::MailHeaders& headers,
                     const std::string& body,
                     std::chrono::system_clock::time_point timestamp) override {
        return crypto::dkim::foldSignature(
            crypto::dkim::sign(headers, body, privateKey_,
                               settings_->getDomain(), settings_->getSelector(), timestamp));
    }

private:
    std::shared_ptr<DkimSettings> settings_;
    crypto::RsaPrivateKey privateKey_;

    void selfCheck() const {
        auto publicKey = crypto::RsaPublicKey::fromPem(settings_->getPublicKeyPem());

        domain::MailHeaders headers = {
            {"From", "selfcheck@" + settings_->getDomain()},
            {"Subject", "DKIM self-check"},
        };
        const std::string body = "self-check\r\n";

        auto value = crypto::dkim::foldSignature(
            crypto::dkim::sign(headers, body, privateKey_,
                               settings_->getDomain(), settings_->getSelector(),
                               std::chrono::system_clock::now()));
        headers.insert(headers.begin(), {"DKIM-Signature", value});

        auto result = crypto::dkim::verify(headers, body, publicKey);
        if (!result.valid) {
            throw domain::ConfigurationError("DKIM public key does not match private key: " + result.message);
        }

        std::cout << "[DkimEmailSigner] Self-check passed. DNS TXT record:" << std::endl;
        std::cout << "  " << settings_->getSelector() << "._domainkey." << settings_->getDomain()
                  << " IN TXT \"" << crypto::dkim::dnsRecord(publicKey) << "\"" << std::endl;
    }
};

} // namespace magiclink::adapters::secondary
