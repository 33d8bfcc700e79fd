#pragma once

#include "Env.hpp"
#include <string>

namespace magiclink::adapters::secondary {

/**
 * @brief Ключ и параметры DKIM
 *
 * PEM можно передать одной строкой с "\n" вместо переводов строк.
 * Публичный ключ необязателен: нужен только для самопроверки при старте.
 */
class DkimSettings {
public:
    DkimSettings() {
        privateKeyPem_ = env::unescapeNewlines(env::getEnvOrThrow("MAGICLINK_DKIM_PRIVATE_KEY"));
        publicKeyPem_ = env::unescapeNewlines(env::getEnvOrDefault("MAGICLINK_DKIM_PUBLIC_KEY", ""));
        domain_ = env::getEnvOrThrow("MAGICLINK_DKIM_DOMAIN");
        selector_ = env::getEnvOrDefault("MAGICLINK_DKIM_SELECTOR", "default");
    }

    DkimSettings(std::string privateKeyPem,
                 std::string publicKeyPem,
                 std::string domain,
                 std::string selector)
        : privateKeyPem_(std::move(privateKeyPem))
        , publicKeyPem_(std::move(publicKeyPem))
        , domain_(std::move(domain))
        , selector_(std::move(selector))
    {}

    const std::string& getPrivateKeyPem() const { return privateKeyPem_; }
    const std::string& getPublicKeyPem() const { return publicKeyPem_; }
    bool hasPublicKey() const { return !publicKeyPem_.empty(); }
    std::string getDomain() const { return domain_; }
    std::string getSelector() const { return selector_; }

private:
    std::string privateKeyPem_;
    std::string publicKeyPem_;
    std::string domain_;
    std::string selector_;
};

} // namespace magiclink::adapters::secondary
