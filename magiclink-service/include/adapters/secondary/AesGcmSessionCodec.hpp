#pragma once

#include "ports/output/ISessionCodec.hpp"
#include "ports/output/IClock.hpp"
#include "SessionSettings.hpp"
#include <memory>
#include <optional>
#include <string>

namespace magiclink::adapters::secondary {

/**
 * @brief Зашифрованная session cookie (AES-256-GCM)
 *
 * Формат: v2.<b64url(nonce[12] || ciphertext || tag[16])>, AAD = "v2".
 * Ключ выводится из секрета через HMAC-SHA256 со своей меткой,
 * nonce случайный для каждой cookie.
 */
class AesGcmSessionCodec : public ports::output::ISessionCodec {
public:
    static constexpr const char* PREFIX = "v2.";
    static constexpr size_t NONCE_BYTES = 12;
    static constexpr size_t TAG_BYTES = 16;

    AesGcmSessionCodec(
        std::shared_ptr<SessionSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    );

    std::string mint(const std::string& identity) override;

    ports::output::SessionAuthResult authenticate(const std::string& cookieValue) override;

private:
    std::shared_ptr<SessionSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::string key_;

    std::string seal(const std::string& plaintext) const;
    std::optional<std::string> open(const std::string& sealed) const;
};

} // namespace magiclink::adapters::secondary
