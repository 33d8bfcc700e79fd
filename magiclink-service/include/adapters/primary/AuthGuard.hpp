#pragma once

#include <IRequest.hpp>
#include "ports/output/ISessionCodec.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include "SessionCookie.hpp"
#include <memory>

namespace magiclink::adapters::primary {

/**
 * @brief Проверка session cookie входящего запроса
 *
 * Без кэша: каждая проверка заново сверяет MAC/тег.
 */
class AuthGuard {
public:
    AuthGuard(
        std::shared_ptr<adapters::secondary::SessionSettings> settings,
        std::shared_ptr<ports::output::ISessionCodec> codec
    ) : settings_(std::move(settings))
      , codec_(std::move(codec))
    {}

    ports::output::SessionAuthResult authenticate(IRequest& req) const {
        auto header = req.getHeader("Cookie");
        if (!header) {
            return {false, "", domain::AuthError::UNAUTHENTICATED};
        }

        auto value = cookie::findCookie(*header, settings_->getCookieName());
        if (!value || value->empty()) {
            return {false, "", domain::AuthError::UNAUTHENTICATED};
        }

        return codec_->authenticate(*value);
    }

private:
    std::shared_ptr<adapters::secondary::SessionSettings> settings_;
    std::shared_ptr<ports::output::ISessionCodec> codec_;
};

} // namespace magiclink::adapters::primary
