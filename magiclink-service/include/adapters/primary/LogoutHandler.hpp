#pragma once

#include <IHttpHandler.hpp>
#include "adapters/secondary/SessionSettings.hpp"
#include "SessionCookie.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace magiclink::adapters::primary {

/**
 * @brief Выход: удалить cookie на клиенте
 *
 * POST /api/session/logout
 *
 * Сессии не хранятся на сервере, поэтому отозвать уже выданную cookie
 * нельзя (только сменой секрета).
 */
class LogoutHandler : public IHttpHandler {
public:
    explicit LogoutHandler(std::shared_ptr<adapters::secondary::SessionSettings> sessionSettings)
        : sessionSettings_(std::move(sessionSettings)) {}

    void handle(IRequest& req, IResponse& res) override {
        (void)req;
        res.setHeader("Set-Cookie", cookie::buildClearCookie(sessionSettings_->getCookieName()));

        nlohmann::json response;
        response["message"] = "success";
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<adapters::secondary::SessionSettings> sessionSettings_;
};

} // namespace magiclink::adapters::primary
