#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILinkVerifier.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include "SessionCookie.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace magiclink::adapters::primary {

/**
 * @brief Переход по ссылке из письма
 *
 * GET /auth/verify?token=<identifier>
 *
 * 200 + Set-Cookie с сессией
 * 400 нет token
 * 401 ссылка недействительна (не найдена, просрочена или уже использована)
 * 503 не уложились в дедлайн
 */
class VerifyLinkHandler : public IHttpHandler {
public:
    VerifyLinkHandler(
        std::shared_ptr<ports::input::ILinkVerifier> verifier,
        std::shared_ptr<adapters::secondary::SessionSettings> sessionSettings
    ) : verifier_(std::move(verifier))
      , sessionSettings_(std::move(sessionSettings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        auto token = req.getQueryParam("token").value_or("");
        if (token.empty()) {
            sendMessage(res, 400, "token is required");
            return;
        }

        try {
            auto result = verifier_->verify(token);

            if (result.error == domain::VerifyError::TIMEOUT) {
                sendMessage(res, 503, "Request timed out, please request a new link");
                return;
            }
            if (!result.success) {
                sendMessage(res, 401, "Invalid or expired link");
                return;
            }

            res.setHeader("Set-Cookie", cookie::buildSetCookie(
                sessionSettings_->getCookieName(),
                result.cookieValue,
                sessionSettings_->getLifetime()));
            res.setHeader("Cache-Control", "no-store");

            nlohmann::json response;
            response["message"] = "success";
            response["email"] = result.identity;
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            std::cerr << "[VerifyLinkHandler] Error: " << e.what() << std::endl;
            sendMessage(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ILinkVerifier> verifier_;
    std::shared_ptr<adapters::secondary::SessionSettings> sessionSettings_;

    void sendMessage(IResponse& res, int status, const std::string& message) {
        nlohmann::json response;
        response["message"] = message;
        res.setResult(status, "application/json", response.dump());
    }
};

} // namespace magiclink::adapters::primary
