#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILinkIssuer.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace magiclink::adapters::primary {

/**
 * @brief Запрос magic-link на email
 *
 * POST /api/session/send-link
 * {
 *   "email": "alice@example.com"
 * }
 *
 * 200 {"message": "success"}
 * 400 невалидный JSON или email
 * 429 ссылка уже запрошена недавно (Retry-After)
 * 500 не удалось подписать письмо
 * 502 транспорт не принял письмо
 */
class SendLinkHandler : public IHttpHandler {
public:
    explicit SendLinkHandler(std::shared_ptr<ports::input::ILinkIssuer> linkIssuer)
        : linkIssuer_(std::move(linkIssuer)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string email;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object() || !body.contains("email") || !body["email"].is_string()) {
                sendMessage(res, 400, "invalid email");
                return;
            }
            email = body["email"].get<std::string>();
        } catch (const nlohmann::json::exception& e) {
            sendMessage(res, 400, "Invalid JSON");
            return;
        }

        try {
            auto result = linkIssuer_->requestLink(email);

            switch (result.error) {
                case domain::IssueError::NONE:
                    sendMessage(res, 200, "success");
                    return;
                case domain::IssueError::INVALID_IDENTITY:
                    sendMessage(res, 400, "invalid email");
                    return;
                case domain::IssueError::RATE_LIMITED:
                    res.setHeader("Retry-After", std::to_string(result.retryAfterSeconds));
                    sendMessage(res, 429, "Wait before requesting a new link.");
                    return;
                case domain::IssueError::SIGNING_FAILED:
                    sendMessage(res, 500, "Failed to prepare email");
                    return;
                case domain::IssueError::TRANSPORT_FAILED:
                    sendMessage(res, 502, "Failed to send email");
                    return;
            }
            sendMessage(res, 500, "Internal server error");

        } catch (const std::exception& e) {
            std::cerr << "[SendLinkHandler] Error: " << e.what() << std::endl;
            sendMessage(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ILinkIssuer> linkIssuer_;

    void sendMessage(IResponse& res, int status, const std::string& message) {
        nlohmann::json response;
        response["message"] = message;
        res.setResult(status, "application/json", response.dump());
    }
};

} // namespace magiclink::adapters::primary
