#pragma once

#include <IHttpHandler.hpp>
#include "SessionMiddleware.hpp"
#include <nlohmann/json.hpp>

namespace magiclink::adapters::primary {

/**
 * @brief Текущая сессия
 *
 * GET /api/session (после SessionMiddleware)
 * Response: {"email": "alice@example.com"}
 */
class GetSessionHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        auto identity = req.getAttribute(SessionMiddleware::IDENTITY_ATTRIBUTE).value_or("");
        if (identity.empty()) {
            nlohmann::json error;
            error["message"] = "Unauthorized";
            res.setResult(401, "application/json", error.dump());
            return;
        }

        nlohmann::json response;
        response["email"] = identity;
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace magiclink::adapters::primary
