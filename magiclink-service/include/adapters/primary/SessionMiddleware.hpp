#pragma once

#include <IHttpHandler.hpp>
#include "AuthGuard.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace magiclink::adapters::primary {

/**
 * @brief Middleware: кладёт email сессии в attribute "identity"
 *
 * Любая ошибка аутентификации отдаётся клиенту одинаково: 401 Unauthorized.
 */
class SessionMiddleware : public IHttpHandler {
public:
    static constexpr const char* IDENTITY_ATTRIBUTE = "identity";

    explicit SessionMiddleware(std::shared_ptr<AuthGuard> guard)
        : guard_(std::move(guard))
    {
        std::cout << "[SessionMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        auto result = guard_->authenticate(req);
        if (!result.success) {
            if (result.error != domain::AuthError::UNAUTHENTICATED) {
                std::cout << "[SessionMiddleware] Session rejected: "
                          << domain::toString(result.error) << std::endl;
            }
            nlohmann::json error;
            error["message"] = "Unauthorized";
            res.setResult(401, "application/json", error.dump());
            return;
        }

        req.setAttribute(IDENTITY_ATTRIBUTE, result.identity);
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<AuthGuard> guard_;
};

} // namespace magiclink::adapters::primary
