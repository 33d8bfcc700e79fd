#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace magiclink::adapters::primary {

/**
 * @brief Последовательность handlers для одного endpoint
 *
 * Middleware оставляет статус 0, чтобы цепочка продолжилась.
 * Первый ненулевой статус завершает цепочку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0)
                return;
        }

        // Последний handler обязан выставить статус
        std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
        nlohmann::json error;
        error["message"] = "Internal server error";
        res.setResult(500, "application/json", error.dump());
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace magiclink::adapters::primary
