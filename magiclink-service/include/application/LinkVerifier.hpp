#pragma once

#include "ports/input/ILinkVerifier.hpp"
#include "ports/input/ITokenLedger.hpp"
#include "ports/output/ISessionCodec.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "utils/Deadline.hpp"
#include <memory>
#include <iostream>

namespace magiclink::application {

/**
 * @brief Погашение magic-link и выпуск session cookie
 *
 * Причина отказа (NOT_FOUND / EXPIRED / ALREADY_CONSUMED) только пишется в лог,
 * клиент всегда получает INVALID_OR_EXPIRED_LINK.
 *
 * redeem и mint выполняются под общим дедлайном в ограниченном пуле
 * DeadlineExecutor. По истечении дедлайна операция может завершиться в фоне:
 * токен тогда погашен, а cookie клиенту не выдана, и нужна новая ссылка.
 * Если пул занят зависшими операциями, ответ TIMEOUT приходит сразу.
 */
class LinkVerifier : public ports::input::ILinkVerifier {
public:
    LinkVerifier(
        std::shared_ptr<adapters::secondary::LinkSettings> settings,
        std::shared_ptr<ports::input::ITokenLedger> ledger,
        std::shared_ptr<ports::output::ISessionCodec> codec,
        std::shared_ptr<utils::DeadlineExecutor> executor
    ) : settings_(std::move(settings))
      , ledger_(std::move(ledger))
      , codec_(std::move(codec))
      , executor_(std::move(executor))
    {
        std::cout << "[LinkVerifier] Created, timeout="
                  << settings_->getOperationTimeout().count() << "ms, max in flight="
                  << executor_->capacity() << std::endl;
    }

    ports::input::VerifyLinkResult verify(const std::string& identifier) override {
        if (identifier.empty()) {
            return {false, "", "", domain::VerifyError::INVALID_OR_EXPIRED_LINK};
        }

        auto ledger = ledger_;
        auto codec = codec_;
        auto outcome = executor_->run(
            settings_->getOperationTimeout(),
            [ledger, codec, identifier]() {
                Redemption redemption;
                redemption.result = ledger->redeem(identifier);
                if (redemption.result.success) {
                    redemption.cookieValue = codec->mint(redemption.result.identity);
                }
                return redemption;
            });

        if (!outcome) {
            std::cerr << "[LinkVerifier] Redemption timed out, in flight: "
                      << executor_->inFlight() << std::endl;
            return {false, "", "", domain::VerifyError::TIMEOUT};
        }

        if (!outcome->result.success) {
            std::cout << "[LinkVerifier] Link rejected: "
                      << domain::toString(outcome->result.error) << std::endl;
            return {false, "", "", domain::VerifyError::INVALID_OR_EXPIRED_LINK};
        }

        std::cout << "[LinkVerifier] Session opened for " << outcome->result.identity << std::endl;
        return {true, outcome->result.identity, outcome->cookieValue, domain::VerifyError::NONE};
    }

private:
    struct Redemption {
        ports::input::RedeemResult result{false, "", domain::RedemptionError::NONE};
        std::string cookieValue;
    };

    std::shared_ptr<adapters::secondary::LinkSettings> settings_;
    std::shared_ptr<ports::input::ITokenLedger> ledger_;
    std::shared_ptr<ports::output::ISessionCodec> codec_;
    std::shared_ptr<utils::DeadlineExecutor> executor_;
};

} // namespace magiclink::application
