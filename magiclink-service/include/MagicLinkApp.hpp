#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/ITokenLedger.hpp"
#include "ports/input/ILinkIssuer.hpp"
#include "ports/input/ILinkVerifier.hpp"
#include "ports/output/ITokenRepository.hpp"
#include "ports/output/ISessionCodec.hpp"
#include "ports/output/IEmailSigner.hpp"
#include "ports/output/IMailer.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/TokenLedger.hpp"
#include "application/LinkIssuer.hpp"
#include "application/LinkVerifier.hpp"
#include "application/TokenSweeper.hpp"

// Secondary Adapters
#include "adapters/secondary/DbSettings.hpp"
#include "adapters/secondary/DkimSettings.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include "adapters/secondary/LinkSettings.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/InMemoryTokenRepository.hpp"
#include "adapters/secondary/PostgresTokenRepository.hpp"
#include "adapters/secondary/HmacSessionCodec.hpp"
#include "adapters/secondary/AesGcmSessionCodec.hpp"
#include "adapters/secondary/DkimEmailSigner.hpp"
#include "adapters/secondary/LoggingMailer.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SendLinkHandler.hpp"
#include "adapters/primary/VerifyLinkHandler.hpp"
#include "adapters/primary/GetSessionHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/SessionMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace magiclink {

/**
 * @brief Magic Link Service Application
 *
 * Точка входа для сервиса входа по ссылке из письма.
 * Настраивает Boost.DI контейнер, регистрирует HTTP handlers и
 * запускает фоновую очистку токенов.
 */
class MagicLinkApp : public BoostBeastApplication {
public:
    MagicLinkApp() {
        std::cout << "[MagicLinkApp] Initializing..." << std::endl;
    }

    ~MagicLinkApp() override {
        if (sweeper_) {
            sweeper_->stop();
        }
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[MagicLinkApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[MagicLinkApp] Configuring Boost.DI injection..." << std::endl;

        // ====================================================================
        // Layer 1: Settings & Infrastructure
        // ====================================================================

        auto dbSettings = std::make_shared<adapters::secondary::DbSettings>();
        auto dkimSettings = std::make_shared<adapters::secondary::DkimSettings>();
        auto sessionSettings = std::make_shared<adapters::secondary::SessionSettings>();
        auto linkSettings = std::make_shared<adapters::secondary::LinkSettings>();
        auto clock = std::make_shared<adapters::secondary::SystemClock>();
        auto verifyExecutor = std::make_shared<utils::DeadlineExecutor>(
            linkSettings->getVerifyWorkers(), linkSettings->getVerifyMaxInFlight());

        // Реализации, выбираемые по ENV
        std::shared_ptr<ports::output::ITokenRepository> tokenRepository;
        if (dbSettings->usePostgres()) {
            tokenRepository = std::make_shared<adapters::secondary::PostgresTokenRepository>(dbSettings);
        } else {
            tokenRepository = std::make_shared<adapters::secondary::InMemoryTokenRepository>();
        }

        std::shared_ptr<ports::output::ISessionCodec> sessionCodec;
        if (sessionSettings->getMode() == adapters::secondary::SessionMode::SIGNED) {
            sessionCodec = std::make_shared<adapters::secondary::HmacSessionCodec>(sessionSettings, clock);
        } else {
            sessionCodec = std::make_shared<adapters::secondary::AesGcmSessionCodec>(sessionSettings, clock);
        }

        // ====================================================================
        // Boost.DI Injector Configuration
        // ====================================================================

        auto injector = di::make_injector(

            di::bind<adapters::secondary::DbSettings>().to(dbSettings),
            di::bind<adapters::secondary::DkimSettings>().to(dkimSettings),
            di::bind<adapters::secondary::SessionSettings>().to(sessionSettings),
            di::bind<adapters::secondary::LinkSettings>().to(linkSettings),
            di::bind<utils::DeadlineExecutor>().to(verifyExecutor),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<ports::output::IClock>().to(clock),
            di::bind<ports::output::ITokenRepository>().to(tokenRepository),
            di::bind<ports::output::ISessionCodec>().to(sessionCodec),

            di::bind<ports::output::IEmailSigner>()
                .to<adapters::secondary::DkimEmailSigner>()
                .in(di::singleton),

            di::bind<ports::output::IMailer>()
                .to<adapters::secondary::LoggingMailer>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<ports::input::ITokenLedger>()
                .to<application::TokenLedger>()
                .in(di::singleton),

            di::bind<ports::input::ILinkIssuer>()
                .to<application::LinkIssuer>()
                .in(di::singleton),

            di::bind<ports::input::ILinkVerifier>()
                .to<application::LinkVerifier>()
                .in(di::singleton)
        );

        std::cout << "[MagicLinkApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Storage: " << dbSettings->getStorage() << std::endl;
        std::cout << "  ✓ Session mode: "
                  << (sessionSettings->getMode() == adapters::secondary::SessionMode::SIGNED
                          ? "signed" : "encrypted") << std::endl;

        // Ключ DKIM проверяется при старте, а не при первом письме
        injector.create<std::shared_ptr<ports::output::IEmailSigner>>();

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[MagicLinkApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::SendLinkHandler>>();
            registerEndpoint("POST", "/api/session/send-link", handler);
            std::cout << "  ✓ SendLinkHandler: POST /api/session/send-link" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::VerifyLinkHandler>>();
            registerEndpoint("GET", linkSettings->getVerifyPath(), handler);
            std::cout << "  ✓ VerifyLinkHandler: GET " << linkSettings->getVerifyPath() << std::endl;
        }

        {
            auto handler = std::make_shared<adapters::primary::ChainHandler>(
                injector.create<std::shared_ptr<adapters::primary::SessionMiddleware>>(),
                injector.create<std::shared_ptr<adapters::primary::GetSessionHandler>>()
            );
            registerEndpoint("GET", "/api/session", handler);
            std::cout << "  ✓ GetSessionHandler: GET /api/session (SessionMiddleware)" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LogoutHandler>>();
            registerEndpoint("POST", "/api/session/logout", handler);
            std::cout << "  ✓ LogoutHandler: POST /api/session/logout" << std::endl;
        }

        // ====================================================================
        // Background: очистка токенов
        // ====================================================================

        sweeper_ = std::make_unique<application::TokenSweeper>(
            injector.create<std::shared_ptr<ports::input::ITokenLedger>>(),
            linkSettings->getSweepInterval()
        );
        sweeper_->start();

        std::cout << "[MagicLinkApp] Configuration complete! 5 endpoints registered." << std::endl;
    }

private:
    std::unique_ptr<application::TokenSweeper> sweeper_;
};

} // namespace magiclink
