#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/LedgerSettings.hpp"
#include "settings/DirectorySettings.hpp"

// Ports
#include "ports/input/IAccountProvisioner.hpp"
#include "ports/input/IMoneyMovementService.hpp"
#include "ports/input/IBalanceService.hpp"
#include "ports/input/IRegistrationService.hpp"
#include "ports/output/ILedgerGateway.hpp"
#include "ports/output/IUserRepository.hpp"

// Application
#include "application/AccountProvisioner.hpp"
#include "application/MoneyMovementService.hpp"
#include "application/BalanceService.hpp"
#include "application/RegistrationService.hpp"
#include "application/MasterAccountBootstrap.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "adapters/secondary/PostgresLedgerGateway.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include "adapters/secondary/InMemoryLedgerGateway.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/RegisterUserHandler.hpp"
#include "adapters/primary/ProvisionAccountHandler.hpp"
#include "adapters/primary/BalanceHandler.hpp"
#include "adapters/primary/MoneyMovementHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace bank {

/**
 * @brief Bank Service Application
 *
 * Справочник пользователей и движок леджера выбираются через ENV
 * (DIRECTORY_BACKEND, LEDGER_BACKEND). Мастер-счета создаются до
 * регистрации HTTP handlers.
 */
class BankApp : public BoostBeastApplication {
public:
    BankApp() { std::cout << "[BankApp] Initializing..." << std::endl; }
    ~BankApp() override { std::cout << "[BankApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[BankApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[BankApp] Configuring DI..." << std::endl;

        // Шаг 1: backends по настройкам
        auto ledger = createLedgerGateway();
        auto userRepo = createUserRepository();

        // Шаг 2: основной injector с instance binding для backends
        auto injector = di::make_injector(
            di::bind<ports::output::ILedgerGateway>().to(ledger),
            di::bind<ports::output::IUserRepository>().to(userRepo),

            di::bind<ports::input::IAccountProvisioner>().to<application::AccountProvisioner>().in(di::singleton),
            di::bind<ports::input::IMoneyMovementService>().to<application::MoneyMovementService>().in(di::singleton),
            di::bind<ports::input::IBalanceService>().to<application::BalanceService>().in(di::singleton),
            di::bind<ports::input::IRegistrationService>().to<application::RegistrationService>().in(di::singleton)
        );

        // Шаг 3: мастер-счета до приёма запросов
        auto bootstrap = injector.create<std::shared_ptr<application::MasterAccountBootstrap>>();
        bootstrap->ensureMasterAccounts();

        // Шаг 4: HTTP Handlers
        handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

        handlers_[getHandlerKey("POST", "/api/v1/users")] =
            injector.create<std::shared_ptr<adapters::primary::RegisterUserHandler>>();

        handlers_[getHandlerKey("POST", "/api/v1/accounts/*")] =
            injector.create<std::shared_ptr<adapters::primary::ProvisionAccountHandler>>();

        handlers_[getHandlerKey("GET", "/api/v1/balance/*")] =
            injector.create<std::shared_ptr<adapters::primary::BalanceHandler>>();

        auto movementHandler = injector.create<std::shared_ptr<adapters::primary::MoneyMovementHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/deposits")] = movementHandler;
        handlers_[getHandlerKey("POST", "/api/v1/withdrawals")] = movementHandler;
        handlers_[getHandlerKey("POST", "/api/v1/transfers")] = movementHandler;

        std::cout << "[BankApp] Ready" << std::endl;
    }

private:
    std::shared_ptr<ports::output::ILedgerGateway> createLedgerGateway() {
        auto ledgerSettings = std::make_shared<settings::LedgerSettings>();
        std::cout << "[BankApp] Ledger backend: " << settings::toString(ledgerSettings->getBackend()) << std::endl;

        if (ledgerSettings->getBackend() == settings::StorageBackend::MEMORY) {
            return std::make_shared<adapters::secondary::InMemoryLedgerGateway>();
        }

        auto ledgerInjector = di::make_injector(
            di::bind<settings::LedgerSettings>().to(ledgerSettings));
        return ledgerInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerGateway>>();
    }

    std::shared_ptr<ports::output::IUserRepository> createUserRepository() {
        auto directorySettings = std::make_shared<settings::DirectorySettings>();
        std::cout << "[BankApp] Directory backend: " << settings::toString(directorySettings->getBackend()) << std::endl;

        if (directorySettings->getBackend() == settings::StorageBackend::MEMORY) {
            return std::make_shared<adapters::secondary::InMemoryUserRepository>();
        }

        auto directoryInjector = di::make_injector(
            di::bind<settings::DirectorySettings>().to(directorySettings));
        return directoryInjector.create<std::shared_ptr<adapters::secondary::PostgresUserRepository>>();
    }
};

} // namespace bank
