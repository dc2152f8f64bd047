#pragma once

#include "ports/output/ILedgerGateway.hpp"
#include "domain/LedgerIds.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Итог инициализации мастер-счетов
 */
struct BootstrapReport {
    domain::LedgerStatus masterDebit = domain::LedgerStatus::UNAVAILABLE;
    domain::LedgerStatus masterCredit = domain::LedgerStatus::UNAVAILABLE;

    static bool isReady(domain::LedgerStatus status) {
        return status == domain::LedgerStatus::OK
            || status == domain::LedgerStatus::ALREADY_EXISTS;
    }

    bool complete() const { return isReady(masterDebit) && isReady(masterCredit); }
};

/**
 * @brief Идемпотентное создание мастер-счетов 1 и 2
 *
 * Вызывается при старте до регистрации HTTP handlers.
 * ALREADY_EXISTS считается успехом. Прочие ответы движка логируются
 * как предупреждение и не останавливают старт: если счета уже
 * существуют, инвариант выполнен.
 */
class MasterAccountBootstrap {
public:
    explicit MasterAccountBootstrap(
        std::shared_ptr<ports::output::ILedgerGateway> ledger
    ) : ledger_(std::move(ledger))
    {
        std::cout << "[MasterAccountBootstrap] Created" << std::endl;
    }

    BootstrapReport ensureMasterAccounts() {
        BootstrapReport report;
        report.masterDebit = ensure(domain::MASTER_DEBIT_ACCOUNT_ID, domain::AccountCategory::MASTER_DEBIT);
        report.masterCredit = ensure(domain::MASTER_CREDIT_ACCOUNT_ID, domain::AccountCategory::MASTER_CREDIT);

        if (report.complete()) {
            std::cout << "[MasterAccountBootstrap] Master accounts ready" << std::endl;
        } else {
            std::cerr << "[MasterAccountBootstrap] WARNING: bootstrap degraded, continuing startup" << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerGateway> ledger_;

    domain::LedgerStatus ensure(uint64_t accountId, domain::AccountCategory category) {
        auto result = ledger_->createAccount(accountId, category);

        if (BootstrapReport::isReady(result.status)) {
            std::cout << "[MasterAccountBootstrap] Account " << accountId
                      << " (" << domain::toString(category) << "): "
                      << domain::toString(result.status) << std::endl;
        } else {
            std::cerr << "[MasterAccountBootstrap] WARNING: account " << accountId
                      << " (" << domain::toString(category) << ") creation result: "
                      << domain::toString(result.status) << " " << result.message << std::endl;
        }
        return result.status;
    }
};

} // namespace bank::application
