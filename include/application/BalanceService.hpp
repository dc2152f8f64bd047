#pragma once

#include "ports/input/IBalanceService.hpp"
#include "ports/output/ILedgerGateway.hpp"
#include "ports/output/IUserRepository.hpp"
#include "domain/LedgerAccount.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Чтение баланса пользователя
 *
 * Пользователь без счёта имеет баланс 0.
 * Сбой чтения леджера не блокирует отображение: возвращается 0
 * с degraded = true и предупреждением в логе (мутаций нет).
 */
class BalanceService : public ports::input::IBalanceService {
public:
    BalanceService(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ILedgerGateway> ledger
    ) : userRepo_(std::move(userRepo))
      , ledger_(std::move(ledger))
    {
        std::cout << "[BalanceService] Created" << std::endl;
    }

    ports::input::BalanceResult balance(const domain::UserId& userId) override {
        ports::input::BalanceResult result;

        auto userOpt = userRepo_->findById(userId);
        if (!userOpt) {
            result.error = domain::OperationError::IDENTITY_NOT_FOUND;
            result.message = "User not found: " + domain::toString(userId);
            return result;
        }

        result.success = true;

        if (!userOpt->ledgerAccountId) {
            result.message = "No ledger account";
            return result;
        }

        auto totals = ledger_->getPostedTotals(*userOpt->ledgerAccountId);
        if (!totals.ok()) {
            std::cerr << "[BalanceService] WARNING: balance read failed for account "
                      << *userOpt->ledgerAccountId << ": " << domain::toString(totals.status)
                      << ", returning 0" << std::endl;
            result.degraded = true;
            result.message = "Ledger unavailable";
            return result;
        }

        result.balance = domain::LedgerAccount::computeBalance(totals.debitsPosted, totals.creditsPosted);
        result.message = "OK";
        return result;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ILedgerGateway> ledger_;
};

} // namespace bank::application
