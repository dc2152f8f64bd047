#pragma once

#include "ports/input/IAccountProvisioner.hpp"
#include "ports/output/ILedgerGateway.hpp"
#include "ports/output/IUserRepository.hpp"
#include "domain/LedgerIds.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Провижининг счёта леджера для нового пользователя
 *
 * Двойная запись (справочник + леджер) без 2PC, с компенсацией:
 *   1. Вывести accountId из UUID пользователя
 *   2. createAccount(accountId, USER)
 *   3. Отказ движка → удалить пользователя, вернуть ошибку
 *   4. linkLedgerAccount; отказ → PROVISION_PARTIAL_FAILURE
 *
 * Шаги 3-4 не повторяются автоматически. Повторный provision()
 * для того же пользователя подхватывает уже созданный счёт
 * (ALREADY_EXISTS) и выполняет только шаг 4.
 */
class AccountProvisioner : public ports::input::IAccountProvisioner {
public:
    AccountProvisioner(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ILedgerGateway> ledger
    ) : userRepo_(std::move(userRepo))
      , ledger_(std::move(ledger))
    {
        std::cout << "[AccountProvisioner] Created" << std::endl;
    }

    ports::input::ProvisionResult provision(const domain::UserId& userId) override {
        auto userOpt = userRepo_->findById(userId);
        if (!userOpt) {
            return fail(domain::OperationError::IDENTITY_NOT_FOUND,
                        "User not found: " + domain::toString(userId));
        }

        // Связь неизменяема: уже привязанный пользователь не перепривязывается
        if (userOpt->ledgerAccountId) {
            ports::input::ProvisionResult result;
            result.success = true;
            result.accountId = *userOpt->ledgerAccountId;
            result.message = "Ledger account already linked";
            return result;
        }

        uint64_t accountId = domain::deriveAccountId(userId);

        auto created = ledger_->createAccount(accountId, domain::AccountCategory::USER);

        if (created.status == domain::LedgerStatus::ALREADY_EXISTS) {
            auto owner = userRepo_->findByLedgerAccountId(accountId);
            if (owner && owner->userId != userId) {
                std::cerr << "[AccountProvisioner] Account id collision: " << accountId
                          << " already linked to " << domain::toString(owner->userId) << std::endl;
                return compensate(userId, domain::OperationError::IDENTIFIER_COLLISION,
                                  "Derived account id " + std::to_string(accountId) +
                                  " belongs to another user");
            }
            std::cout << "[AccountProvisioner] Adopting existing ledger account " << accountId
                      << " for user " << domain::toString(userId) << std::endl;
        } else if (!created.ok()) {
            auto error = created.status == domain::LedgerStatus::UNAVAILABLE
                ? domain::OperationError::ENGINE_UNAVAILABLE
                : domain::OperationError::ACCOUNT_CREATION_FAILED;
            return compensate(userId, error,
                              "Ledger account creation failed: " + domain::toString(created.status) +
                              (created.message.empty() ? "" : " (" + created.message + ")"));
        }

        if (!userRepo_->linkLedgerAccount(userId, accountId)) {
            std::cerr << "[AccountProvisioner] PARTIAL FAILURE: ledger account " << accountId
                      << " created but not linked to user " << domain::toString(userId)
                      << ", operator follow-up required" << std::endl;

            ports::input::ProvisionResult result;
            result.success = false;
            result.accountId = accountId;
            result.error = domain::OperationError::PROVISION_PARTIAL_FAILURE;
            result.message = "Ledger account " + std::to_string(accountId) +
                             " created but user link failed";
            return result;
        }

        std::cout << "[AccountProvisioner] Provisioned account " << accountId
                  << " for user " << domain::toString(userId) << std::endl;

        ports::input::ProvisionResult result;
        result.success = true;
        result.accountId = accountId;
        result.message = "Ledger account provisioned";
        return result;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ILedgerGateway> ledger_;

    /**
     * @brief Компенсирующее удаление пользователя после отказа леджера
     */
    ports::input::ProvisionResult compensate(
        const domain::UserId& userId,
        domain::OperationError error,
        const std::string& message)
    {
        std::cerr << "[AccountProvisioner] " << message
                  << ", rolling back user " << domain::toString(userId) << std::endl;

        std::string fullMessage = message;
        if (!userRepo_->deleteById(userId)) {
            std::cerr << "[AccountProvisioner] Rollback of user " << domain::toString(userId)
                      << " failed" << std::endl;
            fullMessage += "; rollback of user record failed";
        }
        return fail(error, fullMessage);
    }

    static ports::input::ProvisionResult fail(domain::OperationError error, const std::string& message) {
        ports::input::ProvisionResult result;
        result.success = false;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace bank::application
