#pragma once

#include "ports/input/IMoneyMovementService.hpp"
#include "ports/output/ILedgerGateway.hpp"
#include "ports/output/IUserRepository.hpp"
#include "domain/LedgerAccount.hpp"
#include "domain/LedgerIds.hpp"
#include "domain/Transfer.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Депозиты, выводы и переводы поверх движка леджера
 *
 * Каждая операция отправляет в движок один перевод:
 * - deposit:  дебет MASTER_CREDIT(2) → кредит пользователя
 * - withdraw: дебет пользователя → кредит MASTER_DEBIT(1)
 * - transfer: дебет отправителя → кредит получателя
 *
 * Перед списанием баланс проверяется по getPostedTotals. Неотрицательный
 * баланс при конкурентных списаниях гарантирует движок (флаг
 * DEBITS_MUST_NOT_EXCEED_CREDITS на счетах пользователей).
 *
 * Идемпотентность обеспечивается только уникальностью ID перевода в движке.
 * Сервис не ведёт журнал операций. Если ID передал вызывающий, перевод
 * сначала ищется в движке: повтор после таймаута подтверждается до
 * проверки баланса.
 */
class MoneyMovementService : public ports::input::IMoneyMovementService {
public:
    MoneyMovementService(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::output::ILedgerGateway> ledger
    ) : userRepo_(std::move(userRepo))
      , ledger_(std::move(ledger))
    {
        std::cout << "[MoneyMovementService] Created" << std::endl;
    }

    ports::input::MovementResult deposit(
        const domain::UserId& userId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt) override
    {
        if (amount <= 0) {
            return fail(domain::OperationError::INVALID_AMOUNT, "Amount must be positive");
        }

        uint64_t accountId = 0;
        if (auto error = resolveAccount(userId, accountId)) {
            return *error;
        }

        domain::Transfer transfer(
            transferId ? *transferId : domain::newTransferId(),
            domain::MASTER_CREDIT_ACCOUNT_ID,
            accountId,
            static_cast<uint64_t>(amount));

        if (transferId) {
            if (auto prior = findPriorSubmission(transfer)) {
                return *prior;
            }
        }

        auto result = submit(transfer, transferId.has_value());
        if (result.success) {
            std::cout << "[MoneyMovementService] Deposited " << amount
                      << " to account " << accountId << " (transfer " << transfer.id << ")" << std::endl;
        }
        return result;
    }

    ports::input::MovementResult withdraw(
        const domain::UserId& userId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt) override
    {
        if (amount <= 0) {
            return fail(domain::OperationError::INVALID_AMOUNT, "Amount must be positive");
        }

        uint64_t accountId = 0;
        if (auto error = resolveAccount(userId, accountId)) {
            return *error;
        }

        domain::Transfer transfer(
            transferId ? *transferId : domain::newTransferId(),
            accountId,
            domain::MASTER_DEBIT_ACCOUNT_ID,
            static_cast<uint64_t>(amount));

        // Повтор уже принятого вывода не должен упираться в проверку баланса
        if (transferId) {
            if (auto prior = findPriorSubmission(transfer)) {
                return *prior;
            }
        }

        if (auto error = checkSufficientFunds(accountId, amount)) {
            return *error;
        }

        auto result = submit(transfer, transferId.has_value());
        if (result.success) {
            std::cout << "[MoneyMovementService] Withdrew " << amount
                      << " from account " << accountId << " (transfer " << transfer.id << ")" << std::endl;
        }
        return result;
    }

    ports::input::MovementResult transfer(
        const domain::UserId& fromUserId,
        const domain::UserId& toUserId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt) override
    {
        if (fromUserId == toUserId) {
            return fail(domain::OperationError::SAME_ACCOUNT, "Cannot transfer to the same user");
        }
        if (amount <= 0) {
            return fail(domain::OperationError::INVALID_AMOUNT, "Amount must be positive");
        }

        uint64_t fromAccountId = 0;
        if (auto error = resolveAccount(fromUserId, fromAccountId)) {
            return *error;
        }

        uint64_t toAccountId = 0;
        if (auto error = resolveAccount(toUserId, toAccountId)) {
            return *error;
        }

        // Разные пользователи с одним счётом: коллизия вывода ID
        if (fromAccountId == toAccountId) {
            return fail(domain::OperationError::SAME_ACCOUNT,
                        "Source and destination resolve to the same ledger account");
        }

        domain::Transfer transfer(
            transferId ? *transferId : domain::newTransferId(),
            fromAccountId,
            toAccountId,
            static_cast<uint64_t>(amount));

        if (transferId) {
            if (auto prior = findPriorSubmission(transfer)) {
                return *prior;
            }
        }

        if (auto error = checkSufficientFunds(fromAccountId, amount)) {
            return *error;
        }

        auto result = submit(transfer, transferId.has_value());
        if (result.success) {
            std::cout << "[MoneyMovementService] Transferred " << amount
                      << " from account " << fromAccountId << " to account " << toAccountId
                      << " (transfer " << transfer.id << ")" << std::endl;
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::output::ILedgerGateway> ledger_;

    /**
     * @brief Найти привязанный счёт пользователя
     * @return Ошибку или nullopt (accountId заполнен)
     */
    std::optional<ports::input::MovementResult> resolveAccount(
        const domain::UserId& userId, uint64_t& accountId)
    {
        auto userOpt = userRepo_->findById(userId);
        if (!userOpt) {
            return fail(domain::OperationError::IDENTITY_NOT_FOUND,
                        "User not found: " + domain::toString(userId));
        }
        if (!userOpt->ledgerAccountId) {
            return fail(domain::OperationError::ACCOUNT_NOT_LINKED,
                        "User " + domain::toString(userId) + " has no ledger account");
        }
        accountId = *userOpt->ledgerAccountId;
        return std::nullopt;
    }

    std::optional<ports::input::MovementResult> checkSufficientFunds(uint64_t accountId, int64_t amount) {
        auto totals = ledger_->getPostedTotals(accountId);
        if (totals.status == domain::LedgerStatus::ACCOUNT_NOT_FOUND) {
            return fail(domain::OperationError::ACCOUNT_NOT_FOUND,
                        "Ledger account " + std::to_string(accountId) + " not found");
        }
        if (!totals.ok()) {
            std::cerr << "[MoneyMovementService] Balance read failed for account " << accountId
                      << ": " << domain::toString(totals.status) << std::endl;
            return fail(domain::OperationError::ENGINE_UNAVAILABLE, "Ledger unavailable");
        }

        int64_t balance = domain::LedgerAccount::computeBalance(totals.debitsPosted, totals.creditsPosted);
        if (balance < amount) {
            return fail(domain::OperationError::INSUFFICIENT_FUNDS,
                        "Insufficient funds: balance " + std::to_string(balance) +
                        ", requested " + std::to_string(amount));
        }
        return std::nullopt;
    }

    /**
     * @brief Отправить перевод и отобразить ответ движка в OperationError
     *
     * ALREADY_EXISTS для сгенерированного ID даёт DUPLICATE_SUBMISSION.
     * Для ID от вызывающего проверяем, что принятый перевод совпадает
     * по сторонам и сумме: тогда это повтор уже применённой операции.
     */
    ports::input::MovementResult submit(const domain::Transfer& transfer, bool callerSuppliedId) {
        auto status = ledger_->createTransfer(transfer);

        switch (status) {
            case domain::LedgerStatus::OK: {
                ports::input::MovementResult result;
                result.success = true;
                result.transferId = transfer.id;
                result.message = "Transfer applied";
                return result;
            }

            case domain::LedgerStatus::ALREADY_EXISTS: {
                // Конкурентный повтор мог успеть между проверкой и отправкой
                if (callerSuppliedId) {
                    if (auto prior = findPriorSubmission(transfer)) {
                        return *prior;
                    }
                }
                return duplicate(transfer);
            }

            case domain::LedgerStatus::EXCEEDS_CREDITS:
                return failFor(transfer, domain::OperationError::INSUFFICIENT_FUNDS,
                               "Insufficient funds (rejected by ledger)");

            case domain::LedgerStatus::ACCOUNT_NOT_FOUND:
                return failFor(transfer, domain::OperationError::ACCOUNT_NOT_FOUND,
                               "Ledger account not found");

            case domain::LedgerStatus::UNAVAILABLE:
                std::cerr << "[MoneyMovementService] Ledger unavailable, transfer " << transfer.id
                          << " outcome unknown" << std::endl;
                return failFor(transfer, domain::OperationError::ENGINE_UNAVAILABLE,
                               "Ledger unavailable");

            case domain::LedgerStatus::REJECTED:
            default:
                return failFor(transfer, domain::OperationError::ENGINE_REJECTED,
                               "Transfer rejected by ledger: " + domain::toString(status));
        }
    }

    /**
     * @brief Найти в движке перевод с тем же ID
     *
     * Совпадение сторон и суммы означает, что операция уже применена.
     * Другое движение под этим ID даёт DUPLICATE_SUBMISSION.
     * @return nullopt, если перевода с таким ID ещё нет
     */
    std::optional<ports::input::MovementResult> findPriorSubmission(const domain::Transfer& transfer) {
        auto existing = ledger_->lookupTransfer(transfer.id);
        if (!existing) {
            return std::nullopt;
        }

        if (!existing->sameMovement(transfer)) {
            return duplicate(transfer);
        }

        std::cout << "[MoneyMovementService] Transfer " << transfer.id
                  << " already applied, retry acknowledged" << std::endl;
        ports::input::MovementResult result;
        result.success = true;
        result.transferId = transfer.id;
        result.alreadyApplied = true;
        result.message = "Transfer already applied";
        return result;
    }

    static ports::input::MovementResult duplicate(const domain::Transfer& transfer) {
        std::cerr << "[MoneyMovementService] Duplicate transfer id " << transfer.id << std::endl;
        return failFor(transfer, domain::OperationError::DUPLICATE_SUBMISSION,
                       "Transfer id " + std::to_string(transfer.id) + " already exists");
    }

    static ports::input::MovementResult failFor(
        const domain::Transfer& transfer, domain::OperationError error, const std::string& message)
    {
        auto result = fail(error, message);
        result.transferId = transfer.id;
        return result;
    }

    static ports::input::MovementResult fail(domain::OperationError error, const std::string& message) {
        ports::input::MovementResult result;
        result.success = false;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace bank::application
