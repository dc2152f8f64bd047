#pragma once

#include "ports/output/ILedgerGateway.hpp"
#include "domain/LedgerIds.hpp"
#include <unordered_map>
#include <mutex>
#include <limits>
#include <iostream>

namespace bank::adapters::secondary {

/**
 * @brief In-Memory движок леджера для разработки и тестов
 *
 * Та же семантика, что у PostgresLedgerGateway:
 * уникальные ID счетов и переводов, атомарное применение перевода,
 * флаг DEBITS_MUST_NOT_EXCEED_CREDITS на счетах пользователей.
 * Все операции сериализуются одним mutex.
 */
class InMemoryLedgerGateway : public ports::output::ILedgerGateway {
public:
    explicit InMemoryLedgerGateway(uint32_t ledgerId = domain::DEFAULT_LEDGER)
        : ledgerId_(ledgerId)
    {
        std::cout << "[InMemoryLedgerGateway] Created (ledger " << ledgerId_ << ")" << std::endl;
    }

    ports::output::AccountResult createAccount(uint64_t accountId, domain::AccountCategory category) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::AccountResult result;
        if (accountId == 0) {
            result.status = domain::LedgerStatus::REJECTED;
            result.message = "Account id must not be zero";
            return result;
        }

        auto it = accounts_.find(accountId);
        if (it != accounts_.end()) {
            result.status = domain::LedgerStatus::ALREADY_EXISTS;
            result.account = it->second;
            return result;
        }

        uint16_t flags = category == domain::AccountCategory::USER
            ? domain::AccountFlags::DEBITS_MUST_NOT_EXCEED_CREDITS
            : domain::AccountFlags::NONE;

        domain::LedgerAccount account(accountId, ledgerId_, category, flags);
        accounts_[accountId] = account;

        result.status = domain::LedgerStatus::OK;
        result.account = account;
        return result;
    }

    ports::output::AccountResult getAccount(uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::AccountResult result;
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            result.status = domain::LedgerStatus::ACCOUNT_NOT_FOUND;
            return result;
        }
        result.status = domain::LedgerStatus::OK;
        result.account = it->second;
        return result;
    }

    domain::LedgerStatus createTransfer(const domain::Transfer& transfer) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (transfer.id == 0 || transfer.amount == 0 ||
            transfer.debitAccountId == transfer.creditAccountId ||
            transfer.ledger != ledgerId_) {
            return domain::LedgerStatus::REJECTED;
        }

        if (transfers_.count(transfer.id) > 0) {
            return domain::LedgerStatus::ALREADY_EXISTS;
        }

        auto debitIt = accounts_.find(transfer.debitAccountId);
        auto creditIt = accounts_.find(transfer.creditAccountId);
        if (debitIt == accounts_.end() || creditIt == accounts_.end()) {
            return domain::LedgerStatus::ACCOUNT_NOT_FOUND;
        }

        auto& debit = debitIt->second;
        auto& credit = creditIt->second;

        constexpr uint64_t maxValue = std::numeric_limits<uint64_t>::max();
        if (debit.debitsPosted > maxValue - transfer.amount ||
            credit.creditsPosted > maxValue - transfer.amount) {
            return domain::LedgerStatus::REJECTED;
        }

        if (debit.hasFlag(domain::AccountFlags::DEBITS_MUST_NOT_EXCEED_CREDITS) &&
            debit.debitsPosted + transfer.amount > debit.creditsPosted) {
            return domain::LedgerStatus::EXCEEDS_CREDITS;
        }

        debit.debitsPosted += transfer.amount;
        credit.creditsPosted += transfer.amount;
        transfers_[transfer.id] = transfer;
        return domain::LedgerStatus::OK;
    }

    ports::output::PostedTotalsResult getPostedTotals(uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::PostedTotalsResult result;
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            result.status = domain::LedgerStatus::ACCOUNT_NOT_FOUND;
            result.message = "Account " + std::to_string(accountId) + " not found";
            return result;
        }
        result.status = domain::LedgerStatus::OK;
        result.debitsPosted = it->second.debitsPosted;
        result.creditsPosted = it->second.creditsPosted;
        return result;
    }

    std::optional<domain::Transfer> lookupTransfer(uint64_t transferId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transfers_.find(transferId);
        if (it == transfers_.end()) return std::nullopt;
        return it->second;
    }

    // Helpers для тестов и диагностики
    size_t accountCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.size();
    }

    size_t transferCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transfers_.size();
    }

private:
    uint32_t ledgerId_;
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, domain::LedgerAccount> accounts_;
    std::unordered_map<uint64_t, domain::Transfer> transfers_;
};

} // namespace bank::adapters::secondary
