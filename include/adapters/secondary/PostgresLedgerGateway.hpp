#pragma once

#include "ports/output/ILedgerGateway.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerIds.hpp"
#include "PgIdCodec.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <limits>
#include <algorithm>
#include <iostream>

namespace bank::adapters::secondary {

/**
 * @brief Движок леджера двойной записи поверх PostgreSQL
 *
 * Таблицы:
 *   ledger_accounts  (id BIGINT PK, ledger INTEGER, category SMALLINT,
 *                     flags SMALLINT, debits_posted BIGINT, credits_posted BIGINT)
 *   ledger_transfers (id BIGINT PK, debit_account_id BIGINT, credit_account_id BIGINT,
 *                     amount BIGINT, ledger INTEGER, code SMALLINT, created_at)
 *
 * Перевод применяется одной транзакцией: обе строки счетов блокируются
 * FOR UPDATE в порядке возрастания id, флаг DEBITS_MUST_NOT_EXCEED_CREDITS
 * проверяется под блокировкой, затем вставляется строка перевода и
 * обновляются оба счётчика. Исключения libpqxx → UNAVAILABLE.
 */
class PostgresLedgerGateway : public ports::output::ILedgerGateway {
public:
    explicit PostgresLedgerGateway(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedgerGateway] Connecting to " << settings_->getDatabase().getHost() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getDatabase().getConnectionString());
            std::cout << "[PostgresLedgerGateway] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresLedgerGateway() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    ports::output::AccountResult createAccount(uint64_t accountId, domain::AccountCategory category) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::AccountResult result;
        if (accountId == 0) {
            result.status = domain::LedgerStatus::REJECTED;
            result.message = "Account id must not be zero";
            return result;
        }

        uint16_t flags = category == domain::AccountCategory::USER
            ? domain::AccountFlags::DEBITS_MUST_NOT_EXCEED_CREDITS
            : domain::AccountFlags::NONE;

        try {
            pqxx::work txn(*connection_);

            auto inserted = txn.exec_params(
                R"(
                    INSERT INTO ledger_accounts (id, ledger, category, flags, debits_posted, credits_posted)
                    VALUES ($1, $2, $3, $4, 0, 0)
                    ON CONFLICT (id) DO NOTHING
                )",
                toDbInt(accountId),
                static_cast<int32_t>(domain::DEFAULT_LEDGER),
                static_cast<int16_t>(domain::toCode(category)),
                static_cast<int16_t>(flags)
            );

            auto existing = selectAccount(txn, accountId, false);
            txn.commit();

            result.status = inserted.affected_rows() > 0
                ? domain::LedgerStatus::OK
                : domain::LedgerStatus::ALREADY_EXISTS;
            result.account = existing;
            return result;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] createAccount() failed: " << e.what() << std::endl;
            result.status = domain::LedgerStatus::UNAVAILABLE;
            result.message = e.what();
            return result;
        }
    }

    ports::output::AccountResult getAccount(uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::AccountResult result;
        try {
            pqxx::work txn(*connection_);
            auto account = selectAccount(txn, accountId, false);
            txn.commit();

            if (!account) {
                result.status = domain::LedgerStatus::ACCOUNT_NOT_FOUND;
                return result;
            }
            result.status = domain::LedgerStatus::OK;
            result.account = account;
            return result;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] getAccount() failed: " << e.what() << std::endl;
            result.status = domain::LedgerStatus::UNAVAILABLE;
            result.message = e.what();
            return result;
        }
    }

    domain::LedgerStatus createTransfer(const domain::Transfer& transfer) override {
        if (transfer.id == 0 || transfer.amount == 0 ||
            transfer.debitAccountId == transfer.creditAccountId ||
            transfer.ledger != domain::DEFAULT_LEDGER) {
            return domain::LedgerStatus::REJECTED;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto seen = txn.exec_params(
                "SELECT 1 FROM ledger_transfers WHERE id = $1",
                toDbInt(transfer.id)
            );
            if (!seen.empty()) {
                return domain::LedgerStatus::ALREADY_EXISTS;
            }

            // Порядок блокировок по id исключает взаимные блокировки
            uint64_t firstId = std::min(transfer.debitAccountId, transfer.creditAccountId);
            uint64_t secondId = std::max(transfer.debitAccountId, transfer.creditAccountId);
            auto first = selectAccount(txn, firstId, true);
            auto second = selectAccount(txn, secondId, true);
            if (!first || !second) {
                return domain::LedgerStatus::ACCOUNT_NOT_FOUND;
            }

            auto& debit = first->id == transfer.debitAccountId ? *first : *second;
            auto& credit = first->id == transfer.creditAccountId ? *first : *second;

            if (debit.ledger != transfer.ledger || credit.ledger != transfer.ledger) {
                return domain::LedgerStatus::REJECTED;
            }

            constexpr uint64_t maxValue = std::numeric_limits<uint64_t>::max();
            if (debit.debitsPosted > maxValue - transfer.amount ||
                credit.creditsPosted > maxValue - transfer.amount) {
                return domain::LedgerStatus::REJECTED;
            }

            if (debit.hasFlag(domain::AccountFlags::DEBITS_MUST_NOT_EXCEED_CREDITS) &&
                debit.debitsPosted + transfer.amount > debit.creditsPosted) {
                return domain::LedgerStatus::EXCEEDS_CREDITS;
            }

            auto inserted = txn.exec_params(
                R"(
                    INSERT INTO ledger_transfers
                        (id, debit_account_id, credit_account_id, amount, ledger, code, created_at)
                    VALUES ($1, $2, $3, $4, $5, $6, NOW())
                    ON CONFLICT (id) DO NOTHING
                )",
                toDbInt(transfer.id),
                toDbInt(transfer.debitAccountId),
                toDbInt(transfer.creditAccountId),
                toDbInt(transfer.amount),
                static_cast<int32_t>(transfer.ledger),
                static_cast<int16_t>(transfer.code)
            );
            if (inserted.affected_rows() == 0) {
                return domain::LedgerStatus::ALREADY_EXISTS;
            }

            txn.exec_params(
                "UPDATE ledger_accounts SET debits_posted = $2 WHERE id = $1",
                toDbInt(debit.id),
                toDbInt(debit.debitsPosted + transfer.amount)
            );
            txn.exec_params(
                "UPDATE ledger_accounts SET credits_posted = $2 WHERE id = $1",
                toDbInt(credit.id),
                toDbInt(credit.creditsPosted + transfer.amount)
            );

            txn.commit();
            return domain::LedgerStatus::OK;

        } catch (const pqxx::in_doubt_error& e) {
            std::cerr << "[PostgresLedgerGateway] createTransfer(" << transfer.id
                      << ") commit outcome unknown: " << e.what() << std::endl;
            return domain::LedgerStatus::UNAVAILABLE;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] createTransfer(" << transfer.id
                      << ") failed: " << e.what() << std::endl;
            return domain::LedgerStatus::UNAVAILABLE;
        }
    }

    ports::output::PostedTotalsResult getPostedTotals(uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::PostedTotalsResult result;
        try {
            pqxx::work txn(*connection_);
            auto account = selectAccount(txn, accountId, false);
            txn.commit();

            if (!account) {
                result.status = domain::LedgerStatus::ACCOUNT_NOT_FOUND;
                result.message = "Account " + std::to_string(accountId) + " not found";
                return result;
            }
            result.status = domain::LedgerStatus::OK;
            result.debitsPosted = account->debitsPosted;
            result.creditsPosted = account->creditsPosted;
            return result;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] getPostedTotals() failed: " << e.what() << std::endl;
            result.status = domain::LedgerStatus::UNAVAILABLE;
            result.message = e.what();
            return result;
        }
    }

    std::optional<domain::Transfer> lookupTransfer(uint64_t transferId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT id, debit_account_id, credit_account_id, amount, ledger, code "
                "FROM ledger_transfers WHERE id = $1",
                toDbInt(transferId)
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::Transfer transfer(
                fromDbInt(row["id"].as<int64_t>()),
                fromDbInt(row["debit_account_id"].as<int64_t>()),
                fromDbInt(row["credit_account_id"].as<int64_t>()),
                fromDbInt(row["amount"].as<int64_t>())
            );
            transfer.ledger = static_cast<uint32_t>(row["ledger"].as<int32_t>());
            transfer.code = static_cast<uint16_t>(row["code"].as<int16_t>());
            return transfer;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerGateway] lookupTransfer() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::optional<domain::LedgerAccount> selectAccount(pqxx::work& txn, uint64_t accountId, bool forUpdate) {
        std::string query =
            "SELECT id, ledger, category, flags, debits_posted, credits_posted "
            "FROM ledger_accounts WHERE id = $1";
        if (forUpdate) {
            query += " FOR UPDATE";
        }

        auto result = txn.exec_params(query, toDbInt(accountId));
        if (result.empty()) return std::nullopt;

        const auto& row = result[0];
        domain::LedgerAccount account(
            fromDbInt(row["id"].as<int64_t>()),
            static_cast<uint32_t>(row["ledger"].as<int32_t>()),
            domain::parseAccountCategory(static_cast<uint16_t>(row["category"].as<int16_t>())),
            static_cast<uint16_t>(row["flags"].as<int16_t>())
        );
        account.debitsPosted = fromDbInt(row["debits_posted"].as<int64_t>());
        account.creditsPosted = fromDbInt(row["credits_posted"].as<int64_t>());
        return account;
    }
};

} // namespace bank::adapters::secondary
