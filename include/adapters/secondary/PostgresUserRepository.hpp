#pragma once

#include "ports/output/IUserRepository.hpp"
#include "settings/DirectorySettings.hpp"
#include "PgIdCodec.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace bank::adapters::secondary {

/**
 * @brief PostgreSQL справочник пользователей
 *
 * Таблица users:
 *   user_id UUID PRIMARY KEY, email VARCHAR UNIQUE, first_name, last_name,
 *   ledger_account_id BIGINT UNIQUE, created_at, deleted_at
 *
 * Удаление мягкое (deleted_at), удалённые записи не видны поиску.
 */
class PostgresUserRepository : public ports::output::IUserRepository {
public:
    explicit PostgresUserRepository(std::shared_ptr<settings::DirectorySettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresUserRepository] Connecting to " << settings_->getDatabase().getHost() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getDatabase().getConnectionString());
            std::cout << "[PostgresUserRepository] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresUserRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    domain::User save(const domain::User& user) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO users (user_id, email, first_name, last_name, created_at)
                    VALUES ($1, $2, $3, $4, NOW())
                )",
                domain::toString(user.userId),
                user.email,
                user.firstName,
                user.lastName
            );

            txn.commit();
            return user;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::User> findById(const domain::UserId& userId) override {
        return findOne("findById", "user_id = $1", domain::toString(userId));
    }

    std::optional<domain::User> findByEmail(const std::string& email) override {
        return findOne("findByEmail", "email = $1", email);
    }

    std::optional<domain::User> findByLedgerAccountId(uint64_t accountId) override {
        return findOne("findByLedgerAccountId", "ledger_account_id = $1", toDbInt(accountId));
    }

    bool linkLedgerAccount(const domain::UserId& userId, uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Повторная запись того же ID проходит, чужой ID не перезаписывается
            auto result = txn.exec_params(
                R"(
                    UPDATE users SET ledger_account_id = $2
                    WHERE user_id = $1 AND deleted_at IS NULL
                      AND (ledger_account_id IS NULL OR ledger_account_id = $2)
                )",
                domain::toString(userId),
                toDbInt(accountId)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] linkLedgerAccount() failed: " << e.what() << std::endl;
            return false;
        }
    }

    bool deleteById(const domain::UserId& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "UPDATE users SET deleted_at = NOW() WHERE user_id = $1 AND deleted_at IS NULL",
                domain::toString(userId)
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] deleteById() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    std::shared_ptr<settings::DirectorySettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    template <typename Param>
    std::optional<domain::User> findOne(const char* operation, const std::string& condition, const Param& param) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT user_id, email, first_name, last_name, ledger_account_id "
                "FROM users WHERE " + condition + " AND deleted_at IS NULL",
                param
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToUser(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] " << operation << "() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    domain::User rowToUser(const pqxx::row& row) const {
        auto userId = domain::parseUserId(row["user_id"].as<std::string>());
        if (!userId) {
            throw std::runtime_error("Malformed user_id in users table");
        }

        domain::User user(
            *userId,
            row["email"].as<std::string>(),
            row["first_name"].as<std::string>(),
            row["last_name"].as<std::string>()
        );
        if (!row["ledger_account_id"].is_null()) {
            user.ledgerAccountId = fromDbInt(row["ledger_account_id"].as<int64_t>());
        }
        return user;
    }
};

} // namespace bank::adapters::secondary
