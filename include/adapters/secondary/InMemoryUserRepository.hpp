#pragma once

#include "ports/output/IUserRepository.hpp"
#include <unordered_map>
#include <mutex>
#include <stdexcept>

namespace bank::adapters::secondary {

/**
 * @brief In-Memory справочник пользователей (DIRECTORY_BACKEND=memory и тесты)
 */
class InMemoryUserRepository : public ports::output::IUserRepository {
public:
    domain::User save(const domain::User& user) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = domain::toString(user.userId);

        auto emailIt = emailIndex_.find(user.email);
        if (emailIt != emailIndex_.end() && emailIt->second != key) {
            throw std::runtime_error("Email already registered: " + user.email);
        }

        auto existing = users_.find(key);
        if (existing != users_.end() && existing->second.email != user.email) {
            emailIndex_.erase(existing->second.email);
        }

        users_[key] = user;
        emailIndex_[user.email] = key;
        return user;
    }

    std::optional<domain::User> findById(const domain::UserId& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(domain::toString(userId));
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::User> findByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = emailIndex_.find(email);
        if (it == emailIndex_.end()) return std::nullopt;
        return users_[it->second];
    }

    std::optional<domain::User> findByLedgerAccountId(uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, user] : users_) {
            if (user.ledgerAccountId && *user.ledgerAccountId == accountId) {
                return user;
            }
        }
        return std::nullopt;
    }

    bool linkLedgerAccount(const domain::UserId& userId, uint64_t accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(domain::toString(userId));
        if (it == users_.end()) return false;

        auto& user = it->second;
        if (user.ledgerAccountId) {
            return *user.ledgerAccountId == accountId;
        }
        user.ledgerAccountId = accountId;
        return true;
    }

    bool deleteById(const domain::UserId& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(domain::toString(userId));
        if (it == users_.end()) return false;

        emailIndex_.erase(it->second.email);
        users_.erase(it);
        return true;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        users_.clear();
        emailIndex_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return users_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::User> users_;       // userId -> User
    std::unordered_map<std::string, std::string> emailIndex_;   // email -> userId
};

} // namespace bank::adapters::secondary
