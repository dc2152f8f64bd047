#pragma once

#include "settings/Env.hpp"
#include <string>
#include <stdexcept>

namespace bank::settings {

/**
 * @brief Параметры подключения к PostgreSQL из группы переменных <PREFIX>HOST, PORT, NAME, USER, PASSWORD
 *
 * Каждая переменная ищется сначала с prefix, затем с fallbackPrefix:
 * леджер (LEDGER_DB_) по умолчанию живёт в БД справочника (BANK_DB_).
 * Пароль обязателен.
 */
class PgConnectionSettings {
public:
    explicit PgConnectionSettings(const std::string& prefix, const std::string& fallbackPrefix = "")
        : prefix_(prefix)
        , fallbackPrefix_(fallbackPrefix)
    {
        host_ = read("HOST", "localhost");
        port_ = parsePort(read("PORT", "5432"));
        name_ = read("NAME", "bank_db");
        user_ = read("USER", "bank_user");
        password_ = env::required(prefix_ + "PASSWORD", fallbackName("PASSWORD"));
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getName() const { return name_; }
    const std::string& getUser() const { return user_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string prefix_;
    std::string fallbackPrefix_;
    std::string host_;
    int port_ = 0;
    std::string name_;
    std::string user_;
    std::string password_;

    std::string fallbackName(const std::string& key) const {
        return fallbackPrefix_.empty() ? "" : fallbackPrefix_ + key;
    }

    std::string read(const std::string& key, const std::string& defaultValue) const {
        return env::lookupWithFallback(prefix_ + key, fallbackName(key)).value_or(defaultValue);
    }

    /**
     * @throws std::invalid_argument для нечислового порта или вне 1..65535
     */
    int parsePort(const std::string& value) const {
        size_t consumed = 0;
        int port = 0;
        try {
            port = std::stoi(value, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != value.size() || port < 1 || port > 65535) {
            throw std::invalid_argument("Invalid " + prefix_ + "PORT: " + value);
        }
        return port;
    }
};

} // namespace bank::settings
