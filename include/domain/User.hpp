#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace bank::domain {

/**
 * @brief Глобальный 128-битный идентификатор пользователя
 */
using UserId = boost::uuids::uuid;

inline std::string toString(const UserId& userId) {
    return boost::uuids::to_string(userId);
}

/**
 * @brief Разобрать UUID из строки
 * @return UserId или nullopt, если строка не является UUID
 */
inline std::optional<UserId> parseUserId(const std::string& str) {
    if (str.empty()) return std::nullopt;
    try {
        return boost::uuids::string_generator()(str);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

/**
 * @brief Пользователь банка (запись справочника идентичностей)
 *
 * Каждый пользователь связан максимум с одним счётом в леджере.
 * Связь устанавливается один раз и больше не меняется.
 */
struct User {
    UserId userId{};                        ///< UUID пользователя
    std::string email;                      ///< Уникальный email
    std::string firstName;
    std::string lastName;
    std::optional<uint64_t> ledgerAccountId;  ///< ID счёта в леджере (после провижининга)
    std::chrono::system_clock::time_point createdAt;  ///< Дата регистрации

    User() = default;

    User(const UserId& userId,
         const std::string& email,
         const std::string& firstName,
         const std::string& lastName)
        : userId(userId)
        , email(email)
        , firstName(firstName)
        , lastName(lastName)
        , createdAt(std::chrono::system_clock::now())
    {}

    bool hasLedgerAccount() const { return ledgerAccountId.has_value(); }
};

} // namespace bank::domain
