#pragma once

#include "domain/User.hpp"
#include "domain/enums/OperationError.hpp"
#include <cstdint>
#include <string>

namespace bank::ports::input {

/**
 * @brief Результат регистрации пользователя
 */
struct RegistrationResult {
    bool success = false;
    domain::UserId userId{};
    uint64_t accountId = 0;
    domain::OperationError error = domain::OperationError::NONE;
    std::string message;
};

/**
 * @brief Регистрация: запись в справочнике + счёт в леджере
 */
class IRegistrationService {
public:
    virtual ~IRegistrationService() = default;

    virtual RegistrationResult registerUser(
        const std::string& email,
        const std::string& firstName,
        const std::string& lastName) = 0;
};

} // namespace bank::ports::input
