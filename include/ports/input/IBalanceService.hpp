#pragma once

#include "domain/User.hpp"
#include "domain/enums/OperationError.hpp"
#include <cstdint>
#include <string>

namespace bank::ports::input {

struct BalanceResult {
    bool success = false;
    int64_t balance = 0;
    domain::OperationError error = domain::OperationError::NONE;
    std::string message;
    bool degraded = false;  ///< Леджер недоступен, показан 0
};

class IBalanceService {
public:
    virtual ~IBalanceService() = default;

    /**
     * @brief Баланс пользователя (credits_posted − debits_posted)
     */
    virtual BalanceResult balance(const domain::UserId& userId) = 0;
};

} // namespace bank::ports::input
