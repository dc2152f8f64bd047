#pragma once

#include "domain/User.hpp"
#include "domain/enums/OperationError.hpp"
#include <cstdint>
#include <string>

namespace bank::ports::input {

/**
 * @brief Результат провижининга счёта
 *
 * При PROVISION_PARTIAL_FAILURE accountId заполнен: счёт в леджере
 * создан, но не привязан к пользователю (нужна сверка оператором).
 */
struct ProvisionResult {
    bool success = false;
    uint64_t accountId = 0;
    domain::OperationError error = domain::OperationError::NONE;
    std::string message;
};

/**
 * @brief Создание счёта в леджере для нового пользователя
 */
class IAccountProvisioner {
public:
    virtual ~IAccountProvisioner() = default;

    /**
     * @brief Создать счёт и привязать его к пользователю
     *
     * Пользователь должен уже существовать в справочнике.
     * При отказе движка пользователь удаляется (компенсация).
     */
    virtual ProvisionResult provision(const domain::UserId& userId) = 0;
};

} // namespace bank::ports::input
