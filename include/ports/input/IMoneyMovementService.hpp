#pragma once

#include "domain/User.hpp"
#include "domain/enums/OperationError.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace bank::ports::input {

/**
 * @brief Результат движения денег
 */
struct MovementResult {
    bool success = false;
    uint64_t transferId = 0;
    domain::OperationError error = domain::OperationError::NONE;
    std::string message;
    bool alreadyApplied = false;  ///< Повтор с тем же transferId, перевод уже был применён
};

/**
 * @brief Депозиты, выводы и переводы между пользователями
 *
 * transferId: необязательный ключ повтора. Если не задан, генерируется
 * новый. Повтор после таймаута должен передавать тот же transferId,
 * иначе операция может примениться дважды.
 */
class IMoneyMovementService {
public:
    virtual ~IMoneyMovementService() = default;

    /**
     * @brief Зачислить amount с мастер-счёта зачислений
     */
    virtual MovementResult deposit(
        const domain::UserId& userId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt
    ) = 0;

    /**
     * @brief Вывести amount на мастер-счёт списаний
     */
    virtual MovementResult withdraw(
        const domain::UserId& userId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt
    ) = 0;

    /**
     * @brief Перевести amount от одного пользователя другому
     */
    virtual MovementResult transfer(
        const domain::UserId& fromUserId,
        const domain::UserId& toUserId,
        int64_t amount,
        std::optional<uint64_t> transferId = std::nullopt
    ) = 0;
};

} // namespace bank::ports::input
