#pragma once

#include <cstdint>

namespace bank::domain {

/**
 * @brief Перевод между двумя счетами леджера
 *
 * Неизменяемая запись: создаётся ровно один раз при отправке в движок.
 * Повторная отправка с тем же id не применяется второй раз.
 */
struct Transfer {
    uint64_t id = 0;
    uint64_t debitAccountId = 0;
    uint64_t creditAccountId = 0;
    uint64_t amount = 0;            ///< В минорных единицах (центы)
    uint32_t ledger = 1;
    uint16_t code = 1;              ///< Стандартный перевод

    Transfer() = default;

    Transfer(uint64_t id, uint64_t debitAccountId, uint64_t creditAccountId, uint64_t amount)
        : id(id)
        , debitAccountId(debitAccountId)
        , creditAccountId(creditAccountId)
        , amount(amount)
    {}

    /**
     * @brief Та же логическая операция (id не сравнивается)
     */
    bool sameMovement(const Transfer& other) const {
        return debitAccountId == other.debitAccountId
            && creditAccountId == other.creditAccountId
            && amount == other.amount
            && ledger == other.ledger;
    }
};

} // namespace bank::domain
