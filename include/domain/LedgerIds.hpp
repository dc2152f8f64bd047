#pragma once

#include "User.hpp"
#include "utils/UuidGenerator.hpp"
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <cstddef>

namespace bank::domain {

// Зарезервированные счета, создаются MasterAccountBootstrap
constexpr uint64_t MASTER_DEBIT_ACCOUNT_ID = 1;
constexpr uint64_t MASTER_CREDIT_ACCOUNT_ID = 2;

constexpr uint64_t RESERVED_ID_OFFSET = 1000;
constexpr uint32_t DEFAULT_LEDGER = 1;

/**
 * @brief Старшие 8 байт UUID как big-endian uint64
 */
inline uint64_t truncateToUint64(const boost::uuids::uuid& id) {
    uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint64_t>(id.data[i]);
    }
    return value;
}

/**
 * @brief Вывести ID счёта леджера из UUID пользователя
 *
 * Детерминированная чистая функция: повторный вывод из того же UUID
 * всегда даёт тот же ID, поэтому отдельная таблица соответствий не нужна.
 * Значения 0, 1, 2 сдвигаются на RESERVED_ID_OFFSET, чтобы не пересечься
 * с мастер-счетами.
 *
 * @warning Не устойчиво к коллизиям: два разных UUID с одинаковыми
 * старшими 8 байтами дают один и тот же ID. AccountProvisioner
 * обнаруживает такую коллизию при создании счёта.
 */
inline uint64_t deriveAccountId(const UserId& userId) {
    uint64_t id = truncateToUint64(userId);
    if (id <= MASTER_CREDIT_ACCOUNT_ID) {
        id += RESERVED_ID_OFFSET;
    }
    return id;
}

/**
 * @brief Вывести ID перевода из UUID операции (без сдвига)
 */
inline uint64_t deriveTransferId(const boost::uuids::uuid& operationId) {
    return truncateToUint64(operationId);
}

/**
 * @brief Свежий ID перевода из нового случайного UUID
 */
inline uint64_t newTransferId() {
    return deriveTransferId(utils::UuidGenerator::generate());
}

} // namespace bank::domain
