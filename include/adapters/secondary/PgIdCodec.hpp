#pragma once

#include <cstdint>
#include <cstring>

namespace bank::adapters::secondary {

/**
 * @brief uint64 ↔ BIGINT без потери битов
 *
 * PostgreSQL не имеет беззнакового 64-битного типа. ID счетов и
 * счётчики хранятся в BIGINT как тот же битовый образ; вся
 * арифметика выполняется на стороне сервиса в uint64.
 */
inline int64_t toDbInt(uint64_t value) {
    int64_t result;
    std::memcpy(&result, &value, sizeof(result));
    return result;
}

inline uint64_t fromDbInt(int64_t value) {
    uint64_t result;
    std::memcpy(&result, &value, sizeof(result));
    return result;
}

} // namespace bank::adapters::secondary
