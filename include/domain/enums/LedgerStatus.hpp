#pragma once

#include <string>

namespace bank::domain {

/**
 * @brief Результат вызова к движку леджера
 */
enum class LedgerStatus {
    OK,
    ALREADY_EXISTS,      ///< ID счёта/перевода уже занят
    ACCOUNT_NOT_FOUND,   ///< Одна из сторон перевода неизвестна
    EXCEEDS_CREDITS,     ///< Движок отклонил: дебет превысит кредит счёта
    REJECTED,            ///< Иное бизнес-правило движка
    UNAVAILABLE          ///< Транспорт / движок недоступен
};

inline std::string toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::OK:                return "OK";
        case LedgerStatus::ALREADY_EXISTS:    return "ALREADY_EXISTS";
        case LedgerStatus::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case LedgerStatus::EXCEEDS_CREDITS:   return "EXCEEDS_CREDITS";
        case LedgerStatus::REJECTED:          return "REJECTED";
        case LedgerStatus::UNAVAILABLE:       return "UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

} // namespace bank::domain
