#pragma once

#include <string>
#include <cstdint>
#include <stdexcept>

namespace bank::domain {

/**
 * @brief Категория счёта в леджере (поле code)
 */
enum class AccountCategory : uint16_t {
    MASTER_DEBIT = 1,     ///< Мастер-счёт списаний (получатель выводов)
    MASTER_CREDIT = 2,    ///< Мастер-счёт зачислений (источник депозитов)
    USER = 100            ///< Счёт пользователя
};

inline std::string toString(AccountCategory category) {
    switch (category) {
        case AccountCategory::MASTER_DEBIT:  return "MASTER_DEBIT";
        case AccountCategory::MASTER_CREDIT: return "MASTER_CREDIT";
        case AccountCategory::USER:          return "USER";
        default: return "UNKNOWN";
    }
}

inline uint16_t toCode(AccountCategory category) {
    return static_cast<uint16_t>(category);
}

/**
 * @brief Преобразовать code из леджера в AccountCategory
 * @throws std::invalid_argument если код не распознан
 */
inline AccountCategory parseAccountCategory(uint16_t code) {
    switch (code) {
        case 1:   return AccountCategory::MASTER_DEBIT;
        case 2:   return AccountCategory::MASTER_CREDIT;
        case 100: return AccountCategory::USER;
        default:
            throw std::invalid_argument("Unknown account category code: " + std::to_string(code));
    }
}

} // namespace bank::domain
