#pragma once

#include "enums/AccountCategory.hpp"
#include <cstdint>
#include <limits>

namespace bank::domain {

/**
 * @brief Флаги счёта в леджере
 */
namespace AccountFlags {
    constexpr uint16_t NONE = 0;
    /// Движок отклоняет переводы, после которых debits_posted > credits_posted
    constexpr uint16_t DEBITS_MUST_NOT_EXCEED_CREDITS = 1 << 0;
}

/**
 * @brief Счёт в движке двойной записи
 *
 * Запись принадлежит движку леджера; ядро хранит только производные ID.
 * Счётчики debitsPosted / creditsPosted только растут.
 */
struct LedgerAccount {
    uint64_t id = 0;
    uint32_t ledger = 1;                        ///< Партиция леджера
    AccountCategory category = AccountCategory::USER;
    uint16_t flags = AccountFlags::NONE;
    uint64_t debitsPosted = 0;
    uint64_t creditsPosted = 0;

    LedgerAccount() = default;

    LedgerAccount(uint64_t id, uint32_t ledger, AccountCategory category, uint16_t flags = AccountFlags::NONE)
        : id(id)
        , ledger(ledger)
        , category(category)
        , flags(flags)
    {}

    bool hasFlag(uint16_t flag) const { return (flags & flag) != 0; }

    /**
     * @brief Баланс = credits_posted − debits_posted (знаковый)
     */
    int64_t balance() const {
        return computeBalance(debitsPosted, creditsPosted);
    }

    /**
     * @brief Разность счётчиков с насыщением в границах int64_t
     *
     * Разность больше 2^63 бывает только у системных счетов
     * (MASTER_CREDIT), на них значение упирается в min/max.
     */
    static int64_t computeBalance(uint64_t debits, uint64_t credits) {
        constexpr uint64_t maxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        if (credits >= debits) {
            uint64_t diff = credits - debits;
            return diff > maxPositive ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(diff);
        }
        uint64_t diff = debits - credits;
        if (diff > maxPositive) {
            return std::numeric_limits<int64_t>::min();
        }
        return -static_cast<int64_t>(diff);
    }
};

} // namespace bank::domain
