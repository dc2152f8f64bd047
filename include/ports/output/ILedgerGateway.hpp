#pragma once

#include "domain/LedgerAccount.hpp"
#include "domain/Transfer.hpp"
#include "domain/enums/AccountCategory.hpp"
#include "domain/enums/LedgerStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace bank::ports::output {

/**
 * @brief Результат операции со счётом
 */
struct AccountResult {
    domain::LedgerStatus status = domain::LedgerStatus::UNAVAILABLE;
    std::optional<domain::LedgerAccount> account;
    std::string message;

    bool ok() const { return status == domain::LedgerStatus::OK; }
};

/**
 * @brief Накопленные дебет/кредит счёта
 */
struct PostedTotalsResult {
    domain::LedgerStatus status = domain::LedgerStatus::UNAVAILABLE;
    uint64_t debitsPosted = 0;
    uint64_t creditsPosted = 0;
    std::string message;

    bool ok() const { return status == domain::LedgerStatus::OK; }
};

/**
 * @brief Шлюз к внешнему движку леджера двойной записи
 *
 * Каждый вызов это отдельный сетевой/IPC запрос, может быть медленным
 * и отказывать независимо от справочника пользователей.
 * Реализации должны быть безопасны для конкурентного использования.
 */
class ILedgerGateway {
public:
    virtual ~ILedgerGateway() = default;

    /**
     * @brief Создать счёт
     *
     * Счета категории USER создаются с флагом
     * DEBITS_MUST_NOT_EXCEED_CREDITS.
     *
     * @return ALREADY_EXISTS если ID занят
     */
    virtual AccountResult createAccount(uint64_t accountId, domain::AccountCategory category) = 0;

    /**
     * @brief Найти счёт по ID
     * @return ACCOUNT_NOT_FOUND если счёта нет
     */
    virtual AccountResult getAccount(uint64_t accountId) = 0;

    /**
     * @brief Отправить перевод
     *
     * @return ALREADY_EXISTS если ID перевода уже принят (сумма не применяется повторно),
     *         ACCOUNT_NOT_FOUND если неизвестна одна из сторон,
     *         EXCEEDS_CREDITS если дебет превысит кредит у счёта с флагом
     */
    virtual domain::LedgerStatus createTransfer(const domain::Transfer& transfer) = 0;

    /**
     * @brief Прочитать debits_posted / credits_posted
     */
    virtual PostedTotalsResult getPostedTotals(uint64_t accountId) = 0;

    /**
     * @brief Найти ранее принятый перевод
     * @return Transfer или nullopt (не найден или движок недоступен)
     */
    virtual std::optional<domain::Transfer> lookupTransfer(uint64_t transferId) = 0;
};

} // namespace bank::ports::output
