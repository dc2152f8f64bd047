#pragma once

#include "domain/User.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace bank::ports::output {

/**
 * @brief Интерфейс справочника пользователей
 *
 * Output Port к хранилищу идентичностей. Поле ledgerAccountId
 * принадлежит справочнику, но записывается только AccountProvisioner.
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /**
     * @brief Создать пользователя
     * @return Сохранённый пользователь
     * @throws std::exception при ошибке хранилища
     */
    virtual domain::User save(const domain::User& user) = 0;

    /**
     * @brief Найти пользователя по ID
     * @return User или nullopt
     */
    virtual std::optional<domain::User> findById(const domain::UserId& userId) = 0;

    /**
     * @brief Найти пользователя по email
     */
    virtual std::optional<domain::User> findByEmail(const std::string& email) = 0;

    /**
     * @brief Найти пользователя, привязанного к счёту леджера
     */
    virtual std::optional<domain::User> findByLedgerAccountId(uint64_t accountId) = 0;

    /**
     * @brief Записать связь пользователь → счёт леджера
     *
     * Связь неизменяема: если у пользователя уже есть другой счёт,
     * запись отклоняется. Повторная запись того же ID успешна.
     *
     * @return false если пользователь не найден, уже привязан к другому
     *         счёту или хранилище недоступно
     */
    virtual bool linkLedgerAccount(const domain::UserId& userId, uint64_t accountId) = 0;

    /**
     * @brief Удалить пользователя
     * @return false если не найден или хранилище недоступно
     */
    virtual bool deleteById(const domain::UserId& userId) = 0;
};

} // namespace bank::ports::output
