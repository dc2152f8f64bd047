#pragma once

#include <string>

namespace bank::domain {

/**
 * @brief Типизированные ошибки операций ядра
 *
 * Возвращаются в HTTP слой в составе Result-структур, не исключениями.
 */
enum class OperationError {
    NONE,
    INVALID_AMOUNT,             ///< Сумма <= 0
    IDENTITY_NOT_FOUND,         ///< Пользователь не найден в справочнике
    ACCOUNT_NOT_LINKED,         ///< У пользователя ещё нет счёта в леджере
    ACCOUNT_NOT_FOUND,          ///< Движок не знает одну из сторон перевода
    INSUFFICIENT_FUNDS,         ///< Недостаточно средств
    SAME_ACCOUNT,               ///< Перевод самому себе
    ENGINE_UNAVAILABLE,         ///< Движок леджера недоступен
    ENGINE_REJECTED,            ///< Движок отклонил перевод по своим правилам
    DUPLICATE_SUBMISSION,       ///< ID перевода уже был принят (возможно, уже применён)
    ACCOUNT_CREATION_FAILED,    ///< Движок отказал в создании счёта
    IDENTIFIER_COLLISION,       ///< Выведенный ID счёта принадлежит другому пользователю
    PROVISION_PARTIAL_FAILURE,  ///< Счёт создан, но привязка к пользователю не записана
    EMAIL_ALREADY_REGISTERED,   ///< Регистрация с занятым email
    DIRECTORY_UNAVAILABLE       ///< Справочник не сохранил пользователя
};

inline std::string toString(OperationError error) {
    switch (error) {
        case OperationError::NONE:                      return "NONE";
        case OperationError::INVALID_AMOUNT:            return "INVALID_AMOUNT";
        case OperationError::IDENTITY_NOT_FOUND:        return "IDENTITY_NOT_FOUND";
        case OperationError::ACCOUNT_NOT_LINKED:        return "ACCOUNT_NOT_LINKED";
        case OperationError::ACCOUNT_NOT_FOUND:         return "ACCOUNT_NOT_FOUND";
        case OperationError::INSUFFICIENT_FUNDS:        return "INSUFFICIENT_FUNDS";
        case OperationError::SAME_ACCOUNT:              return "SAME_ACCOUNT";
        case OperationError::ENGINE_UNAVAILABLE:        return "ENGINE_UNAVAILABLE";
        case OperationError::ENGINE_REJECTED:           return "ENGINE_REJECTED";
        case OperationError::DUPLICATE_SUBMISSION:      return "DUPLICATE_SUBMISSION";
        case OperationError::ACCOUNT_CREATION_FAILED:   return "ACCOUNT_CREATION_FAILED";
        case OperationError::IDENTIFIER_COLLISION:      return "IDENTIFIER_COLLISION";
        case OperationError::PROVISION_PARTIAL_FAILURE: return "PROVISION_PARTIAL_FAILURE";
        case OperationError::EMAIL_ALREADY_REGISTERED:  return "EMAIL_ALREADY_REGISTERED";
        case OperationError::DIRECTORY_UNAVAILABLE:     return "DIRECTORY_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

} // namespace bank::domain
