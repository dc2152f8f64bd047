#pragma once

#include "ports/input/IRegistrationService.hpp"
#include "ports/input/IAccountProvisioner.hpp"
#include "ports/output/IUserRepository.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <iostream>

namespace bank::application {

/**
 * @brief Сервис регистрации пользователей
 *
 * Создаёт запись в справочнике и сразу провижинит счёт.
 * Откат записи при отказе леджера выполняет AccountProvisioner.
 */
class RegistrationService : public ports::input::IRegistrationService {
public:
    RegistrationService(
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::input::IAccountProvisioner> provisioner
    ) : userRepo_(std::move(userRepo))
      , provisioner_(std::move(provisioner))
    {
        std::cout << "[RegistrationService] Created" << std::endl;
    }

    ports::input::RegistrationResult registerUser(
        const std::string& email,
        const std::string& firstName,
        const std::string& lastName) override
    {
        ports::input::RegistrationResult result;

        if (userRepo_->findByEmail(email)) {
            result.error = domain::OperationError::EMAIL_ALREADY_REGISTERED;
            result.message = "Email already registered";
            return result;
        }

        domain::User user(utils::UuidGenerator::generate(), email, firstName, lastName);
        try {
            userRepo_->save(user);
        } catch (const std::exception& e) {
            std::cerr << "[RegistrationService] Failed to save user " << email << ": " << e.what() << std::endl;
            result.error = domain::OperationError::DIRECTORY_UNAVAILABLE;
            result.message = "Failed to create user";
            return result;
        }

        std::cout << "[RegistrationService] User " << domain::toString(user.userId)
                  << " created, provisioning ledger account" << std::endl;

        auto provisioned = provisioner_->provision(user.userId);

        result.success = provisioned.success;
        result.userId = user.userId;
        result.accountId = provisioned.accountId;
        result.error = provisioned.error;
        result.message = provisioned.message;
        return result;
    }

private:
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::input::IAccountProvisioner> provisioner_;
};

} // namespace bank::application
