#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IRegistrationService.hpp"
#include "HttpErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bank::adapters::primary {

/**
 * @brief Регистрация пользователя со счётом в леджере
 *
 * POST /api/v1/users
 * {
 *   "email": "ana@example.com",
 *   "first_name": "Ana",
 *   "last_name": "Perez"
 * }
 *
 * 201 — пользователь и счёт созданы,
 * 202 — счёт создан, привязка не записана (PROVISION_PARTIAL_FAILURE).
 */
class RegisterUserHandler : public IHttpHandler {
public:
    explicit RegisterUserHandler(
        std::shared_ptr<ports::input::IRegistrationService> registrationService
    ) : registrationService_(std::move(registrationService))
    {
        std::cout << "[RegisterUserHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string email = body.value("email", "");
            std::string firstName = body.value("first_name", "");
            std::string lastName = body.value("last_name", "");

            if (email.empty() || firstName.empty() || lastName.empty()) {
                sendError(res, 400, "email, first_name and last_name are required");
                return;
            }
            if (email.find('@') == std::string::npos) {
                sendError(res, 400, "Invalid email");
                return;
            }

            auto result = registrationService_->registerUser(email, firstName, lastName);

            if (result.error == domain::OperationError::PROVISION_PARTIAL_FAILURE) {
                nlohmann::json response;
                response["user_id"] = domain::toString(result.userId);
                response["account_id"] = result.accountId;
                response["code"] = domain::toString(result.error);
                response["message"] = result.message;
                res.setResult(202, "application/json", response.dump());
                return;
            }

            if (!result.success) {
                sendError(res, result.error, result.message);
                return;
            }

            nlohmann::json response;
            response["user_id"] = domain::toString(result.userId);
            response["account_id"] = result.accountId;
            response["message"] = result.message;
            res.setResult(201, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        }
    }

private:
    std::shared_ptr<ports::input::IRegistrationService> registrationService_;
};

} // namespace bank::adapters::primary
