#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAccountProvisioner.hpp"
#include "HttpErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bank::adapters::primary {

/**
 * @brief POST /api/v1/accounts/{user_id} — счёт в леджере для существующего пользователя
 *
 * Роутер регистрирует с паттерном "/api/v1/accounts/*".
 * Повтор после 202 от регистрации подхватывает уже созданный счёт
 * и дописывает привязку. Для привязанного пользователя возвращает
 * существующий счёт.
 */
class ProvisionAccountHandler : public IHttpHandler {
public:
    explicit ProvisionAccountHandler(
        std::shared_ptr<ports::input::IAccountProvisioner> provisioner
    ) : provisioner_(std::move(provisioner))
    {
        std::cout << "[ProvisionAccountHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto userId = domain::parseUserId(req.getPathParam(0).value_or(""));
        if (!userId) {
            sendError(res, 400, "Valid user id is required");
            return;
        }

        auto result = provisioner_->provision(*userId);

        nlohmann::json response;
        response["user_id"] = domain::toString(*userId);

        if (result.error == domain::OperationError::PROVISION_PARTIAL_FAILURE) {
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

        response["account_id"] = result.accountId;
        response["message"] = result.message;
        res.setResult(201, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IAccountProvisioner> provisioner_;
};

} // namespace bank::adapters::primary
