#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBalanceService.hpp"
#include "HttpErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bank::adapters::primary {

/**
 * @brief GET /api/v1/balance/{user_id} — баланс пользователя
 *
 * Роутер регистрирует с паттерном "/api/v1/balance/*"
 */
class BalanceHandler : public IHttpHandler {
public:
    explicit BalanceHandler(
        std::shared_ptr<ports::input::IBalanceService> balanceService
    ) : balanceService_(std::move(balanceService))
    {
        std::cout << "[BalanceHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto userId = domain::parseUserId(req.getPathParam(0).value_or(""));
        if (!userId) {
            sendError(res, 400, "Valid user id is required");
            return;
        }

        auto result = balanceService_->balance(*userId);
        if (!result.success) {
            sendError(res, result.error, result.message);
            return;
        }

        nlohmann::json response;
        response["user_id"] = domain::toString(*userId);
        response["balance"] = result.balance;
        response["degraded"] = result.degraded;
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IBalanceService> balanceService_;
};

} // namespace bank::adapters::primary
