#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMoneyMovementService.hpp"
#include "HttpErrors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <limits>

namespace bank::adapters::primary {

/**
 * @brief HTTP Handler движения денег
 *
 * Endpoints:
 * - POST /api/v1/deposits     {user_id, amount, transfer_id?}
 * - POST /api/v1/withdrawals  {user_id, amount, transfer_id?}
 * - POST /api/v1/transfers    {from_user_id, to_user_id, amount, transfer_id?}
 *
 * amount — целое число в минорных единицах.
 * transfer_id — ключ идемпотентности: при повторе после таймаута клиент
 * присылает тот же transfer_id.
 */
class MoneyMovementHandler : public IHttpHandler {
public:
    explicit MoneyMovementHandler(
        std::shared_ptr<ports::input::IMoneyMovementService> movementService
    ) : movementService_(std::move(movementService))
    {
        std::cout << "[MoneyMovementHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string path = extractPath(req.getPath());

        try {
            auto body = nlohmann::json::parse(req.getBody());

            if (path == "/api/v1/deposits") {
                handleSingleSided(body, res, true);
            } else if (path == "/api/v1/withdrawals") {
                handleSingleSided(body, res, false);
            } else if (path == "/api/v1/transfers") {
                handleTransfer(body, res);
            } else {
                sendError(res, 404, "Not found");
            }

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        }
    }

private:
    std::shared_ptr<ports::input::IMoneyMovementService> movementService_;

    std::string extractPath(const std::string& fullPath) {
        size_t pos = fullPath.find('?');
        if (pos != std::string::npos) {
            return fullPath.substr(0, pos);
        }
        return fullPath;
    }

    void handleSingleSided(const nlohmann::json& body, IResponse& res, bool isDeposit) {
        auto userId = domain::parseUserId(body.value("user_id", ""));
        if (!userId) {
            sendError(res, 400, "Valid user_id is required");
            return;
        }

        int64_t amount = 0;
        std::optional<uint64_t> transferId;
        if (!readAmount(body, res, amount) || !readTransferId(body, res, transferId)) {
            return;
        }

        auto result = isDeposit
            ? movementService_->deposit(*userId, amount, transferId)
            : movementService_->withdraw(*userId, amount, transferId);
        sendResult(res, result);
    }

    void handleTransfer(const nlohmann::json& body, IResponse& res) {
        auto fromUserId = domain::parseUserId(body.value("from_user_id", ""));
        auto toUserId = domain::parseUserId(body.value("to_user_id", ""));
        if (!fromUserId || !toUserId) {
            sendError(res, 400, "Valid from_user_id and to_user_id are required");
            return;
        }

        int64_t amount = 0;
        std::optional<uint64_t> transferId;
        if (!readAmount(body, res, amount) || !readTransferId(body, res, transferId)) {
            return;
        }

        sendResult(res, movementService_->transfer(*fromUserId, *toUserId, amount, transferId));
    }

    bool readAmount(const nlohmann::json& body, IResponse& res, int64_t& amount) {
        if (!body.contains("amount") || !body["amount"].is_number_integer()) {
            sendError(res, 400, "Integer amount in minor units is required");
            return false;
        }
        if (body["amount"].is_number_unsigned() &&
            body["amount"].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            sendError(res, 400, "Amount is out of range");
            return false;
        }
        amount = body["amount"].get<int64_t>();
        return true;
    }

    bool readTransferId(const nlohmann::json& body, IResponse& res, std::optional<uint64_t>& transferId) {
        if (!body.contains("transfer_id") || body["transfer_id"].is_null()) {
            return true;
        }
        if (!body["transfer_id"].is_number_unsigned() || body["transfer_id"].get<uint64_t>() == 0) {
            sendError(res, 400, "transfer_id must be a positive integer");
            return false;
        }
        transferId = body["transfer_id"].get<uint64_t>();
        return true;
    }

    void sendResult(IResponse& res, const ports::input::MovementResult& result) {
        if (!result.success) {
            sendError(res, result.error, result.message);
            return;
        }

        nlohmann::json response;
        response["transfer_id"] = result.transferId;
        response["already_applied"] = result.alreadyApplied;
        response["message"] = result.message;
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace bank::adapters::primary
