#pragma once

#include <IHttpHandler.hpp>
#include "domain/enums/OperationError.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace bank::adapters::primary {

/**
 * @brief HTTP статус для ошибки операции
 */
inline int httpStatusFor(domain::OperationError error) {
    switch (error) {
        case domain::OperationError::INVALID_AMOUNT:
        case domain::OperationError::SAME_ACCOUNT:
            return 400;
        case domain::OperationError::IDENTITY_NOT_FOUND:
        case domain::OperationError::ACCOUNT_NOT_FOUND:
            return 404;
        case domain::OperationError::ACCOUNT_NOT_LINKED:
        case domain::OperationError::DUPLICATE_SUBMISSION:
        case domain::OperationError::IDENTIFIER_COLLISION:
        case domain::OperationError::EMAIL_ALREADY_REGISTERED:
            return 409;
        case domain::OperationError::INSUFFICIENT_FUNDS:
        case domain::OperationError::ENGINE_REJECTED:
            return 422;
        case domain::OperationError::ENGINE_UNAVAILABLE:
        case domain::OperationError::DIRECTORY_UNAVAILABLE:
            return 503;
        default:
            return 500;
    }
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

inline void sendError(IResponse& res, domain::OperationError code, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    error["code"] = domain::toString(code);
    res.setResult(httpStatusFor(code), "application/json", error.dump());
}

} // namespace bank::adapters::primary
