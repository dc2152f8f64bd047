#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>

namespace bank::adapters::primary {

/**
 * @brief Health check handler
 *
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "bank-service";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace bank::adapters::primary
