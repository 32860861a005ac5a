#pragma once

#include <IHttpHandler.hpp>
#include "ServiceInfo.hpp"
#include <nlohmann/json.hpp>

namespace catalog::adapters::primary {

/**
 * @brief GET /health, без аутентификации
 *
 * { "status": "available", "system_info": { "service": ..., "version": ... } }
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& /*req*/, IResponse& res) override {
        nlohmann::json body;
        body["status"] = "available";
        body["system_info"] = {
            {"service", kServiceName},
            {"version", kServiceVersion}
        };
        res.setResult(200, "application/json", body.dump());
    }
};

} // namespace catalog::adapters::primary
