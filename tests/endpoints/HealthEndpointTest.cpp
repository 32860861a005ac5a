/**
 * @file HealthEndpointTest.cpp
 * @brief GET /health
 */

#include <gtest/gtest.h>

#include "adapters/primary/HealthHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using catalog::adapters::primary::HealthHandler;

TEST(HealthEndpointTest, ReportsAvailableWithVersion)
{
    HealthHandler handler;
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "available");
    EXPECT_EQ(json["system_info"]["service"], "catalog-service");
    EXPECT_EQ(json["system_info"]["version"], "1.0.0");
}
