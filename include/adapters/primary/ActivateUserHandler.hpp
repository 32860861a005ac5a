#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IUserService.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace catalog::adapters::primary {

/**
 * @brief Активация аккаунта
 *
 * PUT /v1/users/activated
 * { "token": "Y3QMGX3PJ3WLRL2YRTQGQ6KRHU" }
 */
class ActivateUserHandler : public IHttpHandler {
public:
    explicit ActivateUserHandler(
        std::shared_ptr<ports::input::IUserService> userService
    ) : userService_(std::move(userService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto user = userService_->activateUser(body.value("token", ""));

            nlohmann::json response;
            response["user"] = userToJson(user);
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "ActivateUserHandler");
        } catch (const std::exception& e) {
            std::cerr << "[ActivateUserHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IUserService> userService_;
};

} // namespace catalog::adapters::primary
