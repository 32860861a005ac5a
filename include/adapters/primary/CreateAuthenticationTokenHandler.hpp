#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IUserService.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace catalog::adapters::primary {

/**
 * @brief Логин пользователя
 *
 * POST /v1/tokens/authentication
 * {
 *   "email": "alice@example.com",
 *   "password": "pa55word"
 * }
 *
 * Response 201:
 * {
 *   "authentication_token": {
 *     "token": "IEYZQUBEMPPAKPOAWTPV6YJ6RM",
 *     "expiry": "2026-10-18T12:00:00Z"
 *   }
 * }
 */
class CreateAuthenticationTokenHandler : public IHttpHandler {
public:
    explicit CreateAuthenticationTokenHandler(
        std::shared_ptr<ports::input::IUserService> userService
    ) : userService_(std::move(userService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto token = userService_->createAuthenticationToken(
                body.value("email", ""),
                body.value("password", "")
            );

            nlohmann::json response;
            response["authentication_token"]["token"] = token.token;
            response["authentication_token"]["expiry"] = token.expiry.toString();
            res.setResult(201, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "CreateAuthenticationTokenHandler");
        } catch (const std::exception& e) {
            std::cerr << "[CreateAuthenticationTokenHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IUserService> userService_;
};

} // namespace catalog::adapters::primary
