#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IUserService.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include "adapters/primary/JsonMappers.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace catalog::adapters::primary {

/**
 * @brief Регистрация пользователя
 *
 * POST /v1/users
 * {
 *   "name": "Alice",
 *   "email": "alice@example.com",
 *   "password": "pa55word"
 * }
 *
 * Response 201:
 * {
 *   "token": "Y3QMGX3PJ3WLRL2YRTQGQ6KRHU",   // токен активации, больше нигде не отдаётся
 *   "user": { "id": 1, "name": "Alice", ... }
 * }
 */
class RegisterUserHandler : public IHttpHandler {
public:
    explicit RegisterUserHandler(
        std::shared_ptr<ports::input::IUserService> userService
    ) : userService_(std::move(userService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto result = userService_->registerUser(
                body.value("name", ""),
                body.value("email", ""),
                body.value("password", "")
            );

            nlohmann::json response;
            response["token"] = result.activationToken;
            response["user"] = userToJson(result.user);

            res.setResult(201, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "RegisterUserHandler");
        } catch (const std::exception& e) {
            std::cerr << "[RegisterUserHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IUserService> userService_;
};

} // namespace catalog::adapters::primary
