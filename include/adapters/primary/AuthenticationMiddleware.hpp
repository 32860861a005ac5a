#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthContext.hpp"
#include "adapters/primary/ErrorResponder.hpp"
#include <memory>
#include <iostream>
#include <string>

namespace catalog::adapters::primary {

/**
 * @brief Middleware аутентификации по Bearer токену
 *
 * При успехе кладёт в attributes:
 * - userId
 * - userActivated ("true" / "false")
 * и оставляет статус 0, чтобы ChainHandler продолжил.
 */
class AuthenticationMiddleware : public IHttpHandler {
public:
    explicit AuthenticationMiddleware(std::shared_ptr<ports::input::IAuthContext> authContext)
        : authContext_(std::move(authContext))
    {
        std::cout << "[AuthenticationMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto user = authContext_->authenticate(req.getHeader("Authorization"));

            req.setAttribute("userId", std::to_string(user.id));
            req.setAttribute("userActivated", user.activated ? "true" : "false");
            res.setStatus(0); // для middleware
        } catch (const domain::DomainError& e) {
            sendDomainError(res, e, "AuthenticationMiddleware");
        } catch (const std::exception& e) {
            std::cerr << "[AuthenticationMiddleware] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthContext> authContext_;
};

/**
 * @brief Пропускает только активированных пользователей
 *
 * Ставится в цепочку после AuthenticationMiddleware.
 */
class ActivatedUserMiddleware : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        if (req.getAttribute("userActivated").value_or("") != "true") {
            sendError(res, 403, "your user account must be activated to access this resource");
            return;
        }
        res.setStatus(0);
    }
};

} // namespace catalog::adapters::primary
