#pragma once

#include "ports/input/IAuthContext.hpp"
#include "ports/input/ITokenService.hpp"
#include "domain/DomainError.hpp"
#include "utils/TokenCodec.hpp"
#include <memory>
#include <iostream>

namespace catalog::application {

/**
 * @brief Аутентификация по заголовку Authorization: Bearer <token>
 *
 * Принимается только токен со scope AUTHENTICATION.
 */
class AuthContext : public ports::input::IAuthContext {
public:
    explicit AuthContext(std::shared_ptr<ports::input::ITokenService> tokenService)
        : tokenService_(std::move(tokenService))
    {
        std::cout << "[AuthContext] Created" << std::endl;
    }

    domain::User authenticate(const std::optional<std::string>& authorizationHeader) override {
        auto token = extractBearer(authorizationHeader);
        if (!token) {
            throw domain::DomainError::missingCredential();
        }

        if (!utils::TokenCodec::isWellFormed(*token)) {
            throw domain::DomainError::invalidCredential();
        }

        try {
            return tokenService_->resolve(domain::TokenScope::AUTHENTICATION, *token);
        } catch (const domain::DomainError& e) {
            if (e.kind() == domain::ErrorKind::NOT_FOUND) {
                throw domain::DomainError::invalidCredential();
            }
            throw;
        }
    }

    /**
     * @brief "Bearer <token>" -> token
     * @return nullopt для отсутствующего или кривого заголовка
     */
    static std::optional<std::string> extractBearer(const std::optional<std::string>& header) {
        if (!header) {
            return std::nullopt;
        }

        const std::string prefix = "Bearer ";
        const std::string& value = *header;
        if (value.size() <= prefix.size() || value.compare(0, prefix.size(), prefix) != 0) {
            return std::nullopt;
        }

        auto token = value.substr(prefix.size());
        if (token.find(' ') != std::string::npos) {
            return std::nullopt;
        }
        return token;
    }

private:
    std::shared_ptr<ports::input::ITokenService> tokenService_;
};

} // namespace catalog::application
