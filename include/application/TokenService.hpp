#pragma once

#include "ports/input/ITokenService.hpp"
#include "ports/output/ITokenRepository.hpp"
#include "domain/DomainError.hpp"
#include "utils/TokenCodec.hpp"
#include <memory>
#include <iostream>

namespace catalog::application {

/**
 * @brief Хранилище scoped токенов поверх ITokenRepository
 *
 * Поиск идёт только по SHA-256 от предъявленного секрета.
 * Любая неудача resolve() — один и тот же NOT_FOUND.
 */
class TokenService : public ports::input::ITokenService {
public:
    explicit TokenService(std::shared_ptr<ports::output::ITokenRepository> tokenRepo)
        : tokenRepo_(std::move(tokenRepo))
    {
        std::cout << "[TokenService] Created" << std::endl;
    }

    domain::IssuedToken issue(int64_t userId, std::chrono::seconds ttl, domain::TokenScope scope) override {
        auto issued = utils::TokenCodec::issue(userId, ttl, scope);
        tokenRepo_->insert(issued.token);
        return issued;
    }

    domain::User resolve(domain::TokenScope scope, const std::string& plaintext) override {
        auto hash = utils::TokenCodec::hash(plaintext);
        auto user = tokenRepo_->findUserByToken(scope, hash, std::chrono::system_clock::now());
        if (!user) {
            throw domain::DomainError::notFound();
        }
        return *user;
    }

    void deleteAllForUser(domain::TokenScope scope, int64_t userId) override {
        tokenRepo_->deleteAllForUser(scope, userId);
    }

    std::size_t purgeExpired() override {
        auto removed = tokenRepo_->deleteExpired(std::chrono::system_clock::now());
        std::cout << "[TokenService] Purged " << removed << " expired tokens" << std::endl;
        return removed;
    }

private:
    std::shared_ptr<ports::output::ITokenRepository> tokenRepo_;
};

} // namespace catalog::application
