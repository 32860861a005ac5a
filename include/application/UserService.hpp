#pragma once

#include "ports/input/IUserService.hpp"
#include "ports/input/ITokenService.hpp"
#include "ports/output/IUserRepository.hpp"
#include "settings/AuthSettings.hpp"
#include "domain/DomainError.hpp"
#include "domain/Validator.hpp"
#include "utils/PasswordHasher.hpp"
#include "utils/TokenCodec.hpp"
#include <memory>
#include <iostream>

namespace catalog::application {

/**
 * @brief Регистрация, активация и логин пользователей
 */
class UserService : public ports::input::IUserService {
public:
    UserService(
        std::shared_ptr<settings::AuthSettings> settings,
        std::shared_ptr<ports::output::IUserRepository> userRepo,
        std::shared_ptr<ports::input::ITokenService> tokenService
    ) : settings_(std::move(settings))
      , userRepo_(std::move(userRepo))
      , tokenService_(std::move(tokenService))
    {
        std::cout << "[UserService] Created" << std::endl;
    }

    ports::input::RegisterResult registerUser(
        const std::string& name,
        const std::string& email,
        const std::string& password
    ) override {
        domain::Validator v;
        v.check(!name.empty(), "name", "must be provided");
        v.check(name.size() <= 500, "name", "must not be more than 500 bytes long");
        validateEmail(v, email);
        validatePasswordPlaintext(v, password);
        v.throwIfInvalid();

        domain::User user(name, email, utils::PasswordHasher::hash(password));
        user.activated = false;

        try {
            userRepo_->insert(user);
        } catch (const domain::DomainError& e) {
            if (e.kind() == domain::ErrorKind::CONFLICT) {
                throw domain::DomainError::validation("email", "a user with this email address already exists");
            }
            throw;
        }

        // Без токена активации аккаунт бесполезен и занимает email
        domain::IssuedToken issued;
        try {
            issued = tokenService_->issue(
                user.id,
                std::chrono::seconds(settings_->getActivationTokenLifetimeSeconds()),
                domain::TokenScope::ACTIVATION
            );
        } catch (const domain::DomainError& e) {
            std::cerr << "[UserService] Activation token for user " << user.id
                      << " failed: " << e.what() << ", removing user" << std::endl;
            discardUser(user.id);
            throw;
        }

        std::cout << "[UserService] Registered user " << user.id << std::endl;
        return {user, issued.plaintext};
    }

    domain::User activateUser(const std::string& tokenPlaintext) override {
        domain::Validator v;
        validateTokenPlaintext(v, tokenPlaintext);
        v.throwIfInvalid();

        domain::User user;
        try {
            user = tokenService_->resolve(domain::TokenScope::ACTIVATION, tokenPlaintext);
        } catch (const domain::DomainError& e) {
            if (e.kind() == domain::ErrorKind::NOT_FOUND) {
                throw domain::DomainError::validation("token", "invalid or expired activation token");
            }
            throw;
        }

        user.activated = true;
        userRepo_->update(user);

        // Токены активации больше не нужны
        tokenService_->deleteAllForUser(domain::TokenScope::ACTIVATION, user.id);

        std::cout << "[UserService] Activated user " << user.id << std::endl;
        return user;
    }

    ports::input::AuthenticationToken createAuthenticationToken(
        const std::string& email,
        const std::string& password
    ) override {
        domain::Validator v;
        validateEmail(v, email);
        validatePasswordPlaintext(v, password);
        v.throwIfInvalid();

        auto user = userRepo_->findByEmail(email);
        // Для неизвестного email тоже считаем PBKDF2, чтобы время ответа не выдавало регистрацию
        const std::string& encoded = user ? user->passwordHash : decoyPasswordHash();
        bool passwordOk = utils::PasswordHasher::verify(password, encoded);
        if (!user || !passwordOk) {
            throw domain::DomainError(domain::ErrorKind::INVALID_CREDENTIAL, "invalid authentication credentials");
        }

        auto issued = tokenService_->issue(
            user->id,
            std::chrono::seconds(settings_->getAuthenticationTokenLifetimeSeconds()),
            domain::TokenScope::AUTHENTICATION
        );

        return {issued.plaintext, domain::Timestamp(issued.token.expiry)};
    }

    /**
     * @brief Хэш, с которым сверяется пароль при неизвестном email
     *
     * Те же параметры PBKDF2, что и у настоящих паролей.
     */
    static const std::string& decoyPasswordHash() {
        static const std::string encoded = utils::PasswordHasher::hash("catalog-decoy-password");
        return encoded;
    }

private:
    std::shared_ptr<settings::AuthSettings> settings_;
    std::shared_ptr<ports::output::IUserRepository> userRepo_;
    std::shared_ptr<ports::input::ITokenService> tokenService_;

    void discardUser(int64_t id) {
        try {
            userRepo_->remove(id);
        } catch (const domain::DomainError& e) {
            std::cerr << "[UserService] Failed to remove user " << id << ": " << e.what() << std::endl;
        }
    }

    static void validateEmail(domain::Validator& v, const std::string& email) {
        v.check(!email.empty(), "email", "must be provided");
        v.check(domain::Validator::matchesEmail(email), "email", "must be a valid email address");
    }

    static void validatePasswordPlaintext(domain::Validator& v, const std::string& password) {
        v.check(!password.empty(), "password", "must be provided");
        v.check(password.size() >= 8, "password", "must be at least 8 bytes long");
        v.check(password.size() <= 72, "password", "must not be more than 72 bytes long");
    }

    static void validateTokenPlaintext(domain::Validator& v, const std::string& token) {
        v.check(!token.empty(), "token", "must be provided");
        v.check(utils::TokenCodec::isWellFormed(token), "token", "must be 26 bytes long");
    }
};

} // namespace catalog::application
