#pragma once

#include "domain/Token.hpp"
#include "domain/User.hpp"
#include <string>

namespace catalog::ports::input {

/**
 * @brief Результат регистрации
 */
struct RegisterResult {
    domain::User user;
    std::string activationToken;   ///< plaintext, только в этом ответе
};

/**
 * @brief Выданный токен аутентификации
 */
struct AuthenticationToken {
    std::string token;
    domain::Timestamp expiry;
};

/**
 * @brief Интерфейс сервиса пользователей
 */
class IUserService {
public:
    virtual ~IUserService() = default;

    /**
     * @brief Регистрация + токен активации
     * @throws domain::DomainError VALIDATION (в т.ч. занятый email)
     */
    virtual RegisterResult registerUser(
        const std::string& name,
        const std::string& email,
        const std::string& password
    ) = 0;

    /**
     * @brief Активация по токену; все токены активации удаляются
     * @throws domain::DomainError VALIDATION, CONFLICT
     */
    virtual domain::User activateUser(const std::string& tokenPlaintext) = 0;

    /**
     * @brief Логин: email + пароль -> bearer токен
     * @throws domain::DomainError VALIDATION, INVALID_CREDENTIAL
     */
    virtual AuthenticationToken createAuthenticationToken(
        const std::string& email,
        const std::string& password
    ) = 0;
};

} // namespace catalog::ports::input
