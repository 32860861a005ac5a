#pragma once

#include "domain/Token.hpp"
#include "domain/User.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace catalog::ports::input {

/**
 * @brief Выпуск, проверка и отзыв scoped токенов
 */
class ITokenService {
public:
    virtual ~ITokenService() = default;

    /**
     * @brief Выпустить и сохранить токен
     *
     * Возвращённый plaintext больше нигде не хранится.
     * @throws domain::DomainError GENERATION, CONFLICT, TIMEOUT, STORAGE
     */
    virtual domain::IssuedToken issue(int64_t userId, std::chrono::seconds ttl, domain::TokenScope scope) = 0;

    /**
     * @brief Найти владельца токена
     *
     * Неверный scope, истёкший и неизвестный токен неразличимы.
     * @throws domain::DomainError NOT_FOUND
     */
    virtual domain::User resolve(domain::TokenScope scope, const std::string& plaintext) = 0;

    /**
     * @brief Удалить все токены пользователя с данным scope
     */
    virtual void deleteAllForUser(domain::TokenScope scope, int64_t userId) = 0;

    /**
     * @brief Удалить все истёкшие токены
     * @return количество удалённых
     */
    virtual std::size_t purgeExpired() = 0;
};

} // namespace catalog::ports::input
