#pragma once

#include "domain/Token.hpp"
#include "domain/User.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace catalog::ports::output {

/**
 * @brief Интерфейс хранилища токенов
 *
 * Ключ — hash. Сам секрет сюда никогда не передаётся.
 */
class ITokenRepository {
public:
    virtual ~ITokenRepository() = default;

    /**
     * @brief Сохранить токен
     * @throws domain::DomainError CONFLICT при совпадении hash
     */
    virtual void insert(const domain::Token& token) = 0;

    /**
     * @brief Найти владельца токена
     *
     * Совпадение по hash И scope И expiry > now.
     * @return User или nullopt (без уточнения причины)
     */
    virtual std::optional<domain::User> findUserByToken(
        domain::TokenScope scope,
        const std::string& hash,
        std::chrono::system_clock::time_point now) = 0;

    /**
     * @brief Удалить все токены пользователя с данным scope
     *
     * Идемпотентно, ноль удалённых строк — не ошибка.
     */
    virtual void deleteAllForUser(domain::TokenScope scope, int64_t userId) = 0;

    /**
     * @brief Удалить истёкшие токены
     * @return сколько удалено
     */
    virtual std::size_t deleteExpired(std::chrono::system_clock::time_point now) = 0;
};

} // namespace catalog::ports::output
