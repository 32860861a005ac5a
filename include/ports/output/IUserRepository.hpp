#pragma once

#include "domain/User.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace catalog::ports::output {

/**
 * @brief Интерфейс репозитория пользователей
 *
 * Output Port для работы с хранилищем пользователей.
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /**
     * @brief Сохранить нового пользователя
     * @param user Пользователь (id, version, createdAt заполняются)
     * @throws domain::DomainError CONFLICT если email уже занят
     */
    virtual void insert(domain::User& user) = 0;

    /**
     * @brief Найти пользователя по email (без учёта регистра)
     */
    virtual std::optional<domain::User> findByEmail(const std::string& email) = 0;

    /**
     * @brief Обновить пользователя, если version не изменился
     *
     * При успехе user.version увеличивается.
     * @throws domain::DomainError CONFLICT при расхождении версии
     */
    virtual void update(domain::User& user) = 0;

    /**
     * @brief Удалить пользователя вместе с его токенами
     * @return false если пользователя не было
     */
    virtual bool remove(int64_t id) = 0;
};

} // namespace catalog::ports::output
