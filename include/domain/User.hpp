#pragma once

#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>

namespace catalog::domain {

/**
 * @brief Пользователь каталога (владелец токенов)
 *
 * version используется для optimistic-проверки при обновлении.
 */
struct User {
    int64_t id = 0;              ///< BIGSERIAL
    std::string name;
    std::string email;           ///< Уникален без учёта регистра
    std::string passwordHash;    ///< $pbkdf2-sha256$...
    bool activated = false;
    int32_t version = 1;
    Timestamp createdAt;

    User() = default;

    User(const std::string& name,
         const std::string& email,
         const std::string& passwordHash)
        : name(name)
        , email(email)
        , passwordHash(passwordHash)
    {}
};

} // namespace catalog::domain
