#pragma once

#include "domain/enums/TokenScope.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace catalog::domain {

/**
 * @brief Сохраняемая часть токена
 *
 * Исходный секрет сюда не попадает: в хранилище лежит только
 * SHA-256 от него (hex, 64 символа).
 */
struct Token {
    std::string hash;                                   ///< SHA-256(plaintext), hex
    int64_t userId = 0;                                 ///< Владелец токена
    std::chrono::system_clock::time_point expiry;       ///< Время истечения
    TokenScope scope = TokenScope::AUTHENTICATION;      ///< Назначение

    bool isExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const {
        return expiry <= now;
    }
};

/**
 * @brief Результат выпуска токена
 *
 * plaintext отдаётся клиенту ровно один раз, в ответе на выпуск.
 */
struct IssuedToken {
    std::string plaintext;   ///< base32 без паддинга, 26 символов
    Token token;
};

} // namespace catalog::domain
