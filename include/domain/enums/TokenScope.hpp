#pragma once

#include <string>

namespace catalog::domain {

/**
 * @brief Назначение (scope) токена
 *
 * Разделяет пространство токенов: токен активации нельзя
 * использовать для аутентификации и наоборот.
 * - ACTIVATION — выдаётся при регистрации (3 дня)
 * - AUTHENTICATION — выдаётся при логине (24 часа)
 */
enum class TokenScope {
    ACTIVATION,      ///< Активация аккаунта
    AUTHENTICATION   ///< Bearer токен сессии
};

/**
 * @brief Преобразовать TokenScope в строку (значение колонки tokens.scope)
 */
inline std::string toString(TokenScope scope) {
    switch (scope) {
        case TokenScope::ACTIVATION:     return "activation";
        case TokenScope::AUTHENTICATION: return "authentication";
    }
    return "unknown";
}

} // namespace catalog::domain
