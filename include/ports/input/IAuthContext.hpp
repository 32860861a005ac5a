#pragma once

#include "domain/User.hpp"
#include <optional>
#include <string>

namespace catalog::ports::input {

/**
 * @brief Единая точка аутентификации защищённых запросов
 */
class IAuthContext {
public:
    virtual ~IAuthContext() = default;

    /**
     * @brief Заголовок Authorization -> пользователь
     *
     * @param authorizationHeader значение заголовка (nullopt если нет)
     * @throws domain::DomainError MISSING_CREDENTIAL если заголовка нет
     *         или он не вида "Bearer <token>"
     * @throws domain::DomainError INVALID_CREDENTIAL если токен не найден
     */
    virtual domain::User authenticate(const std::optional<std::string>& authorizationHeader) = 0;
};

} // namespace catalog::ports::input
