#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace catalog::domain {

/**
 * @brief Вид ошибки бизнес-логики
 *
 * Закрытый набор. Primary adapters делают switch по виду ошибки
 * и сами решают, какой HTTP статус вернуть клиенту.
 */
enum class ErrorKind {
    VALIDATION,           ///< Некорректный ввод клиента (поле -> сообщение)
    MISSING_CREDENTIAL,   ///< Нет Bearer токена
    INVALID_CREDENTIAL,   ///< Токен неверный, истёк или другого scope
    FORBIDDEN,            ///< Аккаунт не активирован
    NOT_FOUND,            ///< Запись не найдена
    CONFLICT,             ///< Конфликт версий / коллизия хэша
    TIMEOUT,              ///< Истёк дедлайн операции с хранилищем
    STORAGE,              ///< Ошибка хранилища (соединение, SQL)
    GENERATION            ///< Нет источника энтропии
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:         return "validation";
        case ErrorKind::MISSING_CREDENTIAL: return "missing_credential";
        case ErrorKind::INVALID_CREDENTIAL: return "invalid_credential";
        case ErrorKind::FORBIDDEN:          return "forbidden";
        case ErrorKind::NOT_FOUND:          return "not_found";
        case ErrorKind::CONFLICT:           return "conflict";
        case ErrorKind::TIMEOUT:            return "timeout";
        case ErrorKind::STORAGE:            return "storage";
        case ErrorKind::GENERATION:         return "generation";
    }
    return "unknown";
}

/**
 * @brief Исключение бизнес-логики с видом ошибки
 *
 * Для VALIDATION дополнительно хранит ошибки по полям.
 */
class DomainError : public std::runtime_error {
public:
    using FieldErrors = std::map<std::string, std::string>;

    DomainError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    DomainError(ErrorKind kind, const std::string& message, FieldErrors fields)
        : std::runtime_error(message), kind_(kind), fields_(std::move(fields)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const FieldErrors& fields() const noexcept { return fields_; }

    // ---- фабрики ----

    static DomainError validation(FieldErrors fields) {
        return DomainError(ErrorKind::VALIDATION, "failed validation", std::move(fields));
    }

    static DomainError validation(const std::string& field, const std::string& message) {
        return validation(FieldErrors{{field, message}});
    }

    static DomainError notFound() {
        return DomainError(ErrorKind::NOT_FOUND, "the requested resource could not be found");
    }

    static DomainError conflict(const std::string& message) {
        return DomainError(ErrorKind::CONFLICT, message);
    }

    static DomainError editConflict() {
        return conflict("unable to update the record due to an edit conflict, please try again");
    }

    static DomainError missingCredential() {
        return DomainError(ErrorKind::MISSING_CREDENTIAL, "invalid or missing authentication token");
    }

    static DomainError invalidCredential() {
        return DomainError(ErrorKind::INVALID_CREDENTIAL, "invalid or missing authentication token");
    }

private:
    ErrorKind kind_;
    FieldErrors fields_;
};

} // namespace catalog::domain
