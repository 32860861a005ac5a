#pragma once

#include "domain/DomainError.hpp"
#include <regex>
#include <string>

namespace catalog::domain {

/**
 * @brief Сборщик ошибок валидации по полям
 *
 * Первая ошибка для поля выигрывает, последующие игнорируются.
 */
class Validator {
public:
    bool valid() const { return errors_.empty(); }

    const DomainError::FieldErrors& errors() const { return errors_; }

    void addError(const std::string& field, const std::string& message) {
        errors_.emplace(field, message);
    }

    void check(bool ok, const std::string& field, const std::string& message) {
        if (!ok) {
            addError(field, message);
        }
    }

    /**
     * @brief Бросить DomainError(VALIDATION), если есть ошибки
     */
    void throwIfInvalid() const {
        if (!valid()) {
            throw DomainError::validation(errors_);
        }
    }

    static bool matchesEmail(const std::string& value) {
        static const std::regex emailRx(
            R"(^[a-zA-Z0-9.!#$%&'*+/=?^_`{|}~-]+@[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?(?:\.[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?)*$)");
        return std::regex_match(value, emailRx);
    }

private:
    DomainError::FieldErrors errors_;
};

} // namespace catalog::domain
