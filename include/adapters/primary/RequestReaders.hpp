#pragma once

#include <IRequest.hpp>
#include "domain/Validator.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace catalog::adapters::primary {

/**
 * @brief ID из пути (/v1/books/{id}); nullopt если не число или < 1
 */
inline std::optional<int64_t> readIdParam(IRequest& req) {
    auto raw = req.getPathParam(0).value_or("");
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        int64_t id = std::stoll(raw, &pos);
        if (pos != raw.size() || id < 1) {
            return std::nullopt;
        }
        return id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

inline std::string readString(IRequest& req, const std::string& key, const std::string& defaultValue) {
    auto value = req.getQueryParam(key);
    if (!value || value->empty()) {
        return defaultValue;
    }
    return *value;
}

/**
 * @brief Целое из query string; при ошибке — запись в validator
 */
inline int readInt(IRequest& req, const std::string& key, int defaultValue, domain::Validator& v) {
    auto value = req.getQueryParam(key);
    if (!value || value->empty()) {
        return defaultValue;
    }
    try {
        std::size_t pos = 0;
        int result = std::stoi(*value, &pos);
        if (pos != value->size()) {
            v.addError(key, "must be an integer value");
            return defaultValue;
        }
        return result;
    } catch (const std::exception&) {
        v.addError(key, "must be an integer value");
        return defaultValue;
    }
}

} // namespace catalog::adapters::primary
