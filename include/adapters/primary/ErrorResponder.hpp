#pragma once

#include <IResponse.hpp>
#include "domain/DomainError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace catalog::adapters::primary {

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief DomainError -> HTTP ответ
 *
 * Единственное место, где вид ошибки превращается в статус.
 * Серверные ошибки логируются и отдаются клиенту без деталей.
 */
inline void sendDomainError(IResponse& res, const domain::DomainError& e, const std::string& component) {
    switch (e.kind()) {
        case domain::ErrorKind::VALIDATION: {
            nlohmann::json error;
            error["error"] = e.what();
            error["fields"] = nlohmann::json::object();
            for (const auto& [field, message] : e.fields()) {
                error["fields"][field] = message;
            }
            res.setResult(422, "application/json", error.dump());
            return;
        }
        case domain::ErrorKind::MISSING_CREDENTIAL:
        case domain::ErrorKind::INVALID_CREDENTIAL:
            sendError(res, 401, e.what());
            res.setHeader("WWW-Authenticate", "Bearer");
            return;
        case domain::ErrorKind::FORBIDDEN:
            sendError(res, 403, e.what());
            return;
        case domain::ErrorKind::NOT_FOUND:
            sendError(res, 404, e.what());
            return;
        case domain::ErrorKind::CONFLICT:
            sendError(res, 409, e.what());
            return;
        case domain::ErrorKind::TIMEOUT:
        case domain::ErrorKind::STORAGE:
        case domain::ErrorKind::GENERATION:
            break;
    }

    std::cerr << "[" << component << "] Error (" << domain::toString(e.kind()) << "): " << e.what() << std::endl;
    sendError(res, 500, "Internal server error");
}

} // namespace catalog::adapters::primary
