#pragma once

#include "domain/Book.hpp"
#include "domain/Pagination.hpp"
#include "domain/User.hpp"
#include <nlohmann/json.hpp>

namespace catalog::adapters::primary {

inline nlohmann::json bookToJson(const domain::Book& book) {
    nlohmann::json j;
    j["id"] = book.id;
    j["title"] = book.title;
    j["author"] = book.author;
    j["publishedYear"] = book.publishedYear;
    j["version"] = book.version;
    j["createdAt"] = book.createdAt.toString();
    j["updatedAt"] = book.updatedAt.toString();
    return j;
}

/**
 * @brief Публичные поля пользователя (без password_hash)
 */
inline nlohmann::json userToJson(const domain::User& user) {
    nlohmann::json j;
    j["id"] = user.id;
    j["name"] = user.name;
    j["email"] = user.email;
    j["activated"] = user.activated;
    j["created_at"] = user.createdAt.toString();
    return j;
}

/**
 * @brief Пустые метаданные (нет записей) сериализуются в {}
 */
inline nlohmann::json metadataToJson(const domain::Metadata& metadata) {
    if (metadata.totalRecords == 0) {
        return nlohmann::json::object();
    }
    nlohmann::json j;
    j["current_page"] = metadata.currentPage;
    j["page_size"] = metadata.pageSize;
    j["first_page"] = metadata.firstPage;
    j["last_page"] = metadata.lastPage;
    j["total_records"] = metadata.totalRecords;
    return j;
}

} // namespace catalog::adapters::primary
