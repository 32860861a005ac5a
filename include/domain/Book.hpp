#pragma once

#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace catalog::domain {

/**
 * @brief Книга — запись каталога
 */
struct Book {
    int64_t id = 0;
    std::string title;
    std::string author;
    int32_t publishedYear = 0;
    int32_t version = 1;         ///< Растёт на каждом успешном UPDATE
    Timestamp createdAt;
    Timestamp updatedAt;
};

/**
 * @brief Частичное обновление книги (PATCH)
 *
 * Незаданные поля не меняются.
 */
struct BookPatch {
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::optional<int32_t> publishedYear;
};

} // namespace catalog::domain
