#pragma once

#include "domain/Book.hpp"
#include "domain/Pagination.hpp"
#include <vector>

namespace catalog::domain {

/**
 * @brief Страница результатов поиска + метаданные
 *
 * books и metadata получены из одного запроса.
 */
struct BookPage {
    std::vector<Book> books;
    Metadata metadata;
};

} // namespace catalog::domain
