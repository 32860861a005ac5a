#pragma once

#include "domain/Book.hpp"
#include "domain/BookPage.hpp"
#include "domain/Filters.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace catalog::ports::input {

/**
 * @brief Интерфейс сервиса каталога книг
 */
class IBookService {
public:
    virtual ~IBookService() = default;

    /**
     * @brief Поиск с пагинацией
     * @throws domain::DomainError VALIDATION (page, page_size, sort)
     */
    virtual domain::BookPage listBooks(
        const std::string& title,
        const std::string& author,
        const domain::Filters& filters
    ) = 0;

    /**
     * @throws domain::DomainError NOT_FOUND
     */
    virtual domain::Book getBook(int64_t id) = 0;

    /**
     * @throws domain::DomainError VALIDATION
     */
    virtual domain::Book createBook(
        const std::string& title,
        const std::string& author,
        int32_t publishedYear
    ) = 0;

    /**
     * @brief Частичное обновление
     *
     * @param expectedVersion версия, которую видел клиент (если передал)
     * @throws domain::DomainError NOT_FOUND, VALIDATION, CONFLICT
     */
    virtual domain::Book updateBook(
        int64_t id,
        const domain::BookPatch& patch,
        std::optional<int32_t> expectedVersion
    ) = 0;

    /**
     * @return удалённая книга
     * @throws domain::DomainError NOT_FOUND
     */
    virtual domain::Book deleteBook(int64_t id) = 0;
};

} // namespace catalog::ports::input
