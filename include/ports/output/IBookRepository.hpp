#pragma once

#include "domain/Book.hpp"
#include "domain/BookPage.hpp"
#include "domain/Filters.hpp"
#include <cstdint>
#include <optional>

namespace catalog::ports::output {

/**
 * @brief Интерфейс репозитория книг
 */
class IBookRepository {
public:
    virtual ~IBookRepository() = default;

    /**
     * @brief Поиск со страницей и общим количеством из одного запроса
     *
     * Пустой title/author — без фильтра по полю.
     * Порядок: criteria.sort, затем id ASC.
     */
    virtual domain::BookPage search(const domain::SearchCriteria& criteria) = 0;

    virtual std::optional<domain::Book> findById(int64_t id) = 0;

    /**
     * @brief Сохранить новую книгу (id, version, даты заполняются)
     */
    virtual void insert(domain::Book& book) = 0;

    /**
     * @brief Обновить книгу, если version совпадает с прочитанным
     * @throws domain::DomainError CONFLICT если запись изменили или удалили
     */
    virtual void update(domain::Book& book) = 0;

    /**
     * @return false если записи не было
     */
    virtual bool remove(int64_t id) = 0;
};

} // namespace catalog::ports::output
