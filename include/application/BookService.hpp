#pragma once

#include "ports/input/IBookService.hpp"
#include "ports/output/IBookRepository.hpp"
#include "settings/PaginationSettings.hpp"
#include "domain/DomainError.hpp"
#include "domain/Validator.hpp"
#include <memory>
#include <iostream>

namespace catalog::application {

/**
 * @brief Сервис каталога книг
 *
 * Фильтры листинга проверяются здесь, до обращения к репозиторию:
 * репозиторий получает только SearchCriteria.
 */
class BookService : public ports::input::IBookService {
public:
    BookService(
        std::shared_ptr<settings::PaginationSettings> settings,
        std::shared_ptr<ports::output::IBookRepository> bookRepo
    ) : settings_(std::move(settings))
      , bookRepo_(std::move(bookRepo))
    {
        std::cout << "[BookService] Created" << std::endl;
    }

    domain::BookPage listBooks(
        const std::string& title,
        const std::string& author,
        const domain::Filters& filters
    ) override {
        auto criteria = domain::SearchCriteria::from(title, author, filters, settings_->getMaxPageSize());
        return bookRepo_->search(criteria);
    }

    domain::Book getBook(int64_t id) override {
        if (id < 1) {
            throw domain::DomainError::notFound();
        }
        auto book = bookRepo_->findById(id);
        if (!book) {
            throw domain::DomainError::notFound();
        }
        return *book;
    }

    domain::Book createBook(
        const std::string& title,
        const std::string& author,
        int32_t publishedYear
    ) override {
        domain::Book book;
        book.title = title;
        book.author = author;
        book.publishedYear = publishedYear;

        domain::Validator v;
        validateBook(v, book);
        v.throwIfInvalid();

        bookRepo_->insert(book);
        std::cout << "[BookService] Created book " << book.id << std::endl;
        return book;
    }

    domain::Book updateBook(
        int64_t id,
        const domain::BookPatch& patch,
        std::optional<int32_t> expectedVersion
    ) override {
        auto book = getBook(id);

        if (expectedVersion && *expectedVersion != book.version) {
            throw domain::DomainError::editConflict();
        }

        if (patch.title) book.title = *patch.title;
        if (patch.author) book.author = *patch.author;
        if (patch.publishedYear) book.publishedYear = *patch.publishedYear;

        domain::Validator v;
        validateBook(v, book);
        v.throwIfInvalid();

        // UPDATE ... WHERE version = <прочитанная>, иначе CONFLICT
        bookRepo_->update(book);
        return book;
    }

    domain::Book deleteBook(int64_t id) override {
        auto book = getBook(id);
        if (!bookRepo_->remove(id)) {
            throw domain::DomainError::notFound();
        }
        std::cout << "[BookService] Deleted book " << id << std::endl;
        return book;
    }

    static void validateBook(domain::Validator& v, const domain::Book& book) {
        v.check(!book.title.empty(), "title", "must be provided");
        v.check(book.title.size() <= 100, "title", "must not be more than 100 bytes long");
        v.check(book.author.size() <= 100, "author", "must not be more than 100 bytes long");
        v.check(book.publishedYear >= 0, "publishedYear", "must not be negative");
    }

private:
    std::shared_ptr<settings::PaginationSettings> settings_;
    std::shared_ptr<ports::output::IBookRepository> bookRepo_;
};

} // namespace catalog::application
