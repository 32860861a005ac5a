#pragma once

#include "ports/output/IBookRepository.hpp"
#include "adapters/secondary/PostgresSupport.hpp"
#include "adapters/secondary/SearchQueryBuilder.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace catalog::adapters::secondary {

class PostgresBookRepository : public ports::output::IBookRepository {
public:
    /// Колонки, по которым разрешён ORDER BY
    static const std::vector<std::string>& sortableColumns() {
        static const std::vector<std::string> columns = {"id", "title", "author", "published_year"};
        return columns;
    }

    /**
     * @brief UPDATE с optimistic lock: $1..$3 поля, $4 id, $5 ожидаемый version
     *
     * Пустой RETURNING означает, что строку уже изменили или удалили.
     */
    static const std::string& updateStatement() {
        static const std::string sql =
            "UPDATE books"
            " SET title = $1, author = $2, published_year = $3,"
            " version = version + 1, updated_at = NOW()"
            " WHERE id = $4 AND version = $5"
            " RETURNING version, EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch";
        return sql;
    }

    explicit PostgresBookRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresBookRepository] Created for " << settings_->getName() << std::endl;
    }

    domain::BookPage search(const domain::SearchCriteria& criteria) override {
        auto sql = SearchQueryBuilder("books", selectColumns())
            .textMatch("title")
            .textMatch("author")
            .orderBy(criteria.sort, sortableColumns())
            .build();

        return withTransaction(*settings_, "PostgresBookRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                sql,
                criteria.title,
                criteria.author,
                criteria.window.limit,
                criteria.window.offset
            );
            txn.commit();

            // total_records одинаков во всех строках окна
            int64_t totalRecords = 0;
            domain::BookPage page;
            page.books.reserve(result.size());
            for (const auto& row : result) {
                totalRecords = row["total_records"].as<int64_t>();
                page.books.push_back(rowToBook(row));
            }

            page.metadata = domain::calculateMetadata(totalRecords, criteria.page, criteria.pageSize);
            return page;
        });
    }

    std::optional<domain::Book> findById(int64_t id) override {
        return withTransaction(*settings_, "PostgresBookRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT " + joinedSelectColumns() + " FROM books WHERE id = $1",
                id
            );
            txn.commit();

            if (result.empty()) return std::optional<domain::Book>{};
            return std::optional<domain::Book>{rowToBook(result[0])};
        });
    }

    void insert(domain::Book& book) override {
        withTransaction(*settings_, "PostgresBookRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    INSERT INTO books (title, author, published_year)
                    VALUES ($1, $2, $3)
                    RETURNING id, version,
                              EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch,
                              EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch
                )",
                book.title,
                book.author,
                book.publishedYear
            );
            txn.commit();

            const auto& row = result[0];
            book.id = row["id"].as<int64_t>();
            book.version = row["version"].as<int32_t>();
            book.createdAt = domain::Timestamp::fromEpochSeconds(row["created_epoch"].as<int64_t>());
            book.updatedAt = domain::Timestamp::fromEpochSeconds(row["updated_epoch"].as<int64_t>());
        });
    }

    void update(domain::Book& book) override {
        withTransaction(*settings_, "PostgresBookRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                updateStatement(),
                book.title,
                book.author,
                book.publishedYear,
                book.id,
                book.version
            );

            if (result.empty()) {
                throw domain::DomainError::editConflict();
            }
            txn.commit();

            book.version = result[0]["version"].as<int32_t>();
            book.updatedAt = domain::Timestamp::fromEpochSeconds(result[0]["updated_epoch"].as<int64_t>());
        });
    }

    bool remove(int64_t id) override {
        return withTransaction(*settings_, "PostgresBookRepository", [&](pqxx::work& txn) {
            auto result = txn.exec_params("DELETE FROM books WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static std::vector<std::string> selectColumns() {
        return {
            "id", "title", "author", "published_year", "version",
            "EXTRACT(EPOCH FROM created_at)::bigint AS created_epoch",
            "EXTRACT(EPOCH FROM updated_at)::bigint AS updated_epoch"
        };
    }

    static std::string joinedSelectColumns() {
        std::string joined;
        for (const auto& column : selectColumns()) {
            if (!joined.empty()) joined += ", ";
            joined += column;
        }
        return joined;
    }

    static domain::Book rowToBook(const pqxx::row& row) {
        domain::Book book;
        book.id = row["id"].as<int64_t>();
        book.title = row["title"].as<std::string>();
        book.author = row["author"].as<std::string>();
        book.publishedYear = row["published_year"].as<int32_t>();
        book.version = row["version"].as<int32_t>();
        book.createdAt = domain::Timestamp::fromEpochSeconds(row["created_epoch"].as<int64_t>());
        book.updatedAt = domain::Timestamp::fromEpochSeconds(row["updated_epoch"].as<int64_t>());
        return book;
    }
};

} // namespace catalog::adapters::secondary
