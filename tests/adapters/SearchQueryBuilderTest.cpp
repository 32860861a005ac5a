/**
 * @file SearchQueryBuilderTest.cpp
 * @brief Тексты SQL, которые собирает SearchQueryBuilder
 */

#include <gtest/gtest.h>

#include "adapters/secondary/SearchQueryBuilder.hpp"
#include "adapters/secondary/PostgresBookRepository.hpp"

using namespace catalog;
using catalog::adapters::secondary::SearchQueryBuilder;
using catalog::adapters::secondary::PostgresBookRepository;

namespace {

domain::SortSpec sortBy(const std::string& key) {
    return domain::SortSpec::validate(
        key, domain::SortSafelist::bothDirections({"id", "title", "author", "published_year"}));
}

} // namespace

TEST(SearchQueryBuilderTest, BooksQuery_FullText) {
    auto sql = SearchQueryBuilder("books", {"id", "title"})
        .textMatch("title")
        .textMatch("author")
        .orderBy(sortBy("-title"), PostgresBookRepository::sortableColumns())
        .build();

    EXPECT_EQ(sql,
        "SELECT count(*) OVER() AS total_records, id, title FROM books"
        " WHERE (to_tsvector('simple', title) @@ plainto_tsquery('simple', $1) OR $1 = '')"
        " AND (to_tsvector('simple', author) @@ plainto_tsquery('simple', $2) OR $2 = '')"
        " ORDER BY title DESC, id ASC"
        " LIMIT $3 OFFSET $4");
}

TEST(SearchQueryBuilderTest, SortById_NoDuplicateTiebreak) {
    auto sql = SearchQueryBuilder("books", {"id"})
        .orderBy(sortBy("-id"), PostgresBookRepository::sortableColumns())
        .build();

    EXPECT_NE(sql.find("ORDER BY id DESC LIMIT $1 OFFSET $2"), std::string::npos);
}

TEST(SearchQueryBuilderTest, BookUpdate_GuardedByIdAndVersion) {
    const auto& sql = PostgresBookRepository::updateStatement();

    EXPECT_NE(sql.find("SET title = $1, author = $2, published_year = $3"), std::string::npos);
    EXPECT_NE(sql.find("version = version + 1"), std::string::npos);
    EXPECT_NE(sql.find("WHERE id = $4 AND version = $5"), std::string::npos);
    EXPECT_NE(sql.find("RETURNING version"), std::string::npos);
}

TEST(SearchQueryBuilderTest, ColumnOutsideSortable_Rejected) {
    domain::SortSafelist loose{"password_hash"};
    auto spec = domain::SortSpec::validate("password_hash", loose);

    SearchQueryBuilder builder("users", {"id"});
    EXPECT_THROW(builder.orderBy(spec, PostgresBookRepository::sortableColumns()), std::invalid_argument);
}
