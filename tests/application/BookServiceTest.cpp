/**
 * @file BookServiceTest.cpp
 * @brief Unit-тесты для BookService поверх InMemoryBookRepository
 */

#include <gtest/gtest.h>

#include "application/BookService.hpp"
#include "mocks/InMemoryBookRepository.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace catalog;
using namespace catalog::tests::mocks;

class BookServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::PaginationSettings>();
        bookRepo_ = std::make_shared<InMemoryBookRepository>();
        bookService_ = std::make_shared<application::BookService>(settings_, bookRepo_);
    }

    domain::Filters filters(const std::string& sort = "id", int page = 1, int pageSize = 20) {
        domain::Filters f;
        f.page = page;
        f.pageSize = pageSize;
        f.sort = sort;
        f.sortSafelist = domain::SortSafelist::bothDirections({"id", "title", "author", "published_year"});
        return f;
    }

    std::shared_ptr<settings::PaginationSettings> settings_;
    std::shared_ptr<InMemoryBookRepository> bookRepo_;
    std::shared_ptr<application::BookService> bookService_;
};

// ============================================================================
// LIST
// ============================================================================

TEST_F(BookServiceTest, List_PagesAndMetadata) {
    for (int i = 0; i < 57; ++i) {
        bookRepo_->add("Book " + std::to_string(i), "Author", 2000);
    }

    auto page = bookService_->listBooks("", "", filters("id", 2, 20));

    ASSERT_EQ(page.books.size(), 20u);
    EXPECT_EQ(page.books.front().id, 21);
    EXPECT_EQ(page.metadata.currentPage, 2);
    EXPECT_EQ(page.metadata.lastPage, 3);
    EXPECT_EQ(page.metadata.totalRecords, 57);
}

TEST_F(BookServiceTest, List_PageBeyondEnd_EmptyWithZeroMetadata) {
    bookRepo_->add("Dune", "Frank Herbert", 1965);

    auto page = bookService_->listBooks("", "", filters("id", 5, 20));

    EXPECT_TRUE(page.books.empty());
    EXPECT_EQ(page.metadata, domain::Metadata{});
}

TEST_F(BookServiceTest, List_TitleSearch_AllWordsCaseInsensitive) {
    bookRepo_->add("The Black Cloud", "Fred Hoyle", 1957);
    bookRepo_->add("Black Beauty", "Anna Sewell", 1877);
    bookRepo_->add("Cloud Atlas", "David Mitchell", 2004);

    auto page = bookService_->listBooks("black CLOUD", "", filters());

    ASSERT_EQ(page.books.size(), 1u);
    EXPECT_EQ(page.books[0].title, "The Black Cloud");
}

TEST_F(BookServiceTest, List_DuplicateSortKeys_DeterministicById) {
    auto a = bookRepo_->add("Same", "X", 2000);
    auto b = bookRepo_->add("Same", "X", 2000);
    auto c = bookRepo_->add("Same", "X", 2000);

    for (int run = 0; run < 3; ++run) {
        auto page = bookService_->listBooks("", "", filters("-title"));
        ASSERT_EQ(page.books.size(), 3u);
        EXPECT_EQ(page.books[0].id, a.id);
        EXPECT_EQ(page.books[1].id, b.id);
        EXPECT_EQ(page.books[2].id, c.id);
    }
}

TEST_F(BookServiceTest, List_DescendingYear) {
    bookRepo_->add("Old", "A", 1900);
    bookRepo_->add("New", "A", 2020);

    auto page = bookService_->listBooks("", "", filters("-published_year"));

    ASSERT_EQ(page.books.size(), 2u);
    EXPECT_EQ(page.books[0].title, "New");
}

TEST_F(BookServiceTest, List_UnsafeSort_Rejected) {
    try {
        bookService_->listBooks("", "", filters("version"));
        FAIL() << "Expected DomainError";
    } catch (const domain::DomainError& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::VALIDATION);
        EXPECT_EQ(e.fields().at("sort"), "invalid sort value");
    }
}

TEST_F(BookServiceTest, List_PageSizeAboveConfiguredMax_Rejected) {
    EXPECT_THROW(bookService_->listBooks("", "", filters("id", 1, settings_->getMaxPageSize() + 1)),
                 domain::DomainError);
}

// ============================================================================
// CRUD
// ============================================================================

TEST_F(BookServiceTest, Create_AssignsIdAndVersion) {
    auto book = bookService_->createBook("Dune", "Frank Herbert", 1965);

    EXPECT_GT(book.id, 0);
    EXPECT_EQ(book.version, 1);
    EXPECT_EQ(bookService_->getBook(book.id).title, "Dune");
}

TEST_F(BookServiceTest, Create_Invalid) {
    try {
        bookService_->createBook("", std::string(101, 'a'), -1);
        FAIL() << "Expected DomainError";
    } catch (const domain::DomainError& e) {
        EXPECT_EQ(e.fields().at("title"), "must be provided");
        EXPECT_EQ(e.fields().at("author"), "must not be more than 100 bytes long");
        EXPECT_EQ(e.fields().at("publishedYear"), "must not be negative");
    }
    EXPECT_EQ(bookRepo_->size(), 0u);
}

TEST_F(BookServiceTest, Get_Missing_NotFound) {
    try {
        bookService_->getBook(999);
        FAIL() << "Expected DomainError";
    } catch (const domain::DomainError& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::NOT_FOUND);
    }
    EXPECT_THROW(bookService_->getBook(0), domain::DomainError);
}

TEST_F(BookServiceTest, Update_PartialPatch_BumpsVersion) {
    auto book = bookService_->createBook("Dune", "Frank Herbert", 1965);

    domain::BookPatch patch;
    patch.title = "Dune Messiah";
    auto updated = bookService_->updateBook(book.id, patch, std::nullopt);

    EXPECT_EQ(updated.title, "Dune Messiah");
    EXPECT_EQ(updated.author, "Frank Herbert");
    EXPECT_EQ(updated.version, 2);
}

TEST_F(BookServiceTest, Update_StaleExpectedVersion_Conflict) {
    auto book = bookService_->createBook("Dune", "Frank Herbert", 1965);
    domain::BookPatch patch;
    patch.publishedYear = 1966;

    bookService_->updateBook(book.id, patch, 1);

    try {
        bookService_->updateBook(book.id, patch, 1);
        FAIL() << "Expected DomainError";
    } catch (const domain::DomainError& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::CONFLICT);
    }
}

TEST_F(BookServiceTest, ConcurrentUpdates_ExactlyOneWinner) {
    auto book = bookService_->createBook("Dune", "Frank Herbert", 1965);

    // Все писатели ожидают версию 1
    constexpr int kWriters = 8;
    std::atomic<bool> start{false};
    std::atomic<int> succeeded{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i] {
            while (!start.load()) {
                std::this_thread::yield();
            }
            domain::BookPatch patch;
            patch.title = "Writer " + std::to_string(i);
            try {
                bookService_->updateBook(book.id, patch, 1);
                ++succeeded;
            } catch (const domain::DomainError& e) {
                if (e.kind() == domain::ErrorKind::CONFLICT) {
                    ++conflicts;
                }
            }
        });
    }
    start = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(conflicts.load(), kWriters - 1);

    auto stored = bookService_->getBook(book.id);
    EXPECT_EQ(stored.version, 2);
    EXPECT_EQ(stored.title.rfind("Writer ", 0), 0u);
}

TEST_F(BookServiceTest, Delete_ReturnsBookThenNotFound) {
    auto book = bookService_->createBook("Dune", "Frank Herbert", 1965);

    auto deleted = bookService_->deleteBook(book.id);

    EXPECT_EQ(deleted.id, book.id);
    EXPECT_THROW(bookService_->getBook(book.id), domain::DomainError);
    EXPECT_THROW(bookService_->deleteBook(book.id), domain::DomainError);
}
