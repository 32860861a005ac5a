#pragma once

#include "domain/DomainError.hpp"
#include <cstdint>
#include <string>

namespace catalog::domain {

constexpr int kMaxPage = 10'000'000;
constexpr int kDefaultMaxPageSize = 100;

/**
 * @brief LIMIT/OFFSET для одной страницы
 */
struct PageWindow {
    int64_t limit = 0;
    int64_t offset = 0;
};

/**
 * @brief Метаданные пагинации
 *
 * Не хранятся, считаются на каждый запрос. При totalRecords == 0
 * все поля нулевые.
 */
struct Metadata {
    int currentPage = 0;
    int pageSize = 0;
    int firstPage = 0;
    int lastPage = 0;
    int64_t totalRecords = 0;

    bool operator==(const Metadata& other) const {
        return currentPage == other.currentPage
            && pageSize == other.pageSize
            && firstPage == other.firstPage
            && lastPage == other.lastPage
            && totalRecords == other.totalRecords;
    }

    bool operator!=(const Metadata& other) const { return !(*this == other); }
};

/**
 * @brief page/pageSize -> limit/offset
 *
 * @throws DomainError VALIDATION для page вне [1, 10'000'000]
 *         и pageSize вне [1, maxPageSize]
 */
inline PageWindow planPage(int page, int pageSize, int maxPageSize = kDefaultMaxPageSize) {
    DomainError::FieldErrors errors;
    if (page < 1) {
        errors.emplace("page", "must be greater than zero");
    } else if (page > kMaxPage) {
        errors.emplace("page", "must be a maximum of 10 million");
    }
    if (pageSize < 1) {
        errors.emplace("page_size", "must be greater than zero");
    } else if (pageSize > maxPageSize) {
        errors.emplace("page_size", "must be a maximum of " + std::to_string(maxPageSize));
    }
    if (!errors.empty()) {
        throw DomainError::validation(std::move(errors));
    }

    PageWindow window;
    window.limit = pageSize;
    window.offset = static_cast<int64_t>(page - 1) * pageSize;
    return window;
}

inline Metadata calculateMetadata(int64_t totalRecords, int page, int pageSize) {
    if (totalRecords <= 0 || pageSize <= 0) {
        return Metadata{};
    }

    Metadata metadata;
    metadata.currentPage = page;
    metadata.pageSize = pageSize;
    metadata.firstPage = 1;
    metadata.lastPage = static_cast<int>((totalRecords + pageSize - 1) / pageSize);
    metadata.totalRecords = totalRecords;
    return metadata;
}

} // namespace catalog::domain
