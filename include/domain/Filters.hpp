#pragma once

#include "domain/Pagination.hpp"
#include "domain/SortSpec.hpp"
#include "domain/Validator.hpp"
#include <string>

namespace catalog::domain {

/**
 * @brief Параметры листинга от клиента (ещё не проверенные)
 */
struct Filters {
    int page = 1;
    int pageSize = 20;
    std::string sort = "id";
    SortSafelist sortSafelist;
};

/**
 * @brief Проверить фильтры, собрав все ошибки в validator
 */
inline void validateFilters(Validator& v, const Filters& f, int maxPageSize = kDefaultMaxPageSize) {
    v.check(f.page > 0, "page", "must be greater than zero");
    v.check(f.page <= kMaxPage, "page", "must be a maximum of 10 million");
    v.check(f.pageSize > 0, "page_size", "must be greater than zero");
    v.check(f.pageSize <= maxPageSize, "page_size",
            "must be a maximum of " + std::to_string(maxPageSize));
    v.check(f.sortSafelist.permits(f.sort), "sort", "invalid sort value");
}

/**
 * @brief Проверенный поисковый запрос
 *
 * Всё, что здесь лежит, уже прошло safelist и границы страниц.
 * Репозитории принимают только этот тип.
 */
struct SearchCriteria {
    std::string title;        ///< "" — без фильтра
    std::string author;       ///< "" — без фильтра
    SortSpec sort;
    PageWindow window;
    int page = 1;
    int pageSize = 20;

    /**
     * @throws DomainError VALIDATION со всеми ошибками по полям
     */
    static SearchCriteria from(const std::string& title,
                               const std::string& author,
                               const Filters& filters,
                               int maxPageSize = kDefaultMaxPageSize) {
        Validator v;
        validateFilters(v, filters, maxPageSize);
        v.throwIfInvalid();

        SearchCriteria criteria;
        criteria.title = title;
        criteria.author = author;
        criteria.sort = SortSpec::validate(filters.sort, filters.sortSafelist);
        criteria.window = planPage(filters.page, filters.pageSize, maxPageSize);
        criteria.page = filters.page;
        criteria.pageSize = filters.pageSize;
        return criteria;
    }
};

} // namespace catalog::domain
