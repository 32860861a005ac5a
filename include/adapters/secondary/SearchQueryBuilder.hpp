#pragma once

#include "domain/SortSpec.hpp"
#include <string>
#include <vector>

namespace catalog::adapters::secondary {

/**
 * @brief Сборка SELECT для поиска со страницей и count(*) OVER()
 *
 * Пользовательские значения идут только параметрами ($1, $2, ...).
 * В текст SQL попадают лишь имена колонок из sortable, переданного
 * адаптером, и направление из enum.
 *
 * Пример для книг:
 * @code
 * SELECT count(*) OVER() AS total_records, id, title, ...
 * FROM books
 * WHERE (to_tsvector('simple', title) @@ plainto_tsquery('simple', $1) OR $1 = '')
 * AND (to_tsvector('simple', author) @@ plainto_tsquery('simple', $2) OR $2 = '')
 * ORDER BY title DESC, id ASC
 * LIMIT $3 OFFSET $4
 * @endcode
 */
class SearchQueryBuilder {
public:
    SearchQueryBuilder(std::string table, std::vector<std::string> selectColumns);

    /**
     * @brief Полнотекстовый фильтр по колонке; '' в параметре — без фильтра
     */
    SearchQueryBuilder& textMatch(const std::string& column);

    /**
     * @brief ORDER BY по проверенной сортировке + стабильный tiebreak
     *
     * @throws std::invalid_argument если колонки нет в sortable
     */
    SearchQueryBuilder& orderBy(const domain::SortSpec& sort,
                                const std::vector<std::string>& sortable,
                                const std::string& tiebreakColumn = "id");

    std::string build() const;

private:
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::string> textColumns_;
    std::string orderBy_;
};

} // namespace catalog::adapters::secondary
