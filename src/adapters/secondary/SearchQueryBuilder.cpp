#include "adapters/secondary/SearchQueryBuilder.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace catalog::adapters::secondary {

SearchQueryBuilder::SearchQueryBuilder(std::string table, std::vector<std::string> selectColumns)
    : table_(std::move(table))
    , selectColumns_(std::move(selectColumns))
{}

SearchQueryBuilder& SearchQueryBuilder::textMatch(const std::string& column) {
    textColumns_.push_back(column);
    return *this;
}

SearchQueryBuilder& SearchQueryBuilder::orderBy(const domain::SortSpec& sort,
                                                const std::vector<std::string>& sortable,
                                                const std::string& tiebreakColumn) {
    // Имя колонки берём из sortable, а не из sort.column
    auto it = std::find(sortable.begin(), sortable.end(), sort.column);
    if (it == sortable.end()) {
        throw std::invalid_argument("unsortable column: " + sort.column);
    }

    orderBy_ = *it + " " + domain::toString(sort.direction);
    if (*it != tiebreakColumn) {
        orderBy_ += ", " + tiebreakColumn + " ASC";
    }
    return *this;
}

std::string SearchQueryBuilder::build() const {
    std::ostringstream sql;
    sql << "SELECT count(*) OVER() AS total_records";
    for (const auto& column : selectColumns_) {
        sql << ", " << column;
    }
    sql << " FROM " << table_;

    int param = 1;
    for (std::size_t i = 0; i < textColumns_.size(); ++i, ++param) {
        sql << (i == 0 ? " WHERE " : " AND ")
            << "(to_tsvector('simple', " << textColumns_[i] << ") @@ plainto_tsquery('simple', $" << param << ")"
            << " OR $" << param << " = '')";
    }

    if (!orderBy_.empty()) {
        sql << " ORDER BY " << orderBy_;
    }

    sql << " LIMIT $" << param << " OFFSET $" << (param + 1);
    return sql.str();
}

} // namespace catalog::adapters::secondary
