#pragma once

#include "domain/DomainError.hpp"
#include <algorithm>
#include <initializer_list>
#include <string>
#include <vector>

namespace catalog::domain {

enum class SortDirection {
    ASC,
    DESC
};

inline std::string toString(SortDirection direction) {
    switch (direction) {
        case SortDirection::ASC:  return "ASC";
        case SortDirection::DESC: return "DESC";
    }
    return "ASC";
}

/**
 * @brief Закрытый список допустимых значений параметра sort
 *
 * Значения записываются с направлением: "title" — по возрастанию,
 * "-title" — по убыванию. Каждый listing endpoint владеет своим списком.
 */
class SortSafelist {
public:
    SortSafelist() = default;

    SortSafelist(std::initializer_list<std::string> values)
        : values_(values) {}

    explicit SortSafelist(std::vector<std::string> values)
        : values_(std::move(values)) {}

    /**
     * @brief Список из колонок, в обоих направлениях
     *
     * bothDirections({"id", "title"}) == {"id", "title", "-id", "-title"}
     */
    static SortSafelist bothDirections(std::initializer_list<std::string> columns) {
        std::vector<std::string> values(columns);
        for (const auto& column : columns) {
            values.push_back("-" + column);
        }
        return SortSafelist(std::move(values));
    }

    bool permits(const std::string& sortKey) const {
        return find(sortKey) != values_.end();
    }

    const std::vector<std::string>& values() const { return values_; }

private:
    friend struct SortSpec;

    std::vector<std::string>::const_iterator find(const std::string& sortKey) const {
        return std::find(values_.begin(), values_.end(), sortKey);
    }

    std::vector<std::string> values_;
};

/**
 * @brief Проверенная сортировка: колонка + направление
 *
 * Создаётся только через validate(), поэтому колонка всегда
 * взята из safelist, а не из строки клиента.
 */
struct SortSpec {
    std::string column = "id";
    SortDirection direction = SortDirection::ASC;

    /**
     * @brief Проверить ключ сортировки по safelist
     *
     * @param sortKey "column" или "-column"
     * @param safelist допустимые значения
     * @throws DomainError VALIDATION ("sort": "invalid sort value")
     */
    static SortSpec validate(const std::string& sortKey, const SortSafelist& safelist) {
        auto it = safelist.find(sortKey);
        if (it == safelist.values_.end() || it->empty() || *it == "-") {
            throw DomainError::validation("sort", "invalid sort value");
        }

        const std::string& entry = *it;
        SortSpec spec;
        if (entry.front() == '-') {
            spec.column = entry.substr(1);
            spec.direction = SortDirection::DESC;
        } else {
            spec.column = entry;
            spec.direction = SortDirection::ASC;
        }
        return spec;
    }
};

} // namespace catalog::domain
