#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace catalog::settings {

/**
 * @brief Размеры страниц для listing endpoints
 */
class PaginationSettings {
public:
    PaginationSettings() {
        defaultPageSize_ = std::stoi(getEnvOrDefault("CATALOG_DEFAULT_PAGE_SIZE", "20"));
        maxPageSize_ = std::stoi(getEnvOrDefault("CATALOG_MAX_PAGE_SIZE", "100"));
        if (maxPageSize_ < 1 || defaultPageSize_ < 1 || defaultPageSize_ > maxPageSize_) {
            throw std::invalid_argument("Invalid page size settings: need 1 <= default <= max");
        }
    }

    int getDefaultPageSize() const { return defaultPageSize_; }
    int getMaxPageSize() const { return maxPageSize_; }

private:
    int defaultPageSize_;
    int maxPageSize_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace catalog::settings
