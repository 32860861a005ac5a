#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace catalog::domain {

/**
 * @brief Момент времени в UTC
 *
 * В JSON уходит как RFC 3339 с точностью до секунды.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /// Из EXTRACT(EPOCH FROM ...)::bigint
    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    std::string toString() const {
        std::time_t secs = std::chrono::system_clock::to_time_t(value);
        std::tm utc{};
        gmtime_r(&secs, &utc);

        char buf[32];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return std::string(buf, n);
    }
};

} // namespace catalog::domain
