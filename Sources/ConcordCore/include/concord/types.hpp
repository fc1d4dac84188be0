#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <map>
#include <variant>
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

namespace concord {

// Wall-clock timestamp (file modification times, marker ages, operation times)
using timestamp_t = std::chrono::system_clock::time_point;

// Primary key type
using primary_key_t = int64_t;

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Snapshot of one row: column name -> value. Ordered so generated SQL is stable.
using record_t = std::map<std::string, column_value_t>;

// ============================================================================
// Time helpers
// ============================================================================

inline int64_t to_epoch_millis(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_epoch_millis(int64_t millis) {
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::milliseconds(millis)));
}

inline int64_t to_epoch_nanos(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_epoch_nanos(int64_t nanos) {
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::nanoseconds(nanos)));
}

// Random lowercase hex string of the given length
inline std::string random_hex(size_t length) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    while (ss.tellp() < static_cast<std::streamoff>(length)) {
        ss << std::setw(16) << dis(gen);
    }
    return ss.str().substr(0, length);
}

// ============================================================================
// Value helpers
// ============================================================================

namespace detail {
    inline std::optional<int64_t> as_integer(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return std::get<int64_t>(v);
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        if (std::holds_alternative<std::string>(v)) {
            const auto& s = std::get<std::string>(v);
            try {
                size_t used = 0;
                int64_t parsed = std::stoll(s, &used);
                if (used == s.size()) return parsed;
            } catch (const std::exception&) {
            }
        }
        return std::nullopt;
    }
} // namespace detail

} // namespace concord
