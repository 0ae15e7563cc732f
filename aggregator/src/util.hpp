#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace util {
    constexpr int64_t kMillisPerDay = 86400LL * 1000;

    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // "YYYY-MM-DD HH:MM:SS", UTC
    std::string format_timestamp(int64_t timestamp_ms);
    std::string format_date(int64_t timestamp_ms);
    // "YYYY-MM-DD HH:MM:SS.mmm", UTC
    std::string format_timestamp_millis(int64_t timestamp_ms);

    // Midnight UTC in epoch ms; throw std::invalid_argument on bad input
    int64_t parse_date(const std::string& yyyy_mm_dd);
    int64_t parse_dmy_date(const std::string& dd_mon_yyyy);
    int64_t parse_timestamp(const std::string& yyyy_mm_dd_hh_mm_ss);
    std::string format_compact_date(int64_t timestamp_ms); // 04APR2022

    // Inclusive range of calendar days; an absent bound is open-ended
    struct DateRange {
        std::optional<int64_t> first_day_ms;
        std::optional<int64_t> last_day_ms;

        bool contains(int64_t timestamp_ms) const;
        static DateRange parse(const std::string& text);
    };

    std::string trim(const std::string& str);
    std::string to_upper(std::string str);
    std::vector<std::string> split_fields(const std::string& line, char delim);

    std::optional<double> parse_double(const std::string& str);
    std::optional<int64_t> parse_int64(const std::string& str);

    // Empty on signed overflow
    std::optional<int64_t> checked_add(int64_t a, int64_t b);

    std::string redact_dsn(const std::string& dsn);
}
