#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace util {
    // Calendar days since 1970-01-01 (UTC)
    int days_from_civil(int year, unsigned month, unsigned day);
    int day_from_ms(int64_t ms);
    std::string format_date(int day);
    std::optional<int> parse_date(const std::string& text);

    // Accepts "YYYY-MM-DD" (end of that UTC day) or "YYYY-MM-DDTHH:MM:SS[.fff][Z]"
    std::optional<int64_t> parse_iso8601(const std::string& text);
    std::string format_iso8601(int64_t ms);

    std::vector<std::string> split(const std::string& str, char delim);
    std::string trim(const std::string& str);
    std::string to_upper(std::string str);

    double round_to(double value, int decimals);
    double clamp01(double value);

    std::string make_trace_id(const std::string& mode, const std::vector<std::string>& scope,
                              int64_t seed);
    std::string redact_dsn(const std::string& dsn);
}
