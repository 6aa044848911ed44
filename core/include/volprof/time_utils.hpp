#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "volprof/types.hpp"

namespace volprof {

std::optional<int64_t> parse_timestamp_utc(const std::string& text, DateFormat fmt);
std::optional<int64_t> parse_date_time_utc_yyyymmdd_hhmmss(const std::string& date_text,
                                                           const std::string& time_text);
std::string format_timestamp_utc_iso8601(int64_t ts);
std::string format_date_utc(int64_t ts);

// YYYY-MM-DD at midnight, full ISO-8601 otherwise.
std::string format_series_date(int64_t ts);

} // namespace volprof
