#pragma once

#include <string>

#include "volprof/types.hpp"

namespace volprof {

// Required columns: Date/Timestamp (or DTYYYYMMDD + TIME), Close, Volume/Vol. High and Low are optional.
ImportResult import_price_csv(const std::string& csv_path, DateFormat date_format);

} // namespace volprof
