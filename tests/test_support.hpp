#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "volprof/time_utils.hpp"
#include "volprof/types.hpp"

namespace volprof_test {

inline int g_failures = 0;

const std::filesystem::path kSourceRoot = VOLPROF_SOURCE_DIR;

// 2024-01-01T00:00:00Z
const int64_t kBaseTs = 1704067200;

inline std::filesystem::path src_path(const std::string& rel) {
    return kSourceRoot / rel;
}

inline void check_true(bool condition, const std::string& message) {
    if (!condition) {
        ++g_failures;
        std::cerr << "[FAIL] " << message << '\n';
    }
}

inline void check_near(double a, double b, double tol, const std::string& message) {
    if (std::fabs(a - b) > tol) {
        ++g_failures;
        std::cerr << "[FAIL] " << message << " expected=" << b << " actual=" << a << '\n';
    }
}

inline bool contains_warning(const std::vector<std::string>& warnings, const std::string& needle) {
    return std::any_of(warnings.begin(), warnings.end(), [&](const std::string& w) {
        return w.find(needle) != std::string::npos;
    });
}

inline std::string day(std::size_t offset) {
    return volprof::format_date_utc(kBaseTs + static_cast<int64_t>(offset) * 86400);
}

// One bar per day starting 2024-01-01, oldest first.
inline volprof::PriceSeries make_series(const std::vector<double>& closes, const std::vector<double>& volumes) {
    volprof::PriceSeries series;
    for (std::size_t i = 0; i < closes.size(); ++i) {
        volprof::PricePoint p;
        p.date = day(i);
        p.close = closes[i];
        p.volume = (i < volumes.size()) ? volumes[i] : 0.0;
        series.push_back(p);
    }
    return series;
}

inline volprof::PriceSeries make_series(const std::vector<double>& closes, double volume) {
    return make_series(closes, std::vector<double>(closes.size(), volume));
}

inline int finish() {
    if (g_failures == 0) {
        std::cout << "All tests passed\n";
        return 0;
    }

    std::cerr << g_failures << " test(s) failed\n";
    return 1;
}

} // namespace volprof_test
