#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "volprof/types.hpp"

namespace volprof {

// Re-bins the cumulative prefix of each window at every point and reports low-volume breaks.
// A window ends on the next date listed in window_split_dates (inclusive) or at the end of the
// zoomed slice; with WindowPolicy::SplitOnBreak it also ends on its first break.
BreakoutResult detect_breaks(const PriceSeries& series,
                             const ZoomRange& zoom = ZoomRange{},
                             const std::vector<std::string>& window_split_dates = {},
                             const BreakoutSettings& settings = BreakoutSettings{});

// clamp(floor(prefix_length / points_per_zone), min_zones, max_zones)
std::size_t zone_count_for_prefix(std::size_t prefix_length, const BreakoutSettings& settings);

// Settings of the split-window variant: 8% differential with pair merging, one break per window.
BreakoutSettings split_window_settings();

} // namespace volprof
