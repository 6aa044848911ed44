#pragma once

#include <vector>

#include "volprof/types.hpp"

namespace volprof {

// Grid search over (start, length, multiplier). Returns the candidates whose touch count is within
// similarity_threshold of the best, ordered by touch count then length, both descending.
std::vector<Channel> find_best_channels(const PriceSeries& series,
                                        const ChannelSearchSettings& settings = ChannelSearchSettings{});

// Keeps the first channel, then every channel overlapping each kept one by at most
// overlap_threshold of its own length.
std::vector<Channel> filter_overlapping(const std::vector<Channel>& channels, double overlap_threshold = 0.5);

int count_touches(const std::vector<TurningPoint>& turning_points,
                  double slope,
                  double intercept,
                  double channel_width,
                  double tolerance = 0.05);

// Indices whose volume is above the 10th percentile of non-zero volumes. All true when
// fewer than min_valid points would survive.
std::vector<bool> volume_filter_mask(const PriceSeries& series, std::size_t min_valid);

} // namespace volprof
