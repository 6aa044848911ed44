#pragma once

#include <vector>

#include "volprof/types.hpp"

namespace volprof {

VolumeProfileStats compute_statistics(const PriceSeries& series, const ProfileSettings& settings = ProfileSettings{});

// Evaluates the latest point of the series against an already computed profile.
std::vector<VolumeSignal> generate_signals(const PriceSeries& series, const VolumeProfileStats& stats);

EvolutionResult analyze_evolution(const PriceSeries& series,
                                  const EvolutionSettings& settings = EvolutionSettings{});

ProfileComparison compare_profiles(const PriceSeries& stock,
                                   const PriceSeries& benchmark,
                                   const ProfileSettings& settings = ProfileSettings{});

std::vector<PeriodProfile> compute_period_profiles(const PriceSeries& series,
                                                   const PeriodSettings& settings = PeriodSettings{});

const char* to_string(SignalType type);
const char* to_string(NodeType type);
const char* to_string(ValueAreaTrend trend);

} // namespace volprof
