#pragma once

#include <string>
#include <vector>

#include "volprof/types.hpp"

namespace volprof {

bool export_profile_json(const std::string& output_path,
                         const ProfileSettings& settings,
                         const VolumeProfileStats& stats,
                         const std::vector<VolumeSignal>& signals,
                         std::string* error);

bool export_zones_csv(const std::string& output_path, const VolumeProfileStats& stats, std::string* error);

bool export_breaks_csv(const std::string& output_path, const BreakoutResult& result, std::string* error);

bool export_trades_csv(const std::string& output_path, const SimulationResult& result, std::string* error);

bool export_simulation_json(const std::string& output_path,
                            const BreakoutSettings& detector,
                            const SimulationSettings& settings,
                            const SimulationResult& result,
                            std::string* error);

bool export_channels_csv(const std::string& output_path, const std::vector<Channel>& channels, std::string* error);

} // namespace volprof
