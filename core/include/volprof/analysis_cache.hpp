#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "volprof/types.hpp"

namespace volprof {

uint64_t fingerprint(const PriceSeries& series);
uint64_t fingerprint(const ProfileSettings& settings);
uint64_t fingerprint(const ChannelSearchSettings& settings);

// Memoizes results per (series fingerprint, settings fingerprint). Owned by the caller; not
// thread-safe. Returned references stay valid until the entry is invalidated or cleared.
class AnalysisCache {
public:
    const VolumeProfileStats& statistics(const PriceSeries& series, const ProfileSettings& settings);
    const std::vector<Channel>& best_channels(const PriceSeries& series, const ChannelSearchSettings& settings);
    const std::vector<std::optional<double>>& moving_average(const PriceSeries& series, std::size_t period);

    // Drops every entry computed from this series.
    void invalidate(const PriceSeries& series);
    void clear();

    std::size_t size() const;
    std::size_t hits() const { return hits_; }
    std::size_t misses() const { return misses_; }

private:
    using Key = std::pair<uint64_t, uint64_t>;

    std::map<Key, VolumeProfileStats> statistics_;
    std::map<Key, std::vector<Channel>> channels_;
    std::map<Key, std::vector<std::optional<double>>> moving_averages_;
    std::size_t hits_{0};
    std::size_t misses_{0};
};

} // namespace volprof
