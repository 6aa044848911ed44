#include "volprof/analysis_cache.hpp"

#include <cstring>

#include "volprof/channel_finder.hpp"
#include "volprof/series_utils.hpp"
#include "volprof/volume_profile.hpp"

namespace volprof {
namespace {

const uint64_t kFnvOffset = 14695981039346656037ULL;
const uint64_t kFnvPrime = 1099511628211ULL;

class Fnv1a {
public:
    void add_bytes(const void* data, std::size_t size) {
        const unsigned char* bytes = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            hash_ ^= bytes[i];
            hash_ *= kFnvPrime;
        }
    }

    void add(double value) {
        uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        add_bytes(&bits, sizeof(bits));
    }

    void add(uint64_t value) { add_bytes(&value, sizeof(value)); }

    void add(const std::string& text) {
        add(static_cast<uint64_t>(text.size()));
        add_bytes(text.data(), text.size());
    }

    uint64_t value() const { return hash_; }

private:
    uint64_t hash_{kFnvOffset};
};

template <typename Value, typename Compute>
const Value& lookup_or_compute(std::map<std::pair<uint64_t, uint64_t>, Value>* entries,
                               const std::pair<uint64_t, uint64_t>& key,
                               std::size_t* hits,
                               std::size_t* misses,
                               Compute compute) {
    const auto it = entries->find(key);
    if (it != entries->end()) {
        ++*hits;
        return it->second;
    }
    ++*misses;
    return entries->emplace(key, compute()).first->second;
}

template <typename Value>
void erase_series(std::map<std::pair<uint64_t, uint64_t>, Value>* entries, uint64_t series_key) {
    for (auto it = entries->begin(); it != entries->end();) {
        if (it->first.first == series_key) {
            it = entries->erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace

uint64_t fingerprint(const PriceSeries& series) {
    Fnv1a h;
    h.add(static_cast<uint64_t>(series.size()));
    for (const PricePoint& p : series) {
        h.add(p.date);
        h.add(p.close);
        h.add(p.volume);
    }
    return h.value();
}

uint64_t fingerprint(const ProfileSettings& settings) {
    Fnv1a h;
    h.add(static_cast<uint64_t>(settings.num_bins));
    h.add(settings.value_area_fraction);
    h.add(settings.hvn_threshold);
    h.add(settings.lvn_threshold);
    return h.value();
}

uint64_t fingerprint(const ChannelSearchSettings& settings) {
    Fnv1a h;
    h.add(static_cast<uint64_t>(settings.min_start));
    h.add(static_cast<uint64_t>(settings.max_start.has_value() ? 1 : 0));
    h.add(static_cast<uint64_t>(settings.max_start.value_or(0)));
    h.add(static_cast<uint64_t>(settings.min_length));
    h.add(static_cast<uint64_t>(settings.max_length.has_value() ? 1 : 0));
    h.add(static_cast<uint64_t>(settings.max_length.value_or(0)));
    h.add(static_cast<uint64_t>(settings.start_step));
    h.add(static_cast<uint64_t>(settings.length_step));
    h.add(static_cast<uint64_t>(settings.stdev_multipliers.size()));
    for (double m : settings.stdev_multipliers) {
        h.add(m);
    }
    h.add(settings.touch_tolerance);
    h.add(settings.similarity_threshold);
    h.add(static_cast<uint64_t>(settings.turning_point_window));
    h.add(settings.max_outside_fraction);
    h.add(static_cast<uint64_t>(settings.volume_filter_enabled ? 1 : 0));
    return h.value();
}

const VolumeProfileStats& AnalysisCache::statistics(const PriceSeries& series, const ProfileSettings& settings) {
    return lookup_or_compute(&statistics_, {fingerprint(series), fingerprint(settings)}, &hits_, &misses_,
                             [&]() { return compute_statistics(series, settings); });
}

const std::vector<Channel>& AnalysisCache::best_channels(const PriceSeries& series,
                                                         const ChannelSearchSettings& settings) {
    return lookup_or_compute(&channels_, {fingerprint(series), fingerprint(settings)}, &hits_, &misses_,
                             [&]() { return find_best_channels(series, settings); });
}

const std::vector<std::optional<double>>& AnalysisCache::moving_average(const PriceSeries& series,
                                                                        std::size_t period) {
    return lookup_or_compute(&moving_averages_, {fingerprint(series), static_cast<uint64_t>(period)}, &hits_,
                             &misses_, [&]() { return simple_moving_average(normalize_order(series), period); });
}

void AnalysisCache::invalidate(const PriceSeries& series) {
    const uint64_t key = fingerprint(series);
    erase_series(&statistics_, key);
    erase_series(&channels_, key);
    erase_series(&moving_averages_, key);
}

void AnalysisCache::clear() {
    statistics_.clear();
    channels_.clear();
    moving_averages_.clear();
}

std::size_t AnalysisCache::size() const {
    return statistics_.size() + channels_.size() + moving_averages_.size();
}

} // namespace volprof
