#include "volprof/breakout_detector.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_set>

#include "volprof/series_utils.hpp"

namespace volprof {
namespace {

enum class Direction {
    Down = -1,
    Up = 1,
};

struct NonZeroZone {
    std::size_t index{0};
    double weight{0.0};
};

struct BreakCandidate {
    std::size_t zone_index{0};
    double weight{0.0};
    bool has_zone{true};
};

struct ZoneLayout {
    std::vector<WeightedZone> zones;
    std::size_t current_index{0};
    double zone_height{0.0};
    bool flat{false};
};

// Rebuilds the zone layout for window[0..last] and locates window[last].
ZoneLayout build_layout(const PriceSeries& window, std::size_t last, const BreakoutSettings& settings) {
    ZoneLayout layout;

    double min_price = window.front().close;
    double max_price = window.front().close;
    double total_volume = 0.0;
    for (std::size_t i = 0; i <= last; ++i) {
        min_price = std::min(min_price, window[i].close);
        max_price = std::max(max_price, window[i].close);
        total_volume += window[i].volume;
    }

    const double price_range = max_price - min_price;
    if (price_range == 0.0) {
        layout.zones.push_back({min_price, min_price, total_volume, 1.0});
        layout.flat = true;
        return layout;
    }

    const std::size_t num_zones = zone_count_for_prefix(last + 1, settings);
    layout.zone_height = price_range / static_cast<double>(num_zones);
    layout.zones.resize(num_zones);
    for (std::size_t j = 0; j < num_zones; ++j) {
        layout.zones[j].min_price = min_price + static_cast<double>(j) * layout.zone_height;
        layout.zones[j].max_price = min_price + static_cast<double>(j + 1) * layout.zone_height;
    }

    const auto zone_of = [&](double price) {
        const double raw = std::floor((price - min_price) / layout.zone_height);
        if (raw < 0.0) {
            return std::size_t{0};
        }
        return std::min(static_cast<std::size_t>(raw), num_zones - 1);
    };

    for (std::size_t i = 0; i <= last; ++i) {
        layout.zones[zone_of(window[i].close)].volume += window[i].volume;
    }
    for (WeightedZone& zone : layout.zones) {
        zone.weight = (total_volume > 0.0) ? zone.volume / total_volume : 0.0;
    }
    layout.current_index = zone_of(window[last].close);
    return layout;
}

// Nearest zones with volume, walking away from `from` in `dir`.
std::vector<NonZeroZone> collect_non_zero(const std::vector<WeightedZone>& zones,
                                          std::size_t from,
                                          Direction dir,
                                          std::size_t limit) {
    std::vector<NonZeroZone> out;
    long idx = static_cast<long>(from) + static_cast<long>(dir);
    while (out.size() < limit && idx >= 0 && idx < static_cast<long>(zones.size())) {
        const WeightedZone& zone = zones[static_cast<std::size_t>(idx)];
        if (zone.weight > 0.0) {
            out.push_back({static_cast<std::size_t>(idx), zone.weight});
        }
        idx += static_cast<long>(dir);
    }
    return out;
}

std::optional<BreakCandidate> two_nearest(const std::vector<NonZeroZone>& heavy,
                                          double current_weight,
                                          double differential) {
    if (heavy.size() < 2) {
        return std::nullopt;
    }
    for (std::size_t k = 0; k < 2; ++k) {
        if (heavy[k].weight - current_weight < differential) {
            return std::nullopt;
        }
    }
    const NonZeroZone& strongest = (heavy[1].weight > heavy[0].weight) ? heavy[1] : heavy[0];
    return BreakCandidate{strongest.index, strongest.weight};
}

std::optional<BreakCandidate> any_or_merged_pair(const std::vector<NonZeroZone>& heavy,
                                                 double current_weight,
                                                 double differential) {
    bool triggered = false;
    double min_diff = 0.0;
    std::optional<BreakCandidate> best;

    for (const NonZeroZone& zone : heavy) {
        const double diff = current_weight - zone.weight;
        if (diff <= -differential) {
            triggered = true;
        }
        if (diff < min_diff) {
            min_diff = diff;
            best = BreakCandidate{zone.index, zone.weight};
        }
    }

    // Adjacent pairs count as one zone; the one nearer the current price marks the level.
    for (std::size_t k = 0; k + 1 < heavy.size(); ++k) {
        const double merged = heavy[k].weight + heavy[k + 1].weight;
        const double diff = current_weight - merged;
        if (diff <= -differential) {
            triggered = true;
        }
        if (diff < min_diff) {
            min_diff = diff;
            best = BreakCandidate{heavy[k].index, merged};
        }
    }

    if (!triggered) {
        return std::nullopt;
    }
    // Only an exact tie at a zero differential triggers without a strictly heavier zone.
    if (!best.has_value()) {
        return BreakCandidate{0, 0.0, false};
    }
    return best;
}

// None of the next `lookahead` non-zero zones in `dir` may be as heavy as the current zone.
bool thins_out(const std::vector<WeightedZone>& zones,
               std::size_t current,
               Direction dir,
               std::size_t lookahead,
               double current_weight) {
    for (const NonZeroZone& zone : collect_non_zero(zones, current, dir, lookahead)) {
        if (zone.weight >= current_weight) {
            return false;
        }
    }
    return true;
}

// `away` points from the heavy zones towards the thin side the price is entering.
std::optional<BreakCandidate> evaluate_break(const ZoneLayout& layout,
                                             Direction away,
                                             const BreakoutSettings& settings) {
    const std::size_t current = layout.current_index;
    const double current_weight = layout.zones[current].weight;
    const Direction towards = (away == Direction::Up) ? Direction::Down : Direction::Up;

    const std::vector<NonZeroZone> heavy =
        collect_non_zero(layout.zones, current, towards, settings.lookback_zones);

    std::optional<BreakCandidate> candidate;
    if (settings.rule == BreakRule::TwoNearest) {
        candidate = two_nearest(heavy, current_weight, settings.weight_differential);
    } else {
        candidate = any_or_merged_pair(heavy, current_weight, settings.weight_differential);
    }

    if (!candidate.has_value()) {
        return std::nullopt;
    }
    if (candidate->has_zone && candidate->weight < settings.min_support_weight) {
        return std::nullopt;
    }
    if (!thins_out(layout.zones, current, away, settings.lookahead_zones, current_weight)) {
        return std::nullopt;
    }
    return candidate;
}

} // namespace

std::size_t zone_count_for_prefix(std::size_t prefix_length, const BreakoutSettings& settings) {
    const std::size_t by_length = (settings.points_per_zone > 0) ? prefix_length / settings.points_per_zone : 0;
    return std::max(settings.min_zones, std::min(settings.max_zones, by_length));
}

BreakoutSettings split_window_settings() {
    BreakoutSettings settings;
    settings.weight_differential = 0.08;
    settings.rule = BreakRule::AnyOrMergedPair;
    settings.window_policy = WindowPolicy::SplitOnBreak;
    return settings;
}

BreakoutResult detect_breaks(const PriceSeries& series,
                             const ZoomRange& zoom,
                             const std::vector<std::string>& window_split_dates,
                             const BreakoutSettings& settings) {
    BreakoutResult result;
    if (!settings.is_valid()) {
        result.warnings.push_back("Break detection skipped: invalid settings (require lookback/lookahead > 0, "
                                  "min_zones <= max_zones and non-negative thresholds).");
        return result;
    }
    if (series.empty()) {
        return result;
    }

    const PriceSeries ordered = normalize_order(series);
    const std::size_t zoom_end = std::min(zoom.end.value_or(ordered.size()), ordered.size());
    if (zoom.start >= zoom_end) {
        result.warnings.push_back("Zoom range selects no data. No windows produced.");
        return result;
    }
    const PriceSeries visible(ordered.begin() + static_cast<long>(zoom.start),
                              ordered.begin() + static_cast<long>(zoom_end));

    if (visible.size() <= settings.warmup_size) {
        result.warnings.push_back("Visible data does not exceed warmup_size. No breaks evaluated.");
    }

    const std::unordered_set<std::string> split_dates(window_split_dates.begin(), window_split_dates.end());

    std::size_t window_start = 0;
    while (window_start < visible.size()) {
        std::size_t window_end = visible.size();
        for (std::size_t i = window_start; i < visible.size(); ++i) {
            if (split_dates.count(visible[i].date) > 0) {
                window_end = i + 1;
                break;
            }
        }

        const PriceSeries window(visible.begin() + static_cast<long>(window_start),
                                 visible.begin() + static_cast<long>(window_end));

        ProfileWindow profile;
        profile.window_index = result.windows.size();

        for (std::size_t i = 0; i < window.size(); ++i) {
            const PricePoint& point = window[i];
            ZoneLayout layout = build_layout(window, i, settings);

            if (!layout.flat && i >= settings.warmup_size) {
                const double current_weight = layout.zones[layout.current_index].weight;
                bool found = false;
                BreakSignal signal;
                signal.date = point.date;
                signal.price = point.close;
                signal.window_index = profile.window_index;
                signal.current_weight = current_weight;

                if (const auto support = evaluate_break(layout, Direction::Up, settings)) {
                    signal.is_up_break = true;
                    signal.level = support->has_zone ? layout.zones[support->zone_index].min_price
                                                     : layout.zones.front().min_price;
                    signal.triggering_zone_weight = support->weight;
                    found = true;
                } else if (settings.detect_breakdowns) {
                    if (const auto resistance = evaluate_break(layout, Direction::Down, settings)) {
                        signal.is_up_break = false;
                        signal.level = resistance->has_zone ? layout.zones[resistance->zone_index].max_price
                                                            : layout.zones.back().max_price;
                        signal.triggering_zone_weight = resistance->weight;
                        found = true;
                    }
                }

                if (found) {
                    result.breaks.push_back(signal);
                    profile.break_detected = true;
                    if (settings.window_policy == WindowPolicy::SplitOnBreak) {
                        window_end = window_start + i + 1;
                    }
                }
            }

            profile.points.push_back({point.date,
                                      point.close,
                                      point.volume,
                                      std::move(layout.zones),
                                      layout.current_index,
                                      layout.zone_height});

            if (window_start + i + 1 == window_end) {
                break;
            }
        }

        if (!profile.points.empty()) {
            profile.start_date = profile.points.front().date;
            profile.end_date = profile.points.back().date;
            result.windows.push_back(std::move(profile));
        }
        window_start = window_end;
    }

    return result;
}

} // namespace volprof
