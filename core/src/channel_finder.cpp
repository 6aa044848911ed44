#include "volprof/channel_finder.hpp"

#include <algorithm>
#include <cmath>

#include "volprof/series_utils.hpp"

namespace volprof {
namespace {

const std::size_t kDefaultStartMargin = 20;

// Share of the segment's closes lying outside the band by more than the touch tolerance.
double outside_fraction(const PriceSeries& series,
                        std::size_t start,
                        std::size_t end,
                        const Regression& fit,
                        double channel_width,
                        double tolerance,
                        const std::vector<bool>* valid) {
    const double outside_tolerance = channel_width * 2.0 * tolerance;
    std::size_t considered = 0;
    std::size_t outside = 0;
    for (std::size_t x = start; x <= end; ++x) {
        if (valid != nullptr && !(*valid)[x]) {
            continue;
        }
        ++considered;
        const double predicted = fit.slope * static_cast<double>(x) + fit.intercept;
        const double upper = predicted + channel_width;
        const double lower = predicted - channel_width;
        const double close = series[x].close;
        if ((close > upper && close - upper > outside_tolerance) ||
            (close < lower && lower - close > outside_tolerance)) {
            ++outside;
        }
    }
    return (considered > 0) ? static_cast<double>(outside) / static_cast<double>(considered) : 1.0;
}

} // namespace

int count_touches(const std::vector<TurningPoint>& turning_points,
                  double slope,
                  double intercept,
                  double channel_width,
                  double tolerance) {
    const double max_distance = channel_width * 2.0 * tolerance;
    int touches = 0;
    for (const TurningPoint& tp : turning_points) {
        const double predicted = slope * static_cast<double>(tp.index) + intercept;
        if (tp.type == TurningPointType::Max) {
            if (std::fabs(tp.value - (predicted + channel_width)) <= max_distance && tp.value >= predicted) {
                ++touches;
            }
        } else if (std::fabs(tp.value - (predicted - channel_width)) <= max_distance && tp.value <= predicted) {
            ++touches;
        }
    }
    return touches;
}

std::vector<bool> volume_filter_mask(const PriceSeries& series, std::size_t min_valid) {
    std::vector<bool> mask(series.size(), true);

    std::vector<double> volumes;
    for (const PricePoint& p : series) {
        if (p.volume > 0.0) {
            volumes.push_back(p.volume);
        }
    }
    if (volumes.empty()) {
        return mask;
    }
    std::sort(volumes.begin(), volumes.end());
    const double threshold = volumes[static_cast<std::size_t>(std::floor(static_cast<double>(volumes.size()) * 0.1))];

    std::size_t kept = 0;
    std::vector<bool> filtered(series.size(), false);
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (series[i].volume > threshold) {
            filtered[i] = true;
            ++kept;
        }
    }
    return (kept < min_valid) ? mask : filtered;
}

std::vector<Channel> find_best_channels(const PriceSeries& input, const ChannelSearchSettings& settings) {
    std::vector<Channel> candidates;
    if (!settings.is_valid() || input.size() < settings.min_length) {
        return candidates;
    }

    const PriceSeries series = normalize_order(input);
    const std::size_t n = series.size();
    const std::size_t max_start =
        settings.max_start.value_or((n > kDefaultStartMargin) ? n - kDefaultStartMargin : 0);

    std::vector<bool> mask;
    const std::vector<bool>* valid = nullptr;
    if (settings.volume_filter_enabled) {
        mask = volume_filter_mask(series, settings.min_length);
        valid = &mask;
    }

    std::vector<TurningPoint> turning_points;
    for (const TurningPoint& tp : find_turning_points(series, settings.turning_point_window)) {
        if (valid == nullptr || (*valid)[tp.index]) {
            turning_points.push_back(tp);
        }
    }

    int max_touch_count = 0;
    for (std::size_t start = settings.min_start; start <= max_start && start < n; start += settings.start_step) {
        const std::size_t remaining = n - start;
        if (remaining < settings.min_length) {
            continue;
        }
        const std::size_t max_length =
            settings.max_length.has_value() ? std::min(*settings.max_length, remaining) : remaining;

        for (std::size_t length = settings.min_length; length <= max_length; length += settings.length_step) {
            const std::size_t end = start + length - 1;
            const std::optional<Regression> fit = fit_regression(series, start, end, valid);
            if (!fit.has_value()) {
                continue;
            }

            std::vector<TurningPoint> segment_points;
            for (const TurningPoint& tp : turning_points) {
                if (tp.index >= start && tp.index <= end) {
                    segment_points.push_back(tp);
                }
            }
            if (segment_points.empty()) {
                continue;
            }

            for (double multiplier : settings.stdev_multipliers) {
                const double channel_width = fit->std_dev * multiplier;
                const double outside =
                    outside_fraction(series, start, end, *fit, channel_width, settings.touch_tolerance, valid);
                if (outside > settings.max_outside_fraction) {
                    continue;
                }

                const int touches =
                    count_touches(segment_points, fit->slope, fit->intercept, channel_width, settings.touch_tolerance);
                if (touches <= 0) {
                    continue;
                }

                Channel channel;
                channel.start_index = start;
                channel.end_index = end;
                channel.slope = fit->slope;
                channel.intercept = fit->intercept;
                channel.std_dev = fit->std_dev;
                channel.channel_width = channel_width;
                channel.stdev_multiplier = multiplier;
                channel.touch_count = touches;
                channel.turning_points_count = segment_points.size();
                channel.percent_within_bounds = 1.0 - outside;
                channel.length = length;
                candidates.push_back(channel);
                max_touch_count = std::max(max_touch_count, touches);
            }
        }
    }

    if (candidates.empty()) {
        return candidates;
    }

    const int threshold =
        static_cast<int>(std::floor(static_cast<double>(max_touch_count) * settings.similarity_threshold));
    std::vector<Channel> best;
    for (const Channel& c : candidates) {
        if (c.touch_count >= threshold) {
            best.push_back(c);
        }
    }
    std::stable_sort(best.begin(), best.end(), [](const Channel& a, const Channel& b) {
        if (a.touch_count != b.touch_count) {
            return a.touch_count > b.touch_count;
        }
        return a.length > b.length;
    });
    return best;
}

std::vector<Channel> filter_overlapping(const std::vector<Channel>& channels, double overlap_threshold) {
    if (channels.size() <= 1) {
        return channels;
    }

    std::vector<Channel> kept{channels.front()};
    for (std::size_t i = 1; i < channels.size(); ++i) {
        const Channel& candidate = channels[i];
        const double candidate_length = static_cast<double>(candidate.end_index - candidate.start_index + 1);

        bool overlaps = false;
        for (const Channel& existing : kept) {
            const std::size_t overlap_start = std::max(candidate.start_index, existing.start_index);
            const std::size_t overlap_end = std::min(candidate.end_index, existing.end_index);
            const double overlap =
                (overlap_end >= overlap_start) ? static_cast<double>(overlap_end - overlap_start + 1) : 0.0;
            if (overlap / candidate_length > overlap_threshold) {
                overlaps = true;
                break;
            }
        }
        if (!overlaps) {
            kept.push_back(candidate);
        }
    }
    return kept;
}

} // namespace volprof
