#include "volprof/volume_profile.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "volprof/series_utils.hpp"
#include "volprof/time_utils.hpp"

namespace volprof {
namespace {

const double kPocProximity = 0.02;
const double kHvnProximity = 0.03;
const double kLvnProximity = 0.02;
const double kTrendThresholdPct = 5.0;
const int64_t kSecondsPerWeek = 7 * 24 * 60 * 60;

double total_volume_of(const PriceSeries& series) {
    double total = 0.0;
    for (const PricePoint& p : series) {
        total += p.volume;
    }
    return total;
}

std::size_t bin_index(double price, double min_price, double bin_size, std::size_t num_bins) {
    const double raw = std::floor((price - min_price) / bin_size);
    if (raw < 0.0) {
        return 0;
    }
    const std::size_t index = static_cast<std::size_t>(raw);
    return (index >= num_bins) ? num_bins - 1 : index;
}

VolumeProfileStats flat_statistics(const PriceSeries& series, double price) {
    VolumeProfileStats stats;
    const double total = total_volume_of(series);

    Zone zone;
    zone.min_price = price;
    zone.max_price = price;
    zone.mid_price = price;
    zone.volume = total;
    zone.volume_percent = (total > 0.0) ? 1.0 : 0.0;
    zone.data_points = series.size();

    PointOfControl poc;
    poc.price = price;
    poc.min_price = price;
    poc.max_price = price;
    poc.volume = total;
    poc.volume_percent = zone.volume_percent;

    stats.poc = poc;
    stats.value_area_high = price;
    stats.value_area_low = price;
    stats.value_area.push_back(zone);
    stats.bins.push_back(zone);
    stats.total_volume = total;
    stats.average_volume_per_bin = total;
    stats.value_area_fraction = zone.volume_percent;
    stats.min_price = price;
    stats.max_price = price;
    return stats;
}

VolumeNode make_node(const Zone& zone, NodeType type, double average_volume, double poc_volume) {
    VolumeNode node;
    node.type = type;
    node.price = zone.mid_price;
    node.min_price = zone.min_price;
    node.max_price = zone.max_price;
    node.volume = zone.volume;
    node.volume_percent = zone.volume_percent;
    node.volume_ratio = (average_volume > 0.0) ? zone.volume / average_volume : 0.0;
    if (type == NodeType::Hvn) {
        node.strength = (poc_volume > 0.0) ? zone.volume / poc_volume : 0.0;
    } else {
        node.strength = 1.0 - node.volume_ratio;
    }
    return node;
}

VolumeNode merge_cluster(const std::vector<VolumeNode>& nodes) {
    if (nodes.size() == 1) {
        return nodes.front();
    }

    VolumeNode merged;
    merged.type = nodes.front().type;
    merged.min_price = nodes.front().min_price;
    merged.max_price = nodes.front().max_price;
    double percent_sum = 0.0;
    double ratio_sum = 0.0;
    double strength_sum = 0.0;
    for (const VolumeNode& node : nodes) {
        merged.min_price = std::min(merged.min_price, node.min_price);
        merged.max_price = std::max(merged.max_price, node.max_price);
        merged.volume += node.volume;
        percent_sum += node.volume_percent;
        ratio_sum += node.volume_ratio;
        strength_sum += node.strength;
    }
    const double count = static_cast<double>(nodes.size());
    merged.price = (merged.min_price + merged.max_price) / 2.0;
    merged.volume_percent = percent_sum / count;
    merged.volume_ratio = ratio_sum / count;
    merged.strength = strength_sum / count;
    merged.node_count = nodes.size();
    merged.is_cluster = true;
    return merged;
}

// Nodes arrive sorted by price. Neighbours at most two bins apart join the same cluster.
std::vector<VolumeNode> cluster_nodes(const std::vector<VolumeNode>& nodes, double bin_size) {
    std::vector<VolumeNode> clusters;
    if (nodes.empty()) {
        return clusters;
    }

    std::vector<VolumeNode> current{nodes.front()};
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        const VolumeNode& node = nodes[i];
        if (node.min_price - current.back().max_price <= bin_size * 2.0) {
            current.push_back(node);
        } else {
            clusters.push_back(merge_cluster(current));
            current.assign(1, node);
        }
    }
    clusters.push_back(merge_cluster(current));
    return clusters;
}

const VolumeNode* find_nearest_node(double price, const std::vector<VolumeNode>& nodes) {
    const VolumeNode* nearest = nullptr;
    double min_distance = 0.0;
    for (const VolumeNode& node : nodes) {
        const double distance = std::fabs(price - node.price);
        if (nearest == nullptr || distance < min_distance) {
            nearest = &node;
            min_distance = distance;
        }
    }
    return nearest;
}

std::string interpret_comparison(double concentration, double hvn_count) {
    if (concentration > 1.2 && hvn_count > 1.2) {
        return "Higher volume concentration and more support/resistance levels than benchmark - more "
               "institutional interest";
    }
    if (concentration < 0.8 && hvn_count < 0.8) {
        return "Lower volume concentration and fewer support/resistance levels - less institutional interest";
    }
    if (concentration > 1.2) {
        return "Higher volume concentration at key levels - strong accumulation/distribution zones";
    }
    return "Volume distribution similar to benchmark - typical trading behavior";
}

ValueAreaExpansion analyze_expansion(const std::vector<ValueAreaTrendPoint>& trend) {
    ValueAreaExpansion out;
    if (trend.empty()) {
        return out;
    }

    const double first = trend.front().width;
    const double last = trend.back().width;
    double sum = 0.0;
    out.min_width = first;
    out.max_width = first;
    for (const ValueAreaTrendPoint& p : trend) {
        sum += p.width;
        out.min_width = std::min(out.min_width, p.width);
        out.max_width = std::max(out.max_width, p.width);
    }
    out.avg_width = sum / static_cast<double>(trend.size());
    out.rate_pct = (first > 0.0) ? ((last - first) / first) * 100.0 : 0.0;

    if (out.rate_pct > kTrendThresholdPct) {
        out.trend = ValueAreaTrend::Expanding;
    } else if (out.rate_pct < -kTrendThresholdPct) {
        out.trend = ValueAreaTrend::Contracting;
    } else {
        out.trend = ValueAreaTrend::Stable;
    }
    return out;
}

std::string day_key(const std::string& date) {
    const std::size_t t_pos = date.find('T');
    const std::size_t space_pos = date.find(' ');
    return date.substr(0, std::min(t_pos, space_pos));
}

std::string period_key(const PricePoint& point, PeriodType period) {
    if (period == PeriodType::Day) {
        return day_key(point.date);
    }

    const std::optional<int64_t> ts = parse_timestamp_utc(point.date, DateFormat::Iso);
    if (!ts.has_value()) {
        return day_key(point.date);
    }
    if (period == PeriodType::Week) {
        int64_t week = *ts / kSecondsPerWeek;
        if (*ts < 0 && *ts % kSecondsPerWeek != 0) {
            --week;
        }
        return "week-" + std::to_string(week);
    }
    return format_date_utc(*ts).substr(0, 7);
}

} // namespace

VolumeProfileStats compute_statistics(const PriceSeries& series, const ProfileSettings& settings) {
    VolumeProfileStats stats;
    if (!settings.is_valid()) {
        stats.warnings.push_back("Volume profile skipped: invalid settings (require num_bins > 0 and "
                                 "0 < value_area_fraction <= 1).");
        return stats;
    }
    if (series.empty()) {
        return stats;
    }

    double min_price = series.front().close;
    double max_price = series.front().close;
    for (const PricePoint& p : series) {
        min_price = std::min(min_price, p.close);
        max_price = std::max(max_price, p.close);
    }
    const double price_range = max_price - min_price;
    if (price_range == 0.0) {
        return flat_statistics(series, min_price);
    }

    const std::size_t num_bins = settings.num_bins;
    const double bin_size = price_range / static_cast<double>(num_bins);

    stats.bins.resize(num_bins);
    for (std::size_t i = 0; i < num_bins; ++i) {
        Zone& bin = stats.bins[i];
        bin.min_price = min_price + static_cast<double>(i) * bin_size;
        bin.max_price = min_price + static_cast<double>(i + 1) * bin_size;
        bin.mid_price = bin.min_price + bin_size / 2.0;
    }

    double total_volume = 0.0;
    for (const PricePoint& p : series) {
        total_volume += p.volume;
        Zone& bin = stats.bins[bin_index(p.close, min_price, bin_size, num_bins)];
        bin.volume += p.volume;
        ++bin.data_points;
    }
    for (Zone& bin : stats.bins) {
        bin.volume_percent = (total_volume > 0.0) ? bin.volume / total_volume : 0.0;
    }

    stats.total_volume = total_volume;
    stats.average_volume_per_bin = total_volume / static_cast<double>(num_bins);
    stats.min_price = min_price;
    stats.max_price = max_price;

    std::size_t poc_index = 0;
    for (std::size_t i = 1; i < num_bins; ++i) {
        if (stats.bins[i].volume > stats.bins[poc_index].volume) {
            poc_index = i;
        }
    }
    const Zone& poc_bin = stats.bins[poc_index];
    stats.poc = PointOfControl{poc_bin.mid_price, poc_bin.min_price, poc_bin.max_price, poc_bin.volume,
                               poc_bin.volume_percent};

    // Value area: heaviest zones first until the target share is reached.
    std::vector<std::size_t> by_volume(num_bins);
    for (std::size_t i = 0; i < num_bins; ++i) {
        by_volume[i] = i;
    }
    std::stable_sort(by_volume.begin(), by_volume.end(), [&](std::size_t a, std::size_t b) {
        return stats.bins[a].volume > stats.bins[b].volume;
    });

    const double target_volume = total_volume * settings.value_area_fraction;
    double accumulated = 0.0;
    std::vector<std::size_t> value_area_indices;
    for (std::size_t index : by_volume) {
        if (accumulated >= target_volume || stats.bins[index].volume <= 0.0) {
            break;
        }
        value_area_indices.push_back(index);
        accumulated += stats.bins[index].volume;
    }
    std::sort(value_area_indices.begin(), value_area_indices.end());
    for (std::size_t index : value_area_indices) {
        stats.value_area.push_back(stats.bins[index]);
    }

    stats.value_area_low = stats.value_area.empty() ? min_price : stats.value_area.front().min_price;
    stats.value_area_high = stats.value_area.empty() ? max_price : stats.value_area.back().max_price;
    stats.value_area_fraction = (total_volume > 0.0) ? accumulated / total_volume : 0.0;

    std::vector<VolumeNode> hvns;
    std::vector<VolumeNode> lvns;
    const double average = stats.average_volume_per_bin;
    for (const Zone& bin : stats.bins) {
        if (bin.volume <= 0.0) {
            continue;
        }
        if (bin.volume >= average * settings.hvn_threshold) {
            hvns.push_back(make_node(bin, NodeType::Hvn, average, poc_bin.volume));
        }
        if (bin.volume < average * settings.lvn_threshold) {
            lvns.push_back(make_node(bin, NodeType::Lvn, average, poc_bin.volume));
        }
    }
    stats.high_volume_nodes = cluster_nodes(hvns, bin_size);
    stats.low_volume_nodes = cluster_nodes(lvns, bin_size);

    return stats;
}

std::vector<VolumeSignal> generate_signals(const PriceSeries& input, const VolumeProfileStats& stats) {
    std::vector<VolumeSignal> signals;
    if (input.empty() || !stats.poc.has_value()) {
        return signals;
    }

    const PriceSeries series = normalize_order(input);
    const double current = series.back().close;
    const PointOfControl& poc = *stats.poc;

    if (poc.price > 0.0 && std::fabs(current - poc.price) / poc.price < kPocProximity) {
        signals.push_back({SignalType::Neutral,
                           "Price at Point of Control",
                           current,
                           poc.price,
                           0.65,
                           "High volume area - expect consolidation or strong move on break"});
    }

    if (series.size() >= 2 && stats.value_area_high.has_value() && stats.value_area_low.has_value()) {
        const double previous = series[series.size() - 2].close;
        const double vah = *stats.value_area_high;
        const double val = *stats.value_area_low;

        if (current > vah && previous <= vah) {
            signals.push_back({SignalType::Buy,
                               "Breakout above Value Area High",
                               current,
                               vah,
                               0.75,
                               "Price moving into low volume territory above value area"});
        }
        if (current < val && previous >= val) {
            signals.push_back({SignalType::Sell,
                               "Breakdown below Value Area Low",
                               current,
                               val,
                               0.75,
                               "Price moving into low volume territory below value area"});
        }
    }

    const VolumeNode* hvn = find_nearest_node(current, stats.high_volume_nodes);
    if (hvn != nullptr && std::fabs(current - hvn->price) / current < kHvnProximity) {
        const bool above = current > hvn->price;
        signals.push_back({SignalType::Hold,
                           std::string("Price near High Volume Node (") + (above ? "above" : "below") + ")",
                           current,
                           hvn->price,
                           0.70,
                           std::string("Strong ") + (above ? "support" : "resistance") +
                               " zone - expect reaction"});
    }

    const VolumeNode* lvn = find_nearest_node(current, stats.low_volume_nodes);
    if (lvn != nullptr && std::fabs(current - lvn->price) / current < kLvnProximity) {
        signals.push_back({SignalType::Watch,
                           "Price in Low Volume Node",
                           current,
                           lvn->price,
                           0.60,
                           "Low volume area - price can move quickly through this zone"});
    }

    return signals;
}

EvolutionResult analyze_evolution(const PriceSeries& input, const EvolutionSettings& settings) {
    EvolutionResult result;
    if (!settings.is_valid()) {
        result.warnings.push_back("Evolution analysis skipped: window_size, step_size and num_bins must be > 0.");
        return result;
    }
    if (input.size() < settings.window_size) {
        result.warnings.push_back("Series is shorter than window_size. No evolution windows produced.");
        return result;
    }

    const PriceSeries series = normalize_order(input);
    ProfileSettings profile;
    profile.num_bins = settings.num_bins;

    for (std::size_t start = 0; start + settings.window_size <= series.size(); start += settings.step_size) {
        const PriceSeries window(series.begin() + static_cast<long>(start),
                                 series.begin() + static_cast<long>(start + settings.window_size));

        EvolutionWindow w;
        w.start_index = start;
        w.end_index = start + settings.window_size - 1;
        w.start_date = window.front().date;
        w.end_date = window.back().date;
        w.stats = compute_statistics(window, profile);

        const std::string& middle_date = window[window.size() / 2].date;
        if (w.stats.poc.has_value()) {
            result.poc_trend.push_back({middle_date, w.stats.poc->price, w.stats.poc->volume});
        }
        const double vah = w.stats.value_area_high.value_or(0.0);
        const double val = w.stats.value_area_low.value_or(0.0);
        result.value_area_trend.push_back({middle_date, vah, val, vah - val});
        result.windows.push_back(std::move(w));
    }

    std::vector<double> poc_prices;
    poc_prices.reserve(result.poc_trend.size());
    for (const PocTrendPoint& p : result.poc_trend) {
        poc_prices.push_back(p.poc_price);
    }
    result.poc_volatility = population_std_dev(poc_prices);
    result.expansion = analyze_expansion(result.value_area_trend);
    return result;
}

ProfileComparison compare_profiles(const PriceSeries& stock,
                                   const PriceSeries& benchmark,
                                   const ProfileSettings& settings) {
    ProfileComparison out;
    out.stock = compute_statistics(stock, settings);
    out.benchmark = compute_statistics(benchmark, settings);

    out.relative_hvn_count =
        static_cast<double>(out.stock.high_volume_nodes.size()) /
        static_cast<double>(std::max<std::size_t>(out.benchmark.high_volume_nodes.size(), 1));

    if (!out.stock.poc.has_value() || !out.benchmark.poc.has_value() ||
        out.benchmark.poc->volume_percent <= 0.0) {
        out.interpretation = "Insufficient data for comparison";
        return out;
    }

    out.relative_volume_concentration = out.stock.poc->volume_percent / out.benchmark.poc->volume_percent;
    out.interpretation = interpret_comparison(out.relative_volume_concentration, out.relative_hvn_count);
    return out;
}

std::vector<PeriodProfile> compute_period_profiles(const PriceSeries& input, const PeriodSettings& settings) {
    std::vector<PeriodProfile> out;
    if (input.empty()) {
        return out;
    }

    const PriceSeries series = normalize_order(input);
    std::vector<std::string> order;
    std::unordered_map<std::string, PriceSeries> groups;
    for (const PricePoint& point : series) {
        const std::string key = period_key(point, settings.period);
        auto it = groups.find(key);
        if (it == groups.end()) {
            order.push_back(key);
            it = groups.emplace(key, PriceSeries{}).first;
        }
        it->second.push_back(point);
    }

    ProfileSettings profile;
    profile.num_bins = settings.num_bins;
    profile.value_area_fraction = settings.value_area_fraction;

    out.reserve(order.size());
    for (const std::string& key : order) {
        const PriceSeries& group = groups[key];
        PeriodProfile period;
        period.period = key;
        period.start_date = group.front().date;
        period.end_date = group.back().date;
        period.stats = compute_statistics(group, profile);
        out.push_back(std::move(period));
    }
    return out;
}

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::Buy:
            return "BUY";
        case SignalType::Sell:
            return "SELL";
        case SignalType::Hold:
            return "HOLD";
        case SignalType::Watch:
            return "WATCH";
        case SignalType::Neutral:
            return "NEUTRAL";
    }
    return "NEUTRAL";
}

const char* to_string(NodeType type) {
    return (type == NodeType::Hvn) ? "HVN" : "LVN";
}

const char* to_string(ValueAreaTrend trend) {
    switch (trend) {
        case ValueAreaTrend::Expanding:
            return "expanding";
        case ValueAreaTrend::Contracting:
            return "contracting";
        case ValueAreaTrend::Stable:
            return "stable";
    }
    return "stable";
}

} // namespace volprof
