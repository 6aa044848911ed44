#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "volprof/volume_profile.hpp"

using volprof_test::check_near;
using volprof_test::check_true;
using volprof_test::contains_warning;
using volprof_test::make_series;

namespace {

volprof::PriceSeries wave_series(std::size_t n) {
    std::vector<double> closes;
    std::vector<double> volumes;
    for (std::size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        closes.push_back(100.0 + 10.0 * std::sin(x * 0.3) + x * 0.1);
        volumes.push_back(1000.0 + static_cast<double>((i * 37) % 500));
    }
    return make_series(closes, volumes);
}

void test_bins_partition_volume() {
    const volprof::PriceSeries series = wave_series(80);
    volprof::ProfileSettings settings;
    settings.num_bins = 25;
    const auto stats = volprof::compute_statistics(series, settings);

    check_true(stats.bins.size() == 25, "profile should produce num_bins zones");
    double volume_sum = 0.0;
    double percent_sum = 0.0;
    std::size_t points = 0;
    for (const auto& bin : stats.bins) {
        volume_sum += bin.volume;
        percent_sum += bin.volume_percent;
        points += bin.data_points;
    }
    double series_volume = 0.0;
    for (const auto& p : series) {
        series_volume += p.volume;
    }
    check_near(volume_sum, stats.total_volume, 1e-6, "zone volumes should add up to total volume");
    check_near(stats.total_volume, series_volume, 1e-6, "total volume should match series volume");
    check_near(percent_sum, 1.0, 1e-9, "zone shares should add up to one");
    check_true(points == series.size(), "every point should land in exactly one zone");

    check_near(stats.bins.front().min_price, stats.min_price, 1e-12, "first zone should start at series min");
    check_near(stats.bins.back().max_price, stats.max_price, 1e-9, "last zone should end at series max");
    for (std::size_t i = 1; i < stats.bins.size(); ++i) {
        check_near(stats.bins[i].min_price, stats.bins[i - 1].max_price, 1e-9, "zones should be contiguous");
    }
}

void test_poc_and_value_area() {
    const auto stats = volprof::compute_statistics(wave_series(80));
    check_true(stats.poc.has_value(), "POC should exist for a non-empty series");
    if (!stats.poc.has_value()) {
        return;
    }

    double max_volume = 0.0;
    for (const auto& bin : stats.bins) {
        max_volume = std::max(max_volume, bin.volume);
    }
    check_near(stats.poc->volume, max_volume, 1e-9, "POC should be the heaviest zone");

    check_true(stats.value_area_fraction >= 0.70 - 1e-12, "value area should cover at least the target share");
    check_true(stats.value_area_fraction <= 1.0 + 1e-12, "value area share should not exceed one");
    check_true(stats.value_area_fraction < 0.70 + stats.poc->volume_percent + 1e-12,
               "value area should stop once the target share is reached");
    check_true(stats.value_area_low.has_value() && stats.value_area_high.has_value(), "value area bounds should exist");
    check_true(*stats.value_area_low <= stats.poc->price && stats.poc->price <= *stats.value_area_high,
               "POC should lie inside the value area");
    check_true(std::is_sorted(stats.value_area.begin(),
                              stats.value_area.end(),
                              [](const volprof::Zone& a, const volprof::Zone& b) { return a.min_price < b.min_price; }),
               "value area zones should be ordered by price");
}

void test_poc_tie_prefers_lowest_zone() {
    const auto series = make_series({10.0, 20.0}, 500.0);
    volprof::ProfileSettings settings;
    settings.num_bins = 2;
    const auto stats = volprof::compute_statistics(series, settings);
    check_true(stats.poc.has_value(), "tie series should have a POC");
    if (stats.poc.has_value()) {
        check_near(stats.poc->price, 12.5, 1e-12, "equal zones should resolve to the lowest zone");
    }
}

void test_three_point_profile() {
    const auto series = make_series({100.0, 101.0, 102.0}, {1000000.0, 1200000.0, 800000.0});
    volprof::ProfileSettings settings;
    settings.num_bins = 10;
    const auto stats = volprof::compute_statistics(series, settings);

    check_true(stats.bins.size() == 10, "three point series should produce ten zones");
    check_near(stats.min_price, 100.0, 1e-12, "profile should start at 100");
    check_near(stats.max_price, 102.0, 1e-12, "profile should end at 102");
    check_near(stats.total_volume, 3000000.0, 1e-6, "three point total volume");
    check_true(stats.poc.has_value() && stats.poc->volume_percent > 0.0, "POC should carry volume");
    if (stats.poc.has_value()) {
        check_near(stats.poc->volume, 1200000.0, 1e-6, "POC should hold the heaviest point");
    }
}

void test_flat_series() {
    const auto stats = volprof::compute_statistics(make_series({50.0, 50.0, 50.0}, 100.0));
    check_true(stats.bins.size() == 1, "flat series should collapse to one zone");
    check_true(stats.poc.has_value(), "flat series should still have a POC");
    if (stats.poc.has_value()) {
        check_near(stats.poc->price, 50.0, 1e-12, "flat POC price");
        check_near(stats.poc->volume_percent, 1.0, 1e-12, "flat POC carries all volume");
    }
    check_near(stats.value_area_high.value_or(0.0), 50.0, 1e-12, "flat VAH");
    check_near(stats.value_area_low.value_or(0.0), 50.0, 1e-12, "flat VAL");
    check_near(stats.total_volume, 300.0, 1e-12, "flat total volume");
}

void test_empty_and_invalid() {
    const auto empty = volprof::compute_statistics(volprof::PriceSeries{});
    check_true(!empty.poc.has_value(), "empty series should have no POC");
    check_true(empty.bins.empty() && empty.value_area.empty(), "empty series should have no zones");
    check_true(empty.high_volume_nodes.empty() && empty.low_volume_nodes.empty(), "empty series should have no nodes");
    check_true(!empty.value_area_high.has_value(), "empty series should have no value area");

    volprof::ProfileSettings bad;
    bad.num_bins = 0;
    const auto invalid = volprof::compute_statistics(make_series({1.0, 2.0}, 1.0), bad);
    check_true(!invalid.poc.has_value(), "invalid settings should produce no POC");
    check_true(contains_warning(invalid.warnings, "invalid settings"), "invalid settings should warn");
}

void test_equal_zones_have_no_hvn() {
    // Zones: 500k, 0, 500k. Average is 333k, so an HVN would need more than 500k.
    const auto series = make_series({10.0, 20.0}, 500000.0);
    volprof::ProfileSettings settings;
    settings.num_bins = 3;
    settings.hvn_threshold = 1.6;
    const auto stats = volprof::compute_statistics(series, settings);
    check_near(stats.bins[1].volume, 0.0, 1e-12, "middle zone should be empty");
    check_true(stats.high_volume_nodes.empty(), "no zone should qualify as HVN");
    check_true(stats.low_volume_nodes.empty(), "empty zones should never be LVNs");
}

void test_single_hvn() {
    std::vector<double> volumes(10, 100.0);
    volumes[5] = 1000.0;
    const auto series = make_series({10, 11, 12, 13, 14, 15, 16, 17, 18, 19}, volumes);
    volprof::ProfileSettings settings;
    settings.num_bins = 10;
    const auto stats = volprof::compute_statistics(series, settings);

    check_true(stats.high_volume_nodes.size() == 1, "one heavy zone should give one HVN");
    check_true(stats.low_volume_nodes.empty(), "uniform light zones are not LVNs");
    if (stats.high_volume_nodes.size() == 1) {
        const auto& hvn = stats.high_volume_nodes.front();
        check_true(!hvn.is_cluster && hvn.node_count == 1, "single HVN should not be a cluster");
        check_near(hvn.volume, 1000.0, 1e-9, "HVN volume");
        check_near(hvn.strength, 1.0, 1e-12, "HVN at the POC has full strength");
        check_near(hvn.volume_ratio, 1000.0 / 190.0, 1e-9, "HVN ratio against average zone volume");
    }
}

void test_lvn_cluster() {
    std::vector<double> volumes(10, 100.0);
    volumes[2] = 10.0;
    volumes[3] = 10.0;
    const auto series = make_series({10, 11, 12, 13, 14, 15, 16, 17, 18, 19}, volumes);
    volprof::ProfileSettings settings;
    settings.num_bins = 10;
    const auto stats = volprof::compute_statistics(series, settings);

    check_true(stats.low_volume_nodes.size() == 1, "adjacent thin zones should merge into one LVN cluster");
    if (stats.low_volume_nodes.size() == 1) {
        const auto& lvn = stats.low_volume_nodes.front();
        check_true(lvn.is_cluster && lvn.node_count == 2, "LVN cluster should hold two zones");
        check_near(lvn.volume, 20.0, 1e-9, "cluster volume should be the sum of its zones");
        check_near(lvn.min_price, stats.bins[2].min_price, 1e-12, "cluster lower bound");
        check_near(lvn.max_price, stats.bins[3].max_price, 1e-12, "cluster upper bound");
        check_true(std::string(volprof::to_string(lvn.type)) == "LVN", "LVN label");
    }
}

void test_signals() {
    volprof::VolumeProfileStats stats;
    stats.poc = volprof::PointOfControl{100.0, 99.0, 101.0, 1000.0, 0.2};
    stats.value_area_high = 105.0;
    stats.value_area_low = 95.0;

    const auto breakout = volprof::generate_signals(make_series({104.0, 106.0}, 1.0), stats);
    check_true(breakout.size() == 1 && breakout.front().type == volprof::SignalType::Buy,
               "crossing VAH should give a single BUY");

    const auto breakdown = volprof::generate_signals(make_series({96.0, 94.0}, 1.0), stats);
    check_true(breakdown.size() == 1 && breakdown.front().type == volprof::SignalType::Sell,
               "crossing VAL should give a single SELL");

    const auto at_poc = volprof::generate_signals(make_series({100.0, 100.5}, 1.0), stats);
    check_true(at_poc.size() == 1 && at_poc.front().type == volprof::SignalType::Neutral,
               "price near POC should be NEUTRAL");

    volprof::VolumeNode hvn;
    hvn.price = 110.0;
    stats.high_volume_nodes.push_back(hvn);
    const auto near_hvn = volprof::generate_signals(make_series({109.0, 109.5}, 1.0), stats);
    check_true(near_hvn.size() == 1 && near_hvn.front().type == volprof::SignalType::Hold,
               "price near HVN should be HOLD");
    if (!near_hvn.empty()) {
        check_true(near_hvn.front().reason.find("below") != std::string::npos, "price under HVN reads as below");
    }

    check_true(volprof::generate_signals(volprof::PriceSeries{}, stats).empty(), "empty series gives no signals");
}

void test_evolution() {
    std::vector<double> closes;
    for (std::size_t i = 0; i < 40; ++i) {
        closes.push_back(10.0 + static_cast<double>(i % 5));
    }
    volprof::EvolutionSettings settings;
    settings.window_size = 30;
    settings.step_size = 5;
    settings.num_bins = 10;
    const auto result = volprof::analyze_evolution(make_series(closes, 100.0), settings);

    check_true(result.windows.size() == 3, "40 points with window 30 step 5 should give three windows");
    check_true(result.poc_trend.size() == 3, "each window should report a POC");
    check_near(result.poc_volatility, 0.0, 1e-12, "identical windows should not move the POC");
    check_true(result.expansion.trend == volprof::ValueAreaTrend::Stable, "identical windows should be stable");
    if (result.windows.size() == 3) {
        check_true(result.windows[1].start_index == 5 && result.windows[1].end_index == 34, "second window range");
    }

    const auto short_result = volprof::analyze_evolution(make_series({1.0, 2.0}, 1.0), settings);
    check_true(short_result.windows.empty(), "short series should produce no windows");
    check_true(contains_warning(short_result.warnings, "shorter than window_size"), "short series should warn");
}

void test_compare_profiles() {
    const auto series = wave_series(60);
    const auto same = volprof::compare_profiles(series, series);
    check_near(same.relative_volume_concentration, 1.0, 1e-12, "identical series have equal concentration");
    check_true(same.interpretation.find("similar") != std::string::npos, "identical series read as similar");

    const auto missing = volprof::compare_profiles(volprof::PriceSeries{}, series);
    check_true(missing.interpretation == "Insufficient data for comparison", "missing POC should be reported");
}

void test_period_profiles() {
    volprof::PriceSeries series = make_series({10.0, 11.0, 12.0}, 100.0);
    series[0].date = "2024-01-04";
    series[1].date = "2024-01-10";
    series[2].date = "2024-02-11";

    volprof::PeriodSettings settings;
    settings.num_bins = 5;

    settings.period = volprof::PeriodType::Month;
    const auto months = volprof::compute_period_profiles(series, settings);
    check_true(months.size() == 2, "two calendar months should give two profiles");
    if (months.size() == 2) {
        check_true(months[0].period == "2024-01" && months[1].period == "2024-02", "month keys");
        check_true(months[0].start_date == "2024-01-04" && months[0].end_date == "2024-01-10", "month date span");
    }

    settings.period = volprof::PeriodType::Week;
    check_true(volprof::compute_period_profiles(series, settings).size() == 2,
               "Thursday through Wednesday should share a week");

    settings.period = volprof::PeriodType::Day;
    check_true(volprof::compute_period_profiles(series, settings).size() == 3, "each day is its own period");
}

} // namespace

int main() {
    test_bins_partition_volume();
    test_poc_and_value_area();
    test_poc_tie_prefers_lowest_zone();
    test_three_point_profile();
    test_flat_series();
    test_empty_and_invalid();
    test_equal_zones_have_no_hvn();
    test_single_hvn();
    test_lvn_cluster();
    test_signals();
    test_evolution();
    test_compare_profiles();
    test_period_profiles();
    return volprof_test::finish();
}
