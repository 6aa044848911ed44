#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace volprof {

enum class DateFormat {
    Iso,
    Mdy,
    Dmy,
};

// Dates are ISO-8601 text, so lexical order is chronological order.
struct PricePoint {
    std::string date;
    double close{0.0};
    double volume{0.0};
    std::optional<double> high;
    std::optional<double> low;
};

using PriceSeries = std::vector<PricePoint>;

// [min_price, max_price), the topmost zone of a layout is closed.
struct Zone {
    double min_price{0.0};
    double max_price{0.0};
    double mid_price{0.0};
    double volume{0.0};
    double volume_percent{0.0}; // fraction of total volume [0,1]
    std::size_t data_points{0};
};

struct PointOfControl {
    double price{0.0};
    double min_price{0.0};
    double max_price{0.0};
    double volume{0.0};
    double volume_percent{0.0};
};

enum class NodeType {
    Hvn,
    Lvn,
};

struct VolumeNode {
    NodeType type{NodeType::Hvn};
    double price{0.0};
    double min_price{0.0};
    double max_price{0.0};
    double volume{0.0};
    double volume_percent{0.0};
    double volume_ratio{0.0}; // volume / average volume per bin
    double strength{0.0};     // HVN: volume / POC volume, LVN: 1 - volume_ratio
    std::size_t node_count{1};
    bool is_cluster{false};
};

struct ProfileSettings {
    std::size_t num_bins{50};
    double value_area_fraction{0.70};
    double hvn_threshold{1.5};
    double lvn_threshold{0.5};

    bool is_valid() const {
        return num_bins > 0 && value_area_fraction > 0.0 && value_area_fraction <= 1.0 && hvn_threshold > 0.0 &&
               lvn_threshold >= 0.0;
    }
};

struct VolumeProfileStats {
    std::optional<PointOfControl> poc;
    std::optional<double> value_area_high;
    std::optional<double> value_area_low;
    std::vector<Zone> value_area;
    std::vector<VolumeNode> high_volume_nodes;
    std::vector<VolumeNode> low_volume_nodes;
    std::vector<Zone> bins;
    double total_volume{0.0};
    double average_volume_per_bin{0.0};
    double value_area_fraction{0.0}; // accumulated share actually covered
    double min_price{0.0};
    double max_price{0.0};
    std::vector<std::string> warnings;
};

enum class SignalType {
    Buy,
    Sell,
    Hold,
    Watch,
    Neutral,
};

struct VolumeSignal {
    SignalType type{SignalType::Neutral};
    std::string reason;
    double price{0.0};
    double reference_price{0.0};
    double confidence{0.0};
    std::string detail;
};

struct EvolutionSettings {
    std::size_t window_size{30};
    std::size_t step_size{5};
    std::size_t num_bins{50};

    bool is_valid() const {
        return window_size > 0 && step_size > 0 && num_bins > 0;
    }
};

struct EvolutionWindow {
    std::size_t start_index{0};
    std::size_t end_index{0};
    std::string start_date;
    std::string end_date;
    VolumeProfileStats stats;
};

struct PocTrendPoint {
    std::string date;
    double poc_price{0.0};
    double poc_volume{0.0};
};

struct ValueAreaTrendPoint {
    std::string date;
    double value_area_high{0.0};
    double value_area_low{0.0};
    double width{0.0};
};

enum class ValueAreaTrend {
    Expanding,
    Contracting,
    Stable,
};

struct ValueAreaExpansion {
    ValueAreaTrend trend{ValueAreaTrend::Stable};
    double rate_pct{0.0};
    double avg_width{0.0};
    double min_width{0.0};
    double max_width{0.0};
};

struct EvolutionResult {
    std::vector<EvolutionWindow> windows;
    std::vector<PocTrendPoint> poc_trend;
    std::vector<ValueAreaTrendPoint> value_area_trend;
    double poc_volatility{0.0};
    ValueAreaExpansion expansion;
    std::vector<std::string> warnings;
};

struct ProfileComparison {
    VolumeProfileStats stock;
    VolumeProfileStats benchmark;
    double relative_volume_concentration{0.0};
    double relative_hvn_count{0.0};
    std::string interpretation;
};

enum class PeriodType {
    Day,
    Week,
    Month,
};

struct PeriodSettings {
    PeriodType period{PeriodType::Day};
    std::size_t num_bins{50};
    double value_area_fraction{0.70};
};

struct PeriodProfile {
    std::string period;
    std::string start_date;
    std::string end_date;
    VolumeProfileStats stats;
};

// Breakout detection.

enum class WindowPolicy {
    Continuous,   // a break does not end the window
    SplitOnBreak, // a break ends the window, the next starts right after it
};

enum class BreakRule {
    TwoNearest,      // both nearest non-zero zones must outweigh the current zone
    AnyOrMergedPair, // any single zone or adjacent pair may outweigh it
};

struct ZoomRange {
    std::size_t start{0};
    std::optional<std::size_t> end; // exclusive, empty means series end
};

struct BreakoutSettings {
    std::size_t warmup_size{75};
    double min_support_weight{0.10};
    double weight_differential{0.04};
    std::size_t lookback_zones{10};
    std::size_t lookahead_zones{3};
    std::size_t points_per_zone{15};
    std::size_t min_zones{15};
    std::size_t max_zones{20};
    BreakRule rule{BreakRule::TwoNearest};
    WindowPolicy window_policy{WindowPolicy::Continuous};
    bool detect_breakdowns{true};

    bool is_valid() const {
        return lookback_zones > 0 && lookahead_zones > 0 && points_per_zone > 0 && min_zones > 0 &&
               min_zones <= max_zones && min_support_weight >= 0.0 && weight_differential >= 0.0;
    }
};

struct BreakSignal {
    std::string date;
    double price{0.0};
    bool is_up_break{true};
    std::size_t window_index{0};
    double level{0.0}; // support (up) or resistance (down) zone bound
    double current_weight{0.0};
    double triggering_zone_weight{0.0};
};

struct WeightedZone {
    double min_price{0.0};
    double max_price{0.0};
    double volume{0.0};
    double weight{0.0};
};

struct WindowPoint {
    std::string date;
    double price{0.0};
    double volume{0.0};
    std::vector<WeightedZone> zones;
    std::size_t current_zone_index{0};
    double zone_height{0.0};
};

struct ProfileWindow {
    std::size_t window_index{0};
    std::string start_date;
    std::string end_date;
    std::vector<WindowPoint> points;
    bool break_detected{false};
};

struct BreakoutResult {
    std::vector<ProfileWindow> windows;
    std::vector<BreakSignal> breaks;
    std::vector<std::string> warnings;
};

// Trade simulation.

enum class WarmupPolicy {
    BarsSinceLastSell, // gates the next BUY
    AllTimeHighReset,  // gates SELL breaks after a new all-time high
};

struct SimulationSettings {
    double transaction_fee{0.003};
    double cutoff_pct{0.12};
    double trailing_pct{0.08};
    std::size_t min_bars_between_trades{75};
    WarmupPolicy warmup_policy{WarmupPolicy::BarsSinceLastSell};
    bool exit_below_heaviest_zone{false};
    bool apply_fees_to_open_trade{false};

    bool is_valid() const {
        return transaction_fee >= 0.0 && transaction_fee < 1.0 && cutoff_pct >= 0.0 && cutoff_pct < 1.0 &&
               trailing_pct >= 0.0 && trailing_pct < 1.0;
    }
};

struct Trade {
    double buy_price{0.0};
    std::string buy_date;
    double sell_price{0.0};
    std::string sell_date;
    double pl_percent{0.0};
    bool is_cutoff{false};
    bool is_open{false};
};

struct SellEvent {
    std::string date;
    double price{0.0};
    bool is_cutoff{false};
    std::string reason;
};

struct CutoffPoint {
    std::string date;
    double price{0.0};
    int trade_id{0};
};

struct SimulationResult {
    std::vector<Trade> trades;
    double total_pl{0.0};
    double win_rate{0.0};
    double market_change{0.0};
    int trading_signals{0};
    bool is_holding{false};
    std::vector<SellEvent> sell_events;
    std::vector<CutoffPoint> cutoff_trail;
    std::vector<std::string> sell_dates;
    std::vector<std::string> warnings;
};

struct StrategyResult {
    BreakoutResult detection;
    SimulationResult simulation;
};

// Channel search.

enum class TurningPointType {
    Max,
    Min,
};

struct TurningPoint {
    std::size_t index{0};
    TurningPointType type{TurningPointType::Max};
    double value{0.0};
};

struct Regression {
    double slope{0.0};
    double intercept{0.0};
    double std_dev{0.0};
    double r_squared{0.0};
    std::size_t points{0};
};

struct ChannelSearchSettings {
    std::size_t min_start{0};
    std::optional<std::size_t> max_start; // default: series length - 20
    std::size_t min_length{20};
    std::optional<std::size_t> max_length; // default: to the end of the series
    std::size_t start_step{5};
    std::size_t length_step{5};
    std::vector<double> stdev_multipliers{1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};
    double touch_tolerance{0.05};
    double similarity_threshold{0.9};
    std::size_t turning_point_window{3};
    double max_outside_fraction{1.0}; // 1.0 disables the band containment check
    bool volume_filter_enabled{false};

    bool is_valid() const {
        return min_length >= 2 && start_step > 0 && length_step > 0 && !stdev_multipliers.empty() &&
               touch_tolerance >= 0.0 && similarity_threshold >= 0.0 && turning_point_window > 0;
    }
};

struct Channel {
    std::size_t start_index{0};
    std::size_t end_index{0};
    double slope{0.0};
    double intercept{0.0};
    double std_dev{0.0};
    double channel_width{0.0};
    double stdev_multiplier{0.0};
    int touch_count{0};
    std::size_t turning_points_count{0};
    double percent_within_bounds{1.0};
    std::size_t length{0};
};

// Import.

struct ImportIssue {
    std::size_t line{0};
    std::string message;
};

struct ImportResult {
    bool success{false};
    bool partial_success{false};
    std::size_t dropped_rows{0};
    PriceSeries series;
    std::vector<ImportIssue> warnings;
    std::vector<ImportIssue> errors;
};

} // namespace volprof
