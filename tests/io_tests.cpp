#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "volprof/analysis_cache.hpp"
#include "volprof/channel_finder.hpp"
#include "volprof/csv_importer.hpp"
#include "volprof/exporter.hpp"
#include "volprof/series_utils.hpp"
#include "volprof/time_utils.hpp"
#include "volprof/trade_simulator.hpp"
#include "volprof/volume_profile.hpp"

using volprof_test::check_near;
using volprof_test::check_true;
using volprof_test::make_series;
using volprof_test::src_path;

namespace {

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 0;
    for (char ch : text) {
        if (ch == '\n') {
            ++lines;
        }
    }
    return lines;
}

bool has_issue(const std::vector<volprof::ImportIssue>& issues, const std::string& needle) {
    for (const auto& issue : issues) {
        if (issue.message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void test_timestamp_format() {
    const auto ts = volprof::parse_timestamp_utc("2024-01-05", volprof::DateFormat::Iso);
    check_true(ts.has_value(), "ISO timestamp should parse");
    if (!ts.has_value()) {
        return;
    }
    check_true(volprof::format_timestamp_utc_iso8601(*ts) == "2024-01-05T00:00:00Z",
               "UTC timestamp formatting should include Z suffix");
    check_true(volprof::format_series_date(*ts) == "2024-01-05", "midnight series dates are plain dates");

    const auto with_time = volprof::parse_timestamp_utc("2024-01-05T13:45:00", volprof::DateFormat::Iso);
    check_true(with_time.has_value() && volprof::format_series_date(*with_time) == "2024-01-05T13:45:00Z",
               "intraday series dates keep the time");

    check_true(volprof::parse_timestamp_utc("01/05/2024", volprof::DateFormat::Mdy) == ts,
               "MDY parsing should match ISO");
    check_true(volprof::parse_timestamp_utc("05/01/2024", volprof::DateFormat::Dmy) == ts,
               "DMY parsing should match ISO");
    check_true(!volprof::parse_timestamp_utc("2024-13-01", volprof::DateFormat::Iso).has_value(),
               "month 13 should be rejected");

    const auto split = volprof::parse_date_time_utc_yyyymmdd_hhmmss("20240102", "10000");
    check_true(split.has_value() && volprof::format_timestamp_utc_iso8601(*split) == "2024-01-02T01:00:00Z",
               "short TIME values should be zero padded");
    check_true(!volprof::parse_date_time_utc_yyyymmdd_hhmmss("2024012", "000000").has_value(),
               "short DTYYYYMMDD should be rejected");
}

void test_import_filtering_sort_and_duplicates() {
    const auto import =
        volprof::import_price_csv(src_path("data/sample_mixed_invalid.csv").string(), volprof::DateFormat::Iso);
    check_true(import.success, "mixed-invalid sample should import successfully");
    check_true(import.partial_success, "mixed-invalid sample should be partial success");
    check_true(import.dropped_rows == 3, "mixed-invalid sample should drop three rows");
    check_true(import.series.size() == 4, "mixed-invalid sample should keep four rows");
    if (import.series.size() != 4) {
        return;
    }

    check_true(volprof::is_ascending(import.series), "import output should be sorted ascending");
    check_true(import.series.front().date == "2024-01-01", "first imported date");
    check_near(import.series[1].close, 10.9, 1e-12, "duplicate date should keep the last row");
    check_true(import.series[1].high.has_value() && !import.series[3].high.has_value(),
               "high is optional per row");
    check_true(has_issue(import.warnings, "unsorted"), "unsorted warning should be present");
    check_true(has_issue(import.warnings, "Duplicate timestamps"), "duplicate timestamp warning should be present");
    check_true(has_issue(import.warnings, "close must be > 0"), "non-positive close should be reported");
}

void test_split_datetime_headers() {
    const auto import =
        volprof::import_price_csv(src_path("data/sample_split_datetime.csv").string(), volprof::DateFormat::Iso);
    check_true(import.success, "split datetime format should import successfully");
    check_true(!import.partial_success, "split datetime sample should have no dropped rows");
    check_true(import.series.size() == 3, "split datetime sample should import all rows");
    if (import.series.size() != 3) {
        return;
    }

    check_true(import.series[0].date == "2024-01-02", "midnight bar should keep a plain date");
    check_true(import.series[1].date == "2024-01-02T01:00:00Z", "second bar should parse from DTYYYYMMDD+TIME");
    check_near(import.series[2].volume, 90.0, 1e-12, "VOL column should map to volume");
}

void test_import_failures() {
    const auto missing = volprof::import_price_csv(src_path("data/does_not_exist.csv").string(),
                                                   volprof::DateFormat::Iso);
    check_true(!missing.success && !missing.errors.empty(), "missing file should fail");

    const std::filesystem::path tmp = std::filesystem::temp_directory_path() / "volprof_no_volume.csv";
    {
        std::ofstream out(tmp);
        out << "Date,Close\n2024-01-01,10\n";
    }
    const auto no_volume = volprof::import_price_csv(tmp.string(), volprof::DateFormat::Iso);
    check_true(!no_volume.success, "missing volume column should fail");
    check_true(has_issue(no_volume.errors, "Missing required columns"), "missing column error should be reported");
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
}

void test_series_helpers() {
    volprof::PriceSeries newest_first = make_series({1.0, 2.0, 3.0, 4.0, 5.0}, 1.0);
    std::reverse(newest_first.begin(), newest_first.end());
    check_true(!volprof::is_ascending(newest_first), "reversed series is not ascending");
    const auto ordered = volprof::normalize_order(newest_first);
    check_true(volprof::is_ascending(ordered) && ordered.front().close == 1.0, "normalize should reverse");

    const auto sma = volprof::simple_moving_average(ordered, 3);
    check_true(sma.size() == 5 && !sma[0].has_value() && !sma[1].has_value(), "SMA needs a full period");
    check_near(sma[2].value_or(0.0), 2.0, 1e-12, "first SMA value");
    check_near(sma[4].value_or(0.0), 4.0, 1e-12, "last SMA value");

    check_near(volprof::population_std_dev({2, 4, 4, 4, 5, 5, 7, 9}), 2.0, 1e-12, "population stdev");
}

void test_exporters() {
    const auto import =
        volprof::import_price_csv(src_path("data/sample_prices.csv").string(), volprof::DateFormat::Iso);
    check_true(import.success, "sample prices should import");
    if (!import.success) {
        return;
    }

    const volprof::ProfileSettings profile;
    const auto stats = volprof::compute_statistics(import.series, profile);
    const auto signals = volprof::generate_signals(import.series, stats);
    const volprof::BreakoutSettings detector;
    const volprof::SimulationSettings simulation;
    const auto strategy = volprof::run_breakout_strategy(import.series, volprof::ZoomRange{}, detector, simulation);

    const std::filesystem::path tmp_dir = std::filesystem::temp_directory_path() / "volprof_io_tests";
    std::filesystem::create_directories(tmp_dir);
    std::string error;

    check_true(volprof::export_profile_json((tmp_dir / "profile.json").string(), profile, stats, signals, &error),
               "profile export should succeed");
    check_true(volprof::export_zones_csv((tmp_dir / "zones.csv").string(), stats, &error),
               "zones export should succeed");
    check_true(volprof::export_breaks_csv((tmp_dir / "breaks.csv").string(), strategy.detection, &error),
               "breaks export should succeed");
    check_true(volprof::export_trades_csv((tmp_dir / "trades.csv").string(), strategy.simulation, &error),
               "trades export should succeed");
    check_true(volprof::export_simulation_json(
                   (tmp_dir / "simulation.json").string(), detector, simulation, strategy.simulation, &error),
               "simulation export should succeed");

    const std::string profile_json = read_all(tmp_dir / "profile.json");
    check_true(profile_json.find("\"poc\": {") != std::string::npos, "profile JSON should carry the POC");
    check_true(profile_json.find("Not investment advice") != std::string::npos, "profile JSON disclaimer");

    const std::string zones_csv = read_all(tmp_dir / "zones.csv");
    check_true(zones_csv.rfind("min_price,max_price,mid_price,volume,volume_percent,data_points\n", 0) == 0,
               "zones CSV header");
    check_true(count_lines(zones_csv) == stats.bins.size() + 1, "one zones row per bin");

    const std::string trades_csv = read_all(tmp_dir / "trades.csv");
    check_true(count_lines(trades_csv) == strategy.simulation.trades.size() + 1, "one trades row per trade");

    const std::string breaks_csv = read_all(tmp_dir / "breaks.csv");
    check_true(count_lines(breaks_csv) == strategy.detection.breaks.size() + 1, "one breaks row per break");

    const std::string simulation_json = read_all(tmp_dir / "simulation.json");
    check_true(simulation_json.find("\"total_pl_pct\"") != std::string::npos, "simulation JSON results");

    check_true(!volprof::export_channels_csv("/nonexistent_volprof_dir/channels.csv", {}, &error),
               "export into a missing directory should fail");
    check_true(error.find("Failed to open") != std::string::npos, "export failure should be described");

    std::error_code ec;
    std::filesystem::remove_all(tmp_dir, ec);
}

void test_json_escaping() {
    volprof::VolumeSignal signal;
    signal.type = volprof::SignalType::Watch;
    signal.reason = "line one\nline two";
    signal.detail = "tab\there \"quoted\" \\ bell\x01";

    const std::filesystem::path tmp = std::filesystem::temp_directory_path() / "volprof_escaping.json";
    std::string error;
    check_true(volprof::export_profile_json(
                   tmp.string(), volprof::ProfileSettings{}, volprof::VolumeProfileStats{}, {signal}, &error),
               "profile export with control characters should succeed");

    const std::string json = read_all(tmp);
    check_true(json.find("\"reason\": \"line one\\nline two\"") != std::string::npos, "newline should be escaped");
    check_true(json.find("\"detail\": \"tab\\there \\\"quoted\\\" \\\\ bell\\u0001\"") != std::string::npos,
               "tab, quote, backslash and other control characters should be escaped");
    check_true(json.find("line one\nline two") == std::string::npos, "no raw newline inside a string value");

    std::error_code ec;
    std::filesystem::remove(tmp, ec);
}

void test_sample_pipeline() {
    const auto import =
        volprof::import_price_csv(src_path("data/sample_prices.csv").string(), volprof::DateFormat::Iso);
    check_true(import.success && import.series.size() == 160, "sample prices should import all rows");
    if (!import.success) {
        return;
    }
    check_true(has_issue(import.warnings, "unsorted"), "newest-first file should be reported as unsorted");

    const auto strategy = volprof::run_breakout_strategy(import.series);
    for (const auto& b : strategy.detection.breaks) {
        check_true(b.date >= import.series.front().date && b.date <= import.series.back().date,
                   "breaks should fall inside the series");
    }
    const auto& trades = strategy.simulation.trades;
    for (std::size_t i = 0; i < trades.size(); ++i) {
        check_true(trades[i].buy_date <= trades[i].sell_date, "trade should sell after it buys");
        check_true(!trades[i].is_open || i + 1 == trades.size(), "only the last trade may be open");
        if (i > 0) {
            check_true(trades[i - 1].sell_date <= trades[i].buy_date, "positions should never overlap");
        }
    }
}

void test_analysis_cache() {
    const auto import =
        volprof::import_price_csv(src_path("data/sample_prices.csv").string(), volprof::DateFormat::Iso);
    if (!import.success) {
        check_true(false, "sample prices should import for cache test");
        return;
    }

    volprof::AnalysisCache cache;
    const volprof::ProfileSettings settings;
    const auto& first = cache.statistics(import.series, settings);
    const auto& second = cache.statistics(import.series, settings);
    check_true(&first == &second, "repeated request should reuse the cached result");
    check_true(cache.hits() == 1 && cache.misses() == 1, "one miss then one hit");

    volprof::ProfileSettings coarse;
    coarse.num_bins = 10;
    check_true(cache.statistics(import.series, coarse).bins.size() == 10, "different settings compute anew");
    check_true(cache.misses() == 2, "different settings should miss");

    const auto& sma = cache.moving_average(import.series, 20);
    check_true(sma.size() == import.series.size() && sma[19].has_value(), "cached SMA");

    volprof::ChannelSearchSettings channels;
    channels.start_step = 20;
    channels.length_step = 20;
    const auto& cached_channels = cache.best_channels(import.series, channels);
    check_true(cached_channels.size() == volprof::find_best_channels(import.series, channels).size(),
               "cached channels should match a direct search");
    check_true(cache.size() == 4, "four entries should be cached");

    volprof::PriceSeries changed = import.series;
    changed.back().close += 1.0;
    check_true(volprof::fingerprint(changed) != volprof::fingerprint(import.series), "edits change the fingerprint");
    cache.statistics(changed, settings);
    check_true(cache.size() == 5, "edited series is a separate entry");

    cache.invalidate(import.series);
    check_true(cache.size() == 1, "invalidate should drop every entry of the series");
    cache.clear();
    check_true(cache.size() == 0, "clear should empty the cache");
}

} // namespace

int main() {
    test_timestamp_format();
    test_import_filtering_sort_and_duplicates();
    test_split_datetime_headers();
    test_import_failures();
    test_series_helpers();
    test_exporters();
    test_json_escaping();
    test_sample_pipeline();
    test_analysis_cache();
    return volprof_test::finish();
}
