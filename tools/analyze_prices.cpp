#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "volprof/breakout_detector.hpp"
#include "volprof/channel_finder.hpp"
#include "volprof/csv_importer.hpp"
#include "volprof/exporter.hpp"
#include "volprof/trade_simulator.hpp"
#include "volprof/volume_profile.hpp"

namespace {

volprof::DateFormat parse_date_format(const std::string& value) {
    if (value == "mdy") {
        return volprof::DateFormat::Mdy;
    }
    if (value == "dmy") {
        return volprof::DateFormat::Dmy;
    }
    return volprof::DateFormat::Iso;
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <csv_path> <out_dir> [date_format=iso] [num_bins=50] [cutoff_pct=0.12] [fee=0.003]\n";
}

void print_warnings(const char* stage, const std::vector<std::string>& warnings) {
    for (const std::string& w : warnings) {
        std::cerr << "[" << stage << "] " << w << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string csv_path = argv[1];
    const std::filesystem::path out_dir = argv[2];
    const std::string date_format_arg = (argc > 3) ? argv[3] : "iso";
    const std::size_t num_bins = (argc > 4) ? static_cast<std::size_t>(std::strtoull(argv[4], nullptr, 10)) : 50;
    const double cutoff_pct = (argc > 5) ? std::atof(argv[5]) : 0.12;
    const double fee = (argc > 6) ? std::atof(argv[6]) : 0.003;

    const volprof::ImportResult imported = volprof::import_price_csv(csv_path, parse_date_format(date_format_arg));
    if (!imported.success) {
        std::cerr << "Import failed for: " << csv_path << "\n";
        for (const auto& e : imported.errors) {
            std::cerr << "line " << e.line << ": " << e.message << "\n";
        }
        return 1;
    }
    for (const auto& w : imported.warnings) {
        std::cerr << "line " << w.line << ": " << w.message << "\n";
    }

    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << out_dir.string() << ": " << ec.message() << "\n";
        return 1;
    }

    volprof::ProfileSettings profile;
    profile.num_bins = num_bins;
    const volprof::VolumeProfileStats stats = volprof::compute_statistics(imported.series, profile);
    print_warnings("profile", stats.warnings);
    const std::vector<volprof::VolumeSignal> signals = volprof::generate_signals(imported.series, stats);

    const volprof::BreakoutSettings detector;
    volprof::SimulationSettings simulation;
    simulation.cutoff_pct = cutoff_pct;
    simulation.transaction_fee = fee;
    const volprof::StrategyResult strategy =
        volprof::run_breakout_strategy(imported.series, volprof::ZoomRange{}, detector, simulation);
    print_warnings("breaks", strategy.detection.warnings);
    print_warnings("simulation", strategy.simulation.warnings);

    const std::vector<volprof::Channel> channels =
        volprof::filter_overlapping(volprof::find_best_channels(imported.series));

    std::string error;
    const bool ok = volprof::export_profile_json((out_dir / "profile.json").string(), profile, stats, signals, &error) &&
                    volprof::export_zones_csv((out_dir / "zones.csv").string(), stats, &error) &&
                    volprof::export_breaks_csv((out_dir / "breaks.csv").string(), strategy.detection, &error) &&
                    volprof::export_trades_csv((out_dir / "trades.csv").string(), strategy.simulation, &error) &&
                    volprof::export_simulation_json(
                        (out_dir / "simulation.json").string(), detector, simulation, strategy.simulation, &error) &&
                    volprof::export_channels_csv((out_dir / "channels.csv").string(), channels, &error);
    if (!ok) {
        std::cerr << error << "\n";
        return 1;
    }

    std::cout << "Rows imported: " << imported.series.size() << "\n";
    if (stats.poc.has_value()) {
        std::cout << "POC: " << stats.poc->price << " (" << stats.poc->volume_percent * 100.0 << "% of volume)\n";
        std::cout << "Value area: " << stats.value_area_low.value_or(0.0) << " - "
                  << stats.value_area_high.value_or(0.0) << "\n";
    }
    std::cout << "HVN clusters: " << stats.high_volume_nodes.size()
              << ", LVN clusters: " << stats.low_volume_nodes.size() << "\n";
    for (const auto& s : signals) {
        std::cout << "Signal " << volprof::to_string(s.type) << ": " << s.reason << "\n";
    }
    std::cout << "Breaks: " << strategy.detection.breaks.size() << ", trades: " << strategy.simulation.trades.size()
              << ", total P&L: " << strategy.simulation.total_pl << "%, win rate: " << strategy.simulation.win_rate
              << "%\n";
    std::cout << "Channels: " << channels.size() << "\n";
    std::cout << "Results written to: " << out_dir.string() << "\n";
    return 0;
}
