#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "volprof/breakout_detector.hpp"
#include "volprof/csv_importer.hpp"
#include "volprof/trade_simulator.hpp"

namespace {

struct SweepRow {
    double cutoff_pct{0.0};
    double trailing_pct{0.0};
    volprof::SimulationResult train;
    volprof::SimulationResult test;
};

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
              << " <csv_path> <out_csv> [date_format=iso] [train_ratio=0.7]"
              << " [cutoff_min=0.04] [cutoff_max=0.20] [trailing_min=0.04] [trailing_max=0.16] [step=0.02]"
              << " [fee=0.003] [split_windows=0]\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string csv_path = argv[1];
    const std::string out_csv = argv[2];
    const std::string date_format_arg = (argc > 3) ? argv[3] : "iso";
    const double train_ratio = (argc > 4) ? std::atof(argv[4]) : 0.7;
    const double cutoff_min = (argc > 5) ? std::atof(argv[5]) : 0.04;
    const double cutoff_max = (argc > 6) ? std::atof(argv[6]) : 0.20;
    const double trailing_min = (argc > 7) ? std::atof(argv[7]) : 0.04;
    const double trailing_max = (argc > 8) ? std::atof(argv[8]) : 0.16;
    const double step = (argc > 9) ? std::atof(argv[9]) : 0.02;
    const double fee = (argc > 10) ? std::atof(argv[10]) : 0.003;
    const bool split_windows = (argc > 11) && std::atoi(argv[11]) != 0;

    if (train_ratio <= 0.0 || train_ratio >= 1.0) {
        std::cerr << "train_ratio must be in (0,1)\n";
        return 1;
    }
    if (step <= 0.0) {
        std::cerr << "step must be > 0\n";
        return 1;
    }

    const volprof::ImportResult imported = volprof::import_price_csv(csv_path, parse_date_format(date_format_arg));
    if (!imported.success) {
        std::cerr << "Import failed for: " << csv_path << "\n";
        for (const auto& e : imported.errors) {
            std::cerr << "line " << e.line << ": " << e.message << "\n";
        }
        return 1;
    }

    const std::size_t n = imported.series.size();
    const std::size_t split_idx = static_cast<std::size_t>(static_cast<double>(n) * train_ratio);
    if (split_idx < 2 || split_idx >= n - 1) {
        std::cerr << "Dataset too short for requested split ratio\n";
        return 1;
    }

    const volprof::PriceSeries train(imported.series.begin(), imported.series.begin() + static_cast<long>(split_idx));
    const volprof::PriceSeries test(imported.series.begin() + static_cast<long>(split_idx), imported.series.end());

    const volprof::BreakoutSettings detector =
        split_windows ? volprof::split_window_settings() : volprof::BreakoutSettings{};

    // Detection does not depend on the swept settings; run it once per half.
    const volprof::BreakoutResult train_breaks = volprof::detect_breaks(train, volprof::ZoomRange{}, {}, detector);
    const volprof::BreakoutResult test_breaks = volprof::detect_breaks(test, volprof::ZoomRange{}, {}, detector);

    std::vector<SweepRow> rows;
    const double epsilon = step * 1e-6;
    for (double cutoff = cutoff_min; cutoff <= cutoff_max + epsilon; cutoff += step) {
        for (double trailing = trailing_min; trailing <= trailing_max + epsilon; trailing += step) {
            volprof::SimulationSettings settings;
            settings.transaction_fee = fee;
            settings.cutoff_pct = cutoff;
            settings.trailing_pct = trailing;
            if (!settings.is_valid()) {
                continue;
            }

            SweepRow row;
            row.cutoff_pct = cutoff;
            row.trailing_pct = trailing;
            row.train = volprof::simulate_trades(train, train_breaks.breaks, settings);
            row.test = volprof::simulate_trades(test, test_breaks.breaks, settings);
            rows.push_back(std::move(row));
        }
    }

    if (rows.empty()) {
        std::cerr << "No valid parameter combinations produced results\n";
        return 1;
    }

    std::sort(rows.begin(), rows.end(), [](const SweepRow& a, const SweepRow& b) {
        if (a.train.total_pl != b.train.total_pl) {
            return a.train.total_pl > b.train.total_pl;
        }
        return a.train.win_rate > b.train.win_rate;
    });

    std::ofstream out(out_csv);
    if (!out.is_open()) {
        std::cerr << "Failed to open output report path: " << out_csv << "\n";
        return 1;
    }

    out << "cutoff_pct,trailing_pct,train_total_pl,train_win_rate,train_trades,test_total_pl,test_win_rate,test_trades\n";
    out << std::fixed << std::setprecision(6);
    for (const SweepRow& row : rows) {
        out << row.cutoff_pct << ',' << row.trailing_pct << ',' << row.train.total_pl << ',' << row.train.win_rate << ','
            << row.train.trades.size() << ',' << row.test.total_pl << ',' << row.test.win_rate << ','
            << row.test.trades.size() << '\n';
    }

    const SweepRow& best = rows.front();
    std::cout << "Rows imported: " << n << "\n";
    std::cout << "Train rows: " << train.size() << ", Test rows: " << test.size() << "\n";
    std::cout << "Breaks: train=" << train_breaks.breaks.size() << " test=" << test_breaks.breaks.size() << "\n";
    std::cout << "Best (by train P&L): cutoff=" << best.cutoff_pct << " trailing=" << best.trailing_pct << "\n";
    std::cout << "Train P&L=" << best.train.total_pl << "% winRate=" << best.train.win_rate
              << "% trades=" << best.train.trades.size() << "\n";
    std::cout << "Test P&L=" << best.test.total_pl << "% winRate=" << best.test.win_rate
              << "% trades=" << best.test.trades.size() << "\n";
    std::cout << "Report written: " << out_csv << "\n";

    return 0;
}
