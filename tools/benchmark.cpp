#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include "volprof/breakout_detector.hpp"
#include "volprof/channel_finder.hpp"
#include "volprof/csv_importer.hpp"
#include "volprof/volume_profile.hpp"

namespace {

std::filesystem::path write_synthetic_csv(const std::filesystem::path& out_path, std::size_t rows) {
    std::ofstream out(out_path);
    out << "Date,High,Low,Close,Volume\n";

    // Deterministic pseudo-market path with bounded drift and cyclic volume.
    double price = 100.0;
    int day = 1;
    int month = 1;
    int year = 2000;

    for (std::size_t i = 0; i < rows; ++i) {
        const double drift = ((static_cast<int>(i % 29) - 14) * 0.02);
        const double close = std::max(1.0, price + drift);
        const double volume = 1000.0 + static_cast<double>((i * 37) % 500);

        out << std::setw(4) << std::setfill('0') << year << '-'
            << std::setw(2) << month << '-'
            << std::setw(2) << day << ','
            << std::fixed << std::setprecision(6)
            << close + 0.3 << ',' << close - 0.3 << ',' << close << ',' << volume << "\n";

        price = close;
        ++day;
        if (day > 28) {
            day = 1;
            ++month;
            if (month > 12) {
                month = 1;
                ++year;
            }
        }
    }

    return out_path;
}

long long elapsed_ms(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t rows = (argc > 1) ? static_cast<std::size_t>(std::stoull(argv[1])) : 2000;
    const std::filesystem::path csv_path = std::filesystem::temp_directory_path() / "volprof_benchmark_prices.csv";

    write_synthetic_csv(csv_path, rows);

    const auto import_start = std::chrono::steady_clock::now();
    const auto imported = volprof::import_price_csv(csv_path.string(), volprof::DateFormat::Iso);
    const auto import_end = std::chrono::steady_clock::now();

    if (!imported.success) {
        std::cerr << "Import failed in benchmark\n";
        return 1;
    }

    const auto profile_start = std::chrono::steady_clock::now();
    const auto stats = volprof::compute_statistics(imported.series);
    const auto profile_end = std::chrono::steady_clock::now();

    const auto breaks_start = std::chrono::steady_clock::now();
    const auto breaks = volprof::detect_breaks(imported.series);
    const auto breaks_end = std::chrono::steady_clock::now();

    const auto channels_start = std::chrono::steady_clock::now();
    const auto channels = volprof::find_best_channels(imported.series);
    const auto channels_end = std::chrono::steady_clock::now();

    std::cout << "Rows: " << imported.series.size() << "\n";
    std::cout << "Import ms: " << elapsed_ms(import_start, import_end) << "\n";
    std::cout << "Profile ms: " << elapsed_ms(profile_start, profile_end) << "\n";
    std::cout << "Break detection ms: " << elapsed_ms(breaks_start, breaks_end) << "\n";
    std::cout << "Channel search ms: " << elapsed_ms(channels_start, channels_end) << "\n";
    std::cout << "HVN clusters: " << stats.high_volume_nodes.size() << "\n";
    std::cout << "Breaks: " << breaks.breaks.size() << "\n";
    std::cout << "Channels: " << channels.size() << "\n";

    std::error_code ec;
    std::filesystem::remove(csv_path, ec);
    return 0;
}
