#include "volprof/exporter.hpp"

#include <cstdio>
#include <fstream>
#include <iomanip>

#include "volprof/volume_profile.hpp"

namespace volprof {
namespace {

const char* kDisclaimer = "Educational tool. Not investment advice. No live trading.";

bool open_output(std::ofstream* out, const std::string& output_path, const char* what, std::string* error) {
    out->open(output_path);
    if (!out->is_open()) {
        if (error != nullptr) {
            *error = std::string("Failed to open ") + what + " output path: " + output_path;
        }
        return false;
    }
    *out << std::fixed << std::setprecision(10);
    return true;
}

std::string json_string(const std::string& text) {
    std::string out = "\"";
    for (char ch : text) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

const char* bool_text(bool value) {
    return value ? "true" : "false";
}

void write_nodes(std::ofstream& out, const char* name, const std::vector<VolumeNode>& nodes) {
    out << "  \"" << name << "\": [";
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const VolumeNode& n = nodes[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"price\": " << n.price << ", \"min\": " << n.min_price << ", \"max\": " << n.max_price
            << ", \"volume\": " << n.volume << ", \"volume_percent\": " << n.volume_percent
            << ", \"volume_ratio\": " << n.volume_ratio << ", \""
            << (n.type == NodeType::Hvn ? "strength" : "weakness") << "\": " << n.strength
            << ", \"node_count\": " << n.node_count << "}";
    }
    out << (nodes.empty() ? "],\n" : "\n  ],\n");
}

} // namespace

bool export_profile_json(const std::string& output_path,
                         const ProfileSettings& settings,
                         const VolumeProfileStats& stats,
                         const std::vector<VolumeSignal>& signals,
                         std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "profile", error)) {
        return false;
    }

    out << "{\n";
    out << "  \"schema_version\": 1,\n";
    out << "  \"settings\": {\"num_bins\": " << settings.num_bins << ", \"value_area_fraction\": "
        << settings.value_area_fraction << ", \"hvn_threshold\": " << settings.hvn_threshold
        << ", \"lvn_threshold\": " << settings.lvn_threshold << "},\n";
    out << "  \"total_volume\": " << stats.total_volume << ",\n";
    out << "  \"average_volume_per_bin\": " << stats.average_volume_per_bin << ",\n";
    out << "  \"price_range\": {\"min\": " << stats.min_price << ", \"max\": " << stats.max_price << "},\n";
    if (stats.poc.has_value()) {
        out << "  \"poc\": {\"price\": " << stats.poc->price << ", \"min\": " << stats.poc->min_price
            << ", \"max\": " << stats.poc->max_price << ", \"volume\": " << stats.poc->volume
            << ", \"volume_percent\": " << stats.poc->volume_percent << "},\n";
    } else {
        out << "  \"poc\": null,\n";
    }
    if (stats.value_area_high.has_value() && stats.value_area_low.has_value()) {
        out << "  \"value_area\": {\"low\": " << *stats.value_area_low << ", \"high\": " << *stats.value_area_high
            << ", \"fraction\": " << stats.value_area_fraction << ", \"zones\": " << stats.value_area.size()
            << "},\n";
    } else {
        out << "  \"value_area\": null,\n";
    }
    write_nodes(out, "high_volume_nodes", stats.high_volume_nodes);
    write_nodes(out, "low_volume_nodes", stats.low_volume_nodes);

    out << "  \"signals\": [";
    for (std::size_t i = 0; i < signals.size(); ++i) {
        const VolumeSignal& s = signals[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"type\": " << json_string(to_string(s.type)) << ", \"reason\": " << json_string(s.reason)
            << ", \"price\": " << s.price << ", \"reference_price\": " << s.reference_price
            << ", \"confidence\": " << s.confidence << ", \"detail\": " << json_string(s.detail) << "}";
    }
    out << (signals.empty() ? "],\n" : "\n  ],\n");
    out << "  \"disclaimer\": \"" << kDisclaimer << "\"\n";
    out << "}\n";
    return true;
}

bool export_zones_csv(const std::string& output_path, const VolumeProfileStats& stats, std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "zones", error)) {
        return false;
    }

    out << "min_price,max_price,mid_price,volume,volume_percent,data_points\n";
    for (const Zone& zone : stats.bins) {
        out << zone.min_price << ',' << zone.max_price << ',' << zone.mid_price << ',' << zone.volume << ','
            << zone.volume_percent << ',' << zone.data_points << '\n';
    }
    return true;
}

bool export_breaks_csv(const std::string& output_path, const BreakoutResult& result, std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "breaks", error)) {
        return false;
    }

    out << "date,price,direction,window_index,level,current_weight,triggering_zone_weight\n";
    for (const BreakSignal& b : result.breaks) {
        out << b.date << ',' << b.price << ',' << (b.is_up_break ? "up" : "down") << ',' << b.window_index << ','
            << b.level << ',' << b.current_weight << ',' << b.triggering_zone_weight << '\n';
    }
    return true;
}

bool export_trades_csv(const std::string& output_path, const SimulationResult& result, std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "trades", error)) {
        return false;
    }

    out << "buy_date,buy_price,sell_date,sell_price,pl_percent,is_cutoff,is_open\n";
    for (const Trade& trade : result.trades) {
        out << trade.buy_date << ',' << trade.buy_price << ',' << trade.sell_date << ',' << trade.sell_price << ','
            << trade.pl_percent << ',' << bool_text(trade.is_cutoff) << ',' << bool_text(trade.is_open) << '\n';
    }
    return true;
}

bool export_simulation_json(const std::string& output_path,
                            const BreakoutSettings& detector,
                            const SimulationSettings& settings,
                            const SimulationResult& result,
                            std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "simulation", error)) {
        return false;
    }

    out << "{\n";
    out << "  \"schema_version\": 1,\n";
    out << "  \"strategy\": {\"name\": \"VOLUME_PROFILE_BREAKOUT\", \"warmup_size\": " << detector.warmup_size
        << ", \"weight_differential\": " << detector.weight_differential
        << ", \"min_support_weight\": " << detector.min_support_weight
        << ", \"lookback_zones\": " << detector.lookback_zones
        << ", \"lookahead_zones\": " << detector.lookahead_zones << ", \"split_on_break\": "
        << bool_text(detector.window_policy == WindowPolicy::SplitOnBreak) << "},\n";
    out << "  \"settings\": {\"transaction_fee\": " << settings.transaction_fee
        << ", \"cutoff_pct\": " << settings.cutoff_pct << ", \"trailing_pct\": " << settings.trailing_pct
        << ", \"min_bars_between_trades\": " << settings.min_bars_between_trades << "},\n";
    out << "  \"results\": {\n";
    out << "    \"total_pl_pct\": " << result.total_pl << ",\n";
    out << "    \"win_rate_pct\": " << result.win_rate << ",\n";
    out << "    \"market_change_pct\": " << result.market_change << ",\n";
    out << "    \"trades\": " << result.trades.size() << ",\n";
    out << "    \"trading_signals\": " << result.trading_signals << ",\n";
    out << "    \"is_holding\": " << bool_text(result.is_holding) << "\n";
    out << "  },\n";
    out << "  \"disclaimer\": \"" << kDisclaimer << "\"\n";
    out << "}\n";
    return true;
}

bool export_channels_csv(const std::string& output_path, const std::vector<Channel>& channels, std::string* error) {
    std::ofstream out;
    if (!open_output(&out, output_path, "channels", error)) {
        return false;
    }

    out << "start_index,end_index,length,slope,intercept,std_dev,stdev_multiplier,channel_width,touch_count,"
           "turning_points,percent_within_bounds\n";
    for (const Channel& c : channels) {
        out << c.start_index << ',' << c.end_index << ',' << c.length << ',' << c.slope << ',' << c.intercept << ','
            << c.std_dev << ',' << c.stdev_multiplier << ',' << c.channel_width << ',' << c.touch_count << ','
            << c.turning_points_count << ',' << c.percent_within_bounds << '\n';
    }
    return true;
}

} // namespace volprof
