#include "volprof/trade_simulator.hpp"

#include <cstdio>
#include <limits>
#include <unordered_map>

#include "volprof/breakout_detector.hpp"
#include "volprof/series_utils.hpp"

namespace volprof {
namespace {

enum class PositionState {
    Flat,
    Holding,
};

std::string format_price(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return std::string(buffer);
}

const WeightedZone* heaviest_zone(const WindowPoint& point) {
    const WeightedZone* heaviest = nullptr;
    double max_weight = 0.0;
    for (const WeightedZone& zone : point.zones) {
        if (zone.weight > max_weight) {
            max_weight = zone.weight;
            heaviest = &zone;
        }
    }
    return heaviest;
}

} // namespace

double fee_adjusted_pl_percent(double buy_price, double sell_price, double fee) {
    const double effective_buy = buy_price * (1.0 + fee);
    const double effective_sell = sell_price * (1.0 - fee);
    return (effective_buy > 0.0) ? ((effective_sell - effective_buy) / effective_buy) * 100.0 : 0.0;
}

SimulationResult simulate_trades(const PriceSeries& input,
                                 const std::vector<BreakSignal>& breaks,
                                 const SimulationSettings& settings,
                                 const std::vector<ProfileWindow>* windows) {
    SimulationResult result;
    if (!settings.is_valid()) {
        result.warnings.push_back("Simulation skipped: invalid settings (fee, cutoff_pct and trailing_pct must be "
                                  "in [0,1)).");
        return result;
    }
    if (input.empty()) {
        result.warnings.push_back("Simulation skipped: empty price series.");
        return result;
    }

    const PriceSeries prices = normalize_order(input);

    std::unordered_map<std::string, const BreakSignal*> break_by_date;
    for (const BreakSignal& signal : breaks) {
        break_by_date[signal.date] = &signal;
    }

    std::unordered_map<std::string, const WindowPoint*> point_by_date;
    if (settings.exit_below_heaviest_zone && windows != nullptr) {
        for (const ProfileWindow& window : *windows) {
            for (const WindowPoint& point : window.points) {
                point_by_date[point.date] = &point;
            }
        }
    }

    const long long min_bars = static_cast<long long>(settings.min_bars_between_trades);
    const bool gate_buys = settings.warmup_policy == WarmupPolicy::BarsSinceLastSell;
    const bool gate_sells = settings.warmup_policy == WarmupPolicy::AllTimeHighReset;

    PositionState state = PositionState::Flat;
    double buy_price = 0.0;
    std::string buy_date;
    double cutoff = 0.0;
    int trade_id = 0;
    long long last_sell_index = -min_bars;
    double all_time_high = -std::numeric_limits<double>::infinity();
    long long bars_since_reset = 0;

    const auto close_position = [&](std::size_t i, double sell_price, bool is_cutoff, const std::string& reason) {
        Trade trade;
        trade.buy_price = buy_price;
        trade.buy_date = buy_date;
        trade.sell_price = sell_price;
        trade.sell_date = prices[i].date;
        trade.pl_percent = fee_adjusted_pl_percent(buy_price, sell_price, settings.transaction_fee);
        trade.is_cutoff = is_cutoff;
        result.trades.push_back(trade);
        result.sell_events.push_back({prices[i].date, sell_price, is_cutoff, reason});

        state = PositionState::Flat;
        buy_price = 0.0;
        buy_date.clear();
        cutoff = 0.0;
        ++trade_id;
        last_sell_index = static_cast<long long>(i);
    };

    for (std::size_t i = 0; i < prices.size(); ++i) {
        const PricePoint& bar = prices[i];
        const double price = bar.close;
        ++bars_since_reset;

        if (state == PositionState::Holding && price < cutoff) {
            close_position(i, price, true, "Price $" + format_price(price) + " < Cutoff $" + format_price(cutoff));
            continue;
        }

        if (state == PositionState::Holding) {
            const double trailed = price * (1.0 - settings.trailing_pct);
            if (trailed > cutoff) {
                cutoff = trailed;
                result.cutoff_trail.push_back({bar.date, cutoff, trade_id});
            }
        }

        if (price > all_time_high) {
            all_time_high = price;
            if (state == PositionState::Holding) {
                bars_since_reset = 0;
            }
        }

        if (state == PositionState::Holding && !point_by_date.empty()) {
            const auto it = point_by_date.find(bar.date);
            if (it != point_by_date.end()) {
                const WeightedZone* heaviest = heaviest_zone(*it->second);
                if (heaviest != nullptr && price < heaviest->min_price) {
                    close_position(
                        i, price, false, "Price $" + format_price(price) + " < Heaviest zone $" +
                                             format_price(heaviest->min_price));
                    continue;
                }
            }
        }

        const auto found = break_by_date.find(bar.date);
        if (found == break_by_date.end()) {
            continue;
        }
        const BreakSignal& signal = *found->second;

        if (signal.is_up_break) {
            const bool warmed_up = !gate_buys || static_cast<long long>(i) - last_sell_index >= min_bars;
            if (state == PositionState::Flat && warmed_up) {
                state = PositionState::Holding;
                buy_price = signal.price;
                buy_date = signal.date;
                cutoff = signal.price * (1.0 - settings.cutoff_pct);
                ++result.trading_signals;
                result.cutoff_trail.push_back({signal.date, cutoff, trade_id});
            }
        } else if (state == PositionState::Holding) {
            const bool warmed_up = !gate_sells || bars_since_reset >= min_bars;
            if (warmed_up) {
                close_position(i, signal.price, false, "Breakdown signal");
            }
        }
    }

    if (state == PositionState::Holding) {
        const PricePoint& last = prices.back();
        Trade trade;
        trade.buy_price = buy_price;
        trade.buy_date = buy_date;
        trade.sell_price = last.close;
        trade.sell_date = last.date;
        trade.pl_percent = settings.apply_fees_to_open_trade
                               ? fee_adjusted_pl_percent(buy_price, last.close, settings.transaction_fee)
                               : ((last.close - buy_price) / buy_price) * 100.0;
        trade.is_open = true;
        result.trades.push_back(trade);
        result.is_holding = true;
    }

    int closed = 0;
    int wins = 0;
    for (const Trade& trade : result.trades) {
        result.total_pl += trade.pl_percent;
        if (!trade.is_open) {
            ++closed;
            if (trade.pl_percent > 0.0) {
                ++wins;
            }
        }
    }
    result.win_rate = (closed > 0) ? (static_cast<double>(wins) / static_cast<double>(closed)) * 100.0 : 0.0;

    if (!result.trades.empty() && result.trades.front().buy_price > 0.0) {
        const double start_price = result.trades.front().buy_price;
        const double end_price = result.trades.back().sell_price;
        result.market_change = ((end_price - start_price) / start_price) * 100.0;
    }

    for (const SellEvent& sell : result.sell_events) {
        result.sell_dates.push_back(sell.date);
    }
    return result;
}

StrategyResult run_breakout_strategy(const PriceSeries& prices,
                                     const ZoomRange& zoom,
                                     const BreakoutSettings& detector,
                                     const SimulationSettings& simulation) {
    StrategyResult result;
    result.detection = detect_breaks(prices, zoom, {}, detector);
    result.simulation = simulate_trades(prices, result.detection.breaks, simulation, &result.detection.windows);
    return result;
}

} // namespace volprof
