#pragma once

#include <string>
#include <vector>

#include "volprof/types.hpp"

namespace volprof {

// Replays breaks (matched to prices by date) as a single long-only position.
// `windows` is only consulted when settings.exit_below_heaviest_zone is set.
SimulationResult simulate_trades(const PriceSeries& prices,
                                 const std::vector<BreakSignal>& breaks,
                                 const SimulationSettings& settings = SimulationSettings{},
                                 const std::vector<ProfileWindow>* windows = nullptr);

// Detection over one continuous window followed by the simulation over the same prices.
StrategyResult run_breakout_strategy(const PriceSeries& prices,
                                     const ZoomRange& zoom = ZoomRange{},
                                     const BreakoutSettings& detector = BreakoutSettings{},
                                     const SimulationSettings& simulation = SimulationSettings{});

double fee_adjusted_pl_percent(double buy_price, double sell_price, double fee);

} // namespace volprof
