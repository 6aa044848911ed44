#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "volprof/types.hpp"

namespace volprof {

// Returns the series oldest-first. Newest-first input (first date > last date) is reversed.
PriceSeries normalize_order(const PriceSeries& series);
bool is_ascending(const PriceSeries& series);

std::vector<TurningPoint> find_turning_points(const PriceSeries& series, std::size_t window_size = 3);

// OLS of close against absolute index over [start_index, end_index]. Indices with valid[x] == false
// are skipped when a mask is given. Empty when fewer than two points take part.
std::optional<Regression> fit_regression(const PriceSeries& series,
                                         std::size_t start_index,
                                         std::size_t end_index,
                                         const std::vector<bool>* valid = nullptr);

std::optional<Regression> fit_line(const std::vector<double>& xs, const std::vector<double>& ys);

double residual_std_dev(const std::vector<double>& xs,
                        const std::vector<double>& ys,
                        double slope,
                        double intercept);
double r_squared(const std::vector<double>& xs, const std::vector<double>& ys, double slope, double intercept);

double population_std_dev(const std::vector<double>& values);

std::vector<std::optional<double>> simple_moving_average(const PriceSeries& series, std::size_t period);

} // namespace volprof
