#include "volprof/series_utils.hpp"

#include <algorithm>
#include <cmath>

namespace volprof {

PriceSeries normalize_order(const PriceSeries& series) {
    PriceSeries out = series;
    if (out.size() >= 2 && out.front().date > out.back().date) {
        std::reverse(out.begin(), out.end());
    }
    return out;
}

bool is_ascending(const PriceSeries& series) {
    for (std::size_t i = 1; i < series.size(); ++i) {
        if (series[i].date < series[i - 1].date) {
            return false;
        }
    }
    return true;
}

std::vector<TurningPoint> find_turning_points(const PriceSeries& series, std::size_t window_size) {
    std::vector<TurningPoint> points;
    if (window_size == 0) {
        return points;
    }

    for (std::size_t i = window_size; i + window_size < series.size(); ++i) {
        const double current = series[i].close;
        bool is_local_max = true;
        bool is_local_min = true;

        for (std::size_t j = i - window_size; j <= i + window_size; ++j) {
            if (j == i) {
                continue;
            }
            const double compare = series[j].close;
            if (compare >= current) {
                is_local_max = false;
            }
            if (compare <= current) {
                is_local_min = false;
            }
        }

        if (is_local_max) {
            points.push_back({i, TurningPointType::Max, current});
        } else if (is_local_min) {
            points.push_back({i, TurningPointType::Min, current});
        }
    }
    return points;
}

std::optional<Regression> fit_regression(const PriceSeries& series,
                                         std::size_t start_index,
                                         std::size_t end_index,
                                         const std::vector<bool>* valid) {
    if (series.empty() || start_index > end_index) {
        return std::nullopt;
    }
    end_index = std::min(end_index, series.size() - 1);

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(end_index - start_index + 1);
    ys.reserve(end_index - start_index + 1);
    for (std::size_t x = start_index; x <= end_index; ++x) {
        if (valid != nullptr && (x >= valid->size() || !(*valid)[x])) {
            continue;
        }
        xs.push_back(static_cast<double>(x));
        ys.push_back(series[x].close);
    }
    return fit_line(xs, ys);
}

std::optional<Regression> fit_line(const std::vector<double>& xs, const std::vector<double>& ys) {
    const std::size_t n = std::min(xs.size(), ys.size());
    if (n < 2) {
        return std::nullopt;
    }

    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_x2 = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        sum_x += xs[i];
        sum_y += ys[i];
        sum_xy += xs[i] * ys[i];
        sum_x2 += xs[i] * xs[i];
    }

    const double count = static_cast<double>(n);
    const double denominator = count * sum_x2 - sum_x * sum_x;
    if (denominator == 0.0) {
        return std::nullopt;
    }

    Regression out;
    out.slope = (count * sum_xy - sum_x * sum_y) / denominator;
    out.intercept = (sum_y - out.slope * sum_x) / count;
    out.std_dev = residual_std_dev(xs, ys, out.slope, out.intercept);
    out.r_squared = r_squared(xs, ys, out.slope, out.intercept);
    out.points = n;
    return out;
}

double residual_std_dev(const std::vector<double>& xs,
                        const std::vector<double>& ys,
                        double slope,
                        double intercept) {
    const std::size_t n = std::min(xs.size(), ys.size());
    std::vector<double> residuals;
    residuals.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        residuals.push_back(ys[i] - (slope * xs[i] + intercept));
    }
    return population_std_dev(residuals);
}

double r_squared(const std::vector<double>& xs, const std::vector<double>& ys, double slope, double intercept) {
    const std::size_t n = std::min(xs.size(), ys.size());
    if (n == 0) {
        return 0.0;
    }

    double mean_y = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        mean_y += ys[i];
    }
    mean_y /= static_cast<double>(n);

    double ss_total = 0.0;
    double ss_residual = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double predicted = slope * xs[i] + intercept;
        ss_total += (ys[i] - mean_y) * (ys[i] - mean_y);
        ss_residual += (ys[i] - predicted) * (ys[i] - predicted);
    }
    return (ss_total == 0.0) ? 0.0 : 1.0 - (ss_residual / ss_total);
}

double population_std_dev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    double mean = 0.0;
    for (double v : values) {
        mean += v;
    }
    mean /= static_cast<double>(values.size());

    double variance = 0.0;
    for (double v : values) {
        variance += (v - mean) * (v - mean);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance);
}

std::vector<std::optional<double>> simple_moving_average(const PriceSeries& series, std::size_t period) {
    std::vector<std::optional<double>> out(series.size());
    if (period == 0) {
        return out;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < series.size(); ++i) {
        sum += series[i].close;
        if (i >= period) {
            sum -= series[i - period].close;
        }
        if (i + 1 >= period) {
            out[i] = sum / static_cast<double>(period);
        }
    }
    return out;
}

} // namespace volprof
