#include "risk_metrics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace xolcalc {

RiskMetrics::RiskMetrics()
    : expected_loss(0.0),
      std_dev(0.0),
      var_99(0.0),
      tvar_99(0.0),
      trigger_probability(0.0),
      value_for_money(0.0),
      claim_hit_ratio() {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

double calculate_mean(const std::vector<double>& values) {
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

} // anonymous namespace

double percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        throw ComputationError("Cannot compute a percentile of an empty distribution");
    }
    if (!(p >= 0.0 && p <= 100.0)) {
        throw ComputationError("Percentile must be between 0 and 100, got " +
                               std::to_string(p));
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    double value = sorted_values[lower_idx] +
                   frac * (sorted_values[upper_idx] - sorted_values[lower_idx]);
    // Interpolation must stay inside the bracketing order statistics
    return std::min(std::max(value, sorted_values[lower_idx]), sorted_values[upper_idx]);
}

double tail_mean(const std::vector<double>& sorted_values, double threshold) {
    auto first = std::lower_bound(sorted_values.begin(), sorted_values.end(), threshold);
    if (first == sorted_values.end()) {
        throw ComputationError("No observations at or above the tail threshold");
    }

    double excess_sum = 0.0;
    for (auto it = first; it != sorted_values.end(); ++it) {
        excess_sum += *it - threshold;
    }
    auto tail_count = static_cast<double>(std::distance(first, sorted_values.end()));
    return threshold + excess_sum / tail_count;
}

// ============================================================================
// Risk Metrics
// ============================================================================

RiskMetrics calculate_risk_metrics(const std::vector<double>& ceded_losses, double premium) {
    if (ceded_losses.empty()) {
        throw ComputationError("Ceded-loss distribution is empty");
    }
    if (!std::isfinite(premium) || premium <= 0.0) {
        throw ConfigError("premium must be finite and > 0, got " + std::to_string(premium));
    }
    for (size_t i = 0; i < ceded_losses.size(); ++i) {
        if (!std::isfinite(ceded_losses[i])) {
            throw ComputationError("Non-finite ceded loss at trial " + std::to_string(i));
        }
    }

    RiskMetrics metrics;

    metrics.expected_loss = calculate_mean(ceded_losses);
    metrics.std_dev = calculate_std_dev(ceded_losses, metrics.expected_loss);

    std::vector<double> sorted_losses = ceded_losses;
    std::sort(sorted_losses.begin(), sorted_losses.end());

    metrics.var_99 = percentile(sorted_losses, 99.0);
    metrics.tvar_99 = tail_mean(sorted_losses, metrics.var_99);

    auto triggered = std::count_if(ceded_losses.begin(), ceded_losses.end(),
                                   [](double loss) { return loss > 0.0; });
    metrics.trigger_probability =
        static_cast<double>(triggered) / static_cast<double>(ceded_losses.size());

    metrics.value_for_money = metrics.expected_loss / premium;

    return metrics;
}

RiskMetrics calculate_risk_metrics(const CededLossDistribution& distribution, double premium) {
    RiskMetrics metrics = calculate_risk_metrics(distribution.values(), premium);
    metrics.claim_hit_ratio = distribution.claim_hit_ratio();
    return metrics;
}

} // namespace xolcalc
