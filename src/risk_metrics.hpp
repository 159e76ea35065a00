#ifndef XOLCALC_RISK_METRICS_HPP
#define XOLCALC_RISK_METRICS_HPP

#include "scenario_engine.hpp"
#include <optional>
#include <vector>

namespace xolcalc {

// Risk metrics of one ceded-loss distribution
struct RiskMetrics {
    double expected_loss;        // Mean ceded loss
    double std_dev;              // Population standard deviation
    double var_99;               // 99th percentile (linear interpolation)
    double tvar_99;              // Mean of ceded losses >= var_99
    double trigger_probability;  // Fraction of trials with ceded loss > 0
    double value_for_money;      // expected_loss / premium

    // Fraction of individual claims with a recovery; per-risk layers only
    std::optional<double> claim_hit_ratio;

    RiskMetrics();
};

// Percentile of ascending-sorted values using linear interpolation between
// order statistics at position (p / 100) * (n - 1).
// p in [0, 100]. Throws ComputationError on empty input.
double percentile(const std::vector<double>& sorted_values, double p);

// Mean of the sorted values at or above `threshold`, accumulated as
// threshold + mean(x - threshold) so the result is never below threshold.
// Throws ComputationError if no value reaches the threshold.
double tail_mean(const std::vector<double>& sorted_values, double threshold);

// Reduce a ceded-loss distribution to RiskMetrics
// claim_hit_ratio is carried over when the distribution recorded claim counts.
// Throws ComputationError if the distribution is empty or holds a
// non-finite value, ConfigError if premium <= 0.
RiskMetrics calculate_risk_metrics(const CededLossDistribution& distribution,
                                   double premium);

RiskMetrics calculate_risk_metrics(const std::vector<double>& ceded_losses,
                                   double premium);

} // namespace xolcalc

#endif // XOLCALC_RISK_METRICS_HPP
