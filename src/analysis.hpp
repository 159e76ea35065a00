#ifndef XOLCALC_ANALYSIS_HPP
#define XOLCALC_ANALYSIS_HPP

#include "risk_metrics.hpp"
#include "scenario_engine.hpp"
#include "simulation_config.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xolcalc {

constexpr uint32_t BASELINE_SCENARIO_ID = 0;
constexpr uint32_t STRESSED_SCENARIO_ID = 1;

// Metrics of one scenario run plus execution details
struct ScenarioResult {
    std::string name;            // "baseline" or "stressed"
    uint32_t scenario_id;
    size_t trials;
    LayerBasis layer_basis;
    RiskMetrics metrics;
    double execution_time_ms;

    ScenarioResult();
};

struct AnalysisResult {
    ScenarioResult baseline;
    ScenarioResult stressed;
};

// Alternative layer terms priced against the same simulated trials
struct LayerOption {
    std::string name;
    double retention;
    double limit;      // +inf = unlimited
    double premium;
    LayerBasis basis;

    LayerOption();
    LayerOption(const std::string& name, double retention, double limit, double premium,
                LayerBasis basis = LayerBasis::Aggregate);
};

struct LayerComparison {
    LayerOption option;
    RiskMetrics baseline;
    RiskMetrics stressed;
};

// Run the baseline scenario and the inflation-stressed scenario
//
// The configuration is validated before any draw; frequency and layer terms
// are shared by both runs, only severity is inflated by (1 + inflation_rate).
//
// Throws ConfigError, ComputationError or AnalysisCancelled. No partial
// result is ever returned.
AnalysisResult run_analysis(const SimulationConfig& config,
                            const CancellationToken* cancel = nullptr);

// Price each layer option over one set of simulated baseline and stressed
// claims, so options differ only by their terms.
// The layer in `config` itself is not included.
std::vector<LayerComparison> compare_layers(const SimulationConfig& config,
                                            const std::vector<LayerOption>& options,
                                            const CancellationToken* cancel = nullptr);

// Baseline and stressed scenario definitions for a validated config
ScenarioSpec make_baseline_spec(const SimulationConfig& config);
ScenarioSpec make_stressed_spec(const SimulationConfig& config);

} // namespace xolcalc

#endif // XOLCALC_ANALYSIS_HPP
