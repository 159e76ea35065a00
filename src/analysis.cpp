#include "analysis.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <cmath>
#include <exception>

namespace xolcalc {

ScenarioResult::ScenarioResult()
    : name(""), scenario_id(0), trials(0), layer_basis(LayerBasis::Aggregate),
      execution_time_ms(0.0) {}

LayerOption::LayerOption()
    : name(""), retention(0.0), limit(ReinsuranceLayer::UNLIMITED), premium(1.0),
      basis(LayerBasis::Aggregate) {}

LayerOption::LayerOption(const std::string& n, double r, double l, double p, LayerBasis b)
    : name(n), retention(r), limit(l), premium(p), basis(b) {}

ScenarioSpec make_baseline_spec(const SimulationConfig& config) {
    return ScenarioSpec("baseline", BASELINE_SCENARIO_ID,
                        FrequencyModel(config.frequency),
                        SeverityModel(config.severity));
}

ScenarioSpec make_stressed_spec(const SimulationConfig& config) {
    ScenarioSpec spec("stressed", STRESSED_SCENARIO_ID,
                      FrequencyModel(config.frequency),
                      SeverityModel(config.severity).with_inflation(config.inflation_rate));
    if (config.common_random_numbers) {
        spec.stream_id = BASELINE_SCENARIO_ID;
    }
    return spec;
}

namespace {

ScenarioResult run_scenario(const ScenarioEngine& engine,
                            const ScenarioSpec& spec,
                            const ReinsuranceLayer& layer,
                            double premium,
                            const CancellationToken* cancel) {
    Logger& logger = Logger::get_instance();
    ExecutionContext ctx(spec.name, spec.scenario_id);
    ctx.phase = "simulate";

    logger.log_scenario_start(ctx, engine.trials(), spec);

    auto start_time = std::chrono::high_resolution_clock::now();

    ScenarioResult result;
    result.name = spec.name;
    result.scenario_id = spec.scenario_id;
    result.trials = engine.trials();
    result.layer_basis = layer.basis();

    try {
        CededLossDistribution distribution = engine.run(spec, layer, cancel);
        ctx.phase = "metrics";
        result.metrics = calculate_risk_metrics(distribution, premium);
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    logger.log_scenario_complete(ctx, result);
    return result;
}

} // anonymous namespace

AnalysisResult run_analysis(const SimulationConfig& config, const CancellationToken* cancel) {
    config.validate();

    Logger& logger = Logger::get_instance();
    logger.log_analysis_start(config);

    ScenarioEngine engine(config.trials, config.effective_seed(), config.num_threads);
    ReinsuranceLayer layer = config.layer();

    AnalysisResult result;
    result.baseline = run_scenario(engine, make_baseline_spec(config), layer,
                                   config.premium, cancel);
    result.stressed = run_scenario(engine, make_stressed_spec(config), layer,
                                   config.premium, cancel);
    return result;
}

std::vector<LayerComparison> compare_layers(const SimulationConfig& config,
                                            const std::vector<LayerOption>& options,
                                            const CancellationToken* cancel) {
    config.validate();
    if (options.empty()) {
        throw ConfigError("compare_layers requires at least one layer option");
    }

    // Reject every bad option before simulating anything
    std::vector<ReinsuranceLayer> layers;
    layers.reserve(options.size());
    for (const LayerOption& option : options) {
        if (!std::isfinite(option.premium) || option.premium <= 0.0) {
            throw ConfigError("Layer option '" + option.name + "' premium must be > 0");
        }
        layers.emplace_back(option.retention, option.limit, option.basis);
    }

    Logger& logger = Logger::get_instance();
    ScenarioEngine engine(config.trials, config.effective_seed(), config.num_threads);

    ScenarioSpec baseline_spec = make_baseline_spec(config);
    ScenarioSpec stressed_spec = make_stressed_spec(config);
    ExecutionContext ctx("layer_comparison", BASELINE_SCENARIO_ID);
    ctx.phase = "simulate";

    TrialClaims baseline_claims;
    TrialClaims stressed_claims;
    try {
        baseline_claims = engine.simulate_claims(baseline_spec, cancel);
        stressed_claims = engine.simulate_claims(stressed_spec, cancel);
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    ctx.phase = "metrics";
    std::vector<LayerComparison> comparisons;
    comparisons.reserve(options.size());
    for (size_t i = 0; i < options.size(); ++i) {
        LayerComparison comparison;
        comparison.option = options[i];
        comparison.baseline = calculate_risk_metrics(
            ScenarioEngine::cede(baseline_claims, layers[i]), options[i].premium);
        comparison.stressed = calculate_risk_metrics(
            ScenarioEngine::cede(stressed_claims, layers[i]), options[i].premium);
        logger.log_layer_comparison(ctx, comparison);
        comparisons.push_back(comparison);
    }

    return comparisons;
}

} // namespace xolcalc
