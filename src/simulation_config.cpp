#include "simulation_config.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace xolcalc {

SimulationConfig::SimulationConfig()
    : trials(100000),
      frequency(FrequencyParams::poisson(2.0)),
      severity(SeverityParams::from_moments(10000.0, 5000.0)),
      retention(20000.0),
      limit(50000.0),
      layer_basis(LayerBasis::Aggregate),
      inflation_rate(0.08),
      premium(7500.0),
      seed(),
      common_random_numbers(false),
      num_threads(0) {}

void SimulationConfig::validate() const {
    if (trials == 0) {
        throw ConfigError("trials must be greater than 0");
    }

    // Model constructors carry the per-component parameter checks
    FrequencyModel frequency_model(frequency);
    SeverityModel severity_model(severity);
    ReinsuranceLayer layer_terms(retention, limit);
    (void)frequency_model;
    (void)severity_model;
    (void)layer_terms;

    if (!std::isfinite(inflation_rate) || inflation_rate < 0.0) {
        throw ConfigError("inflation_rate must be finite and >= 0, got " +
                          std::to_string(inflation_rate));
    }
    if (!std::isfinite(premium) || premium <= 0.0) {
        throw ConfigError("premium must be finite and > 0, got " +
                          std::to_string(premium));
    }
    if (num_threads < 0) {
        throw ConfigError("num_threads must be >= 0, got " + std::to_string(num_threads));
    }
}

ReinsuranceLayer SimulationConfig::layer() const {
    return ReinsuranceLayer(retention, limit, layer_basis);
}

} // namespace xolcalc
