#ifndef XOLCALC_SIMULATION_CONFIG_HPP
#define XOLCALC_SIMULATION_CONFIG_HPP

#include "frequency.hpp"
#include "severity.hpp"
#include "reinsurance_layer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace xolcalc {

// Full parameter set of one analysis (baseline + inflation-stressed run)
struct SimulationConfig {
    static constexpr uint64_t DEFAULT_SEED = 42;

    size_t trials;                  // Number of Monte Carlo trials per scenario (> 0)
    FrequencyParams frequency;      // Claim count distribution
    SeverityParams severity;        // Lognormal claim size (log-space mu, sigma)
    double retention;               // Layer attachment point R (>= 0)
    double limit;                   // Layer limit L (>= 0, +inf = unlimited)
    LayerBasis layer_basis;         // Aggregate (default) or per-risk cover
    double inflation_rate;          // Severity shock for the stressed scenario (>= 0)
    double premium;                 // Reinsurance premium (> 0)
    std::optional<uint64_t> seed;   // Unset = DEFAULT_SEED
    bool common_random_numbers;     // Stressed run reuses the baseline sub-streams
    int num_threads;                // 0 = OpenMP default

    SimulationConfig();

    uint64_t effective_seed() const { return seed.value_or(DEFAULT_SEED); }

    // Throws ConfigError describing the first invalid field
    void validate() const;

    ReinsuranceLayer layer() const;
};

} // namespace xolcalc

#endif // XOLCALC_SIMULATION_CONFIG_HPP
