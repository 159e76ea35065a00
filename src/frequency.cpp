#include "frequency.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace xolcalc {

std::string frequency_distribution_to_string(FrequencyDistribution distribution) {
    switch (distribution) {
        case FrequencyDistribution::Poisson: return "poisson";
        case FrequencyDistribution::Binomial: return "binomial";
        default: return "unknown";
    }
}

FrequencyDistribution frequency_distribution_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "poisson") return FrequencyDistribution::Poisson;
    if (lower == "binomial") return FrequencyDistribution::Binomial;
    throw ConfigError("Unknown frequency distribution: " + name);
}

// ============================================================================
// FrequencyParams Implementation
// ============================================================================

FrequencyParams::FrequencyParams()
    : distribution(FrequencyDistribution::Poisson),
      lambda(1.0),
      policy_count(0),
      claim_probability(0.0) {}

FrequencyParams FrequencyParams::poisson(double lambda) {
    FrequencyParams params;
    params.distribution = FrequencyDistribution::Poisson;
    params.lambda = lambda;
    return params;
}

FrequencyParams FrequencyParams::binomial(uint64_t policy_count, double claim_probability) {
    FrequencyParams params;
    params.distribution = FrequencyDistribution::Binomial;
    params.lambda = 0.0;
    params.policy_count = policy_count;
    params.claim_probability = claim_probability;
    return params;
}

// ============================================================================
// FrequencyModel Implementation
// ============================================================================

FrequencyModel::FrequencyModel(const FrequencyParams& params) : params_(params) {
    switch (params_.distribution) {
        case FrequencyDistribution::Poisson:
            if (!std::isfinite(params_.lambda) || params_.lambda < 0.0) {
                throw ConfigError("Frequency lambda must be finite and >= 0, got " +
                                  std::to_string(params_.lambda));
            }
            break;
        case FrequencyDistribution::Binomial:
            if (params_.policy_count == 0) {
                throw ConfigError("Binomial frequency requires policy_count > 0");
            }
            if (!(params_.claim_probability >= 0.0 && params_.claim_probability <= 1.0)) {
                throw ConfigError("Binomial claim_probability must be between 0 and 1, got " +
                                  std::to_string(params_.claim_probability));
            }
            break;
        default:
            throw ConfigError("Unsupported frequency distribution");
    }
}

uint64_t FrequencyModel::draw(RandomStream& stream) const {
    if (params_.distribution == FrequencyDistribution::Binomial) {
        return stream.binomial(params_.policy_count, params_.claim_probability);
    }
    // lambda == 0 always yields no claims
    return stream.poisson(params_.lambda);
}

double FrequencyModel::expected_count() const {
    if (params_.distribution == FrequencyDistribution::Binomial) {
        return static_cast<double>(params_.policy_count) * params_.claim_probability;
    }
    return params_.lambda;
}

} // namespace xolcalc
