#ifndef XOLCALC_FREQUENCY_HPP
#define XOLCALC_FREQUENCY_HPP

#include "random_stream.hpp"
#include <cstdint>
#include <string>

namespace xolcalc {

enum class FrequencyDistribution : uint8_t {
    Poisson = 0,
    Binomial = 1
};

std::string frequency_distribution_to_string(FrequencyDistribution distribution);
FrequencyDistribution frequency_distribution_from_string(const std::string& name);

// Parameters of the claim count distribution
// Poisson uses lambda; Binomial uses policy_count and claim_probability
// (one Bernoulli claim indicator per policy in the portfolio).
struct FrequencyParams {
    FrequencyDistribution distribution;
    double lambda;
    uint64_t policy_count;
    double claim_probability;

    FrequencyParams();

    static FrequencyParams poisson(double lambda);
    static FrequencyParams binomial(uint64_t policy_count, double claim_probability);
};

// FrequencyModel: draws the number of claims in one trial
class FrequencyModel {
public:
    // Throws ConfigError on invalid parameters (e.g. lambda < 0)
    explicit FrequencyModel(const FrequencyParams& params);

    uint64_t draw(RandomStream& stream) const;

    // Mean claim count per trial
    double expected_count() const;

    const FrequencyParams& params() const { return params_; }

private:
    FrequencyParams params_;
};

} // namespace xolcalc

#endif // XOLCALC_FREQUENCY_HPP
