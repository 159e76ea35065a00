#ifndef XOLCALC_SEVERITY_HPP
#define XOLCALC_SEVERITY_HPP

#include "random_stream.hpp"
#include <cstdint>
#include <vector>

namespace xolcalc {

// Lognormal severity parameters: mean and standard deviation of the
// underlying normal distribution (log space)
struct SeverityParams {
    double mu;
    double sigma;

    SeverityParams();
    SeverityParams(double mu, double sigma);

    // Convert the lognormal's own mean and standard deviation:
    //   sigma^2 = ln(1 + std^2 / mean^2)
    //   mu      = ln(mean) - sigma^2 / 2
    static SeverityParams from_moments(double mean, double std_dev);

    // Mean and standard deviation of the lognormal itself
    double mean() const;
    double std_dev() const;
};

// SeverityModel: draws individual claim sizes
class SeverityModel {
public:
    // Throws ConfigError if sigma <= 0 or a parameter is not finite
    explicit SeverityModel(const SeverityParams& params);

    // Severities scaled by (1 + inflation_rate): mu shifts by ln(1 + r),
    // sigma is unchanged so the shape of the distribution is preserved
    SeverityModel with_inflation(double inflation_rate) const;

    double draw(RandomStream& stream) const;

    // Append `count` draws to `out`
    // Throws ComputationError on a non-finite or non-positive draw
    void draw_into(RandomStream& stream, uint64_t count, std::vector<double>& out) const;

    std::vector<double> draw(RandomStream& stream, uint64_t count) const;

    const SeverityParams& params() const { return params_; }

private:
    SeverityParams params_;
};

} // namespace xolcalc

#endif // XOLCALC_SEVERITY_HPP
