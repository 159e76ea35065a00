#include "severity.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace xolcalc {

// ============================================================================
// SeverityParams Implementation
// ============================================================================

SeverityParams::SeverityParams() : mu(0.0), sigma(1.0) {}

SeverityParams::SeverityParams(double m, double s) : mu(m), sigma(s) {}

SeverityParams SeverityParams::from_moments(double mean, double std_dev) {
    if (!std::isfinite(mean) || mean <= 0.0) {
        throw ConfigError("Severity mean must be finite and > 0, got " +
                          std::to_string(mean));
    }
    if (!std::isfinite(std_dev) || std_dev <= 0.0) {
        throw ConfigError("Severity std_dev must be finite and > 0, got " +
                          std::to_string(std_dev));
    }
    double sigma2 = std::log(1.0 + (std_dev * std_dev) / (mean * mean));
    return SeverityParams(std::log(mean) - 0.5 * sigma2, std::sqrt(sigma2));
}

double SeverityParams::mean() const {
    return std::exp(mu + 0.5 * sigma * sigma);
}

double SeverityParams::std_dev() const {
    double sigma2 = sigma * sigma;
    return std::sqrt((std::exp(sigma2) - 1.0) * std::exp(2.0 * mu + sigma2));
}

// ============================================================================
// SeverityModel Implementation
// ============================================================================

SeverityModel::SeverityModel(const SeverityParams& params) : params_(params) {
    if (!std::isfinite(params_.mu)) {
        throw ConfigError("Severity mu must be finite");
    }
    if (!std::isfinite(params_.sigma) || params_.sigma <= 0.0) {
        throw ConfigError("Severity sigma must be finite and > 0, got " +
                          std::to_string(params_.sigma));
    }
}

SeverityModel SeverityModel::with_inflation(double inflation_rate) const {
    if (!std::isfinite(inflation_rate) || inflation_rate < 0.0) {
        throw ConfigError("Inflation rate must be finite and >= 0, got " +
                          std::to_string(inflation_rate));
    }
    return SeverityModel(SeverityParams(params_.mu + std::log1p(inflation_rate),
                                        params_.sigma));
}

double SeverityModel::draw(RandomStream& stream) const {
    double x = stream.lognormal(params_.mu, params_.sigma);
    if (!std::isfinite(x) || x <= 0.0) {
        throw ComputationError("Severity draw is not a finite positive value: " +
                               std::to_string(x));
    }
    return x;
}

void SeverityModel::draw_into(RandomStream& stream, uint64_t count,
                              std::vector<double>& out) const {
    out.reserve(out.size() + count);
    for (uint64_t i = 0; i < count; ++i) {
        out.push_back(draw(stream));
    }
}

std::vector<double> SeverityModel::draw(RandomStream& stream, uint64_t count) const {
    std::vector<double> severities;
    draw_into(stream, count, severities);
    return severities;
}

} // namespace xolcalc
