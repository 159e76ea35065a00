#include "portfolio.hpp"
#include "errors.hpp"
#include <cmath>
#include <numeric>
#include <string>

namespace xolcalc {

double aggregate_gross_loss(uint64_t claim_count, const std::vector<double>& severities) {
    if (claim_count != severities.size()) {
        throw ComputationError("Claim count " + std::to_string(claim_count) +
                               " does not match " + std::to_string(severities.size()) +
                               " severities");
    }
    if (claim_count == 0) {
        return 0.0;
    }
    double gross = std::accumulate(severities.begin(), severities.end(), 0.0);
    if (!std::isfinite(gross)) {
        throw ComputationError("Gross loss overflowed to a non-finite value");
    }
    return gross;
}

} // namespace xolcalc
