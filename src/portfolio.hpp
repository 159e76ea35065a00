#ifndef XOLCALC_PORTFOLIO_HPP
#define XOLCALC_PORTFOLIO_HPP

#include <cstdint>
#include <vector>

namespace xolcalc {

// Gross portfolio loss for one trial: sum of the drawn severities
// (0 when no claims occurred)
// Throws ComputationError if claim_count does not match severities.size()
// or the sum is not finite.
double aggregate_gross_loss(uint64_t claim_count, const std::vector<double>& severities);

} // namespace xolcalc

#endif // XOLCALC_PORTFOLIO_HPP
