#ifndef XOLCALC_REINSURANCE_LAYER_HPP
#define XOLCALC_REINSURANCE_LAYER_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace xolcalc {

// What the layer terms are applied to
enum class LayerBasis {
    Aggregate,  // Once, to the sum of a trial's claims
    PerRisk     // To each claim separately; recoveries are summed
};

std::string layer_basis_to_string(LayerBasis basis);

// Accepts "aggregate" or "per_risk"; throws ConfigError otherwise
LayerBasis layer_basis_from_string(const std::string& name);

// Gross loss of one trial split between reinsurer and cedent
// Invariant: ceded + retained == gross
struct LayerSplit {
    double gross;
    double ceded;
    double retained;
    uint64_t claims_hit;   // Claims with a recovery (per-risk basis only)
};

// ReinsuranceLayer: one Excess-of-Loss layer "limit xs retention"
//
//   ceded    = clamp(G - R, 0, L)
//   retained = G - ceded
//
// Zero below the retention, capped at the limit above R + L.
// An unbounded limit is represented as +infinity. On a per-risk basis the
// formula is applied to every claim and the limit caps each recovery, so a
// trial's ceded loss is not bounded by L.
class ReinsuranceLayer {
public:
    static constexpr double UNLIMITED = std::numeric_limits<double>::infinity();

    // Throws ConfigError if retention < 0, limit < 0 or either is NaN
    ReinsuranceLayer(double retention, double limit,
                     LayerBasis basis = LayerBasis::Aggregate);

    static ReinsuranceLayer unlimited(double retention,
                                      LayerBasis basis = LayerBasis::Aggregate);

    // Recovery on a single loss amount
    // Throws ComputationError for negative or non-finite loss
    double ceded(double loss) const;
    LayerSplit apply(double gross) const;

    // Split of one trial's claims according to the layer basis
    LayerSplit apply_to_claims(const std::vector<double>& severities, double gross) const;

    double retention() const { return retention_; }
    double limit() const { return limit_; }
    LayerBasis basis() const { return basis_; }
    bool is_unlimited() const { return limit_ == UNLIMITED; }

    // Gross loss above which the layer is exhausted (R + L)
    double exhaustion_point() const { return retention_ + limit_; }

private:
    double retention_;
    double limit_;
    LayerBasis basis_;
};

} // namespace xolcalc

#endif // XOLCALC_REINSURANCE_LAYER_HPP
