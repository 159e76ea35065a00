#include "reinsurance_layer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace xolcalc {

std::string layer_basis_to_string(LayerBasis basis) {
    switch (basis) {
        case LayerBasis::Aggregate: return "aggregate";
        case LayerBasis::PerRisk: return "per_risk";
        default: return "unknown";
    }
}

LayerBasis layer_basis_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "aggregate") return LayerBasis::Aggregate;
    if (lower == "per_risk") return LayerBasis::PerRisk;
    throw ConfigError("Unknown layer basis: " + name);
}

ReinsuranceLayer::ReinsuranceLayer(double retention, double limit, LayerBasis basis)
    : retention_(retention), limit_(limit), basis_(basis) {
    if (!std::isfinite(retention_) || retention_ < 0.0) {
        throw ConfigError("Layer retention must be finite and >= 0, got " +
                          std::to_string(retention_));
    }
    // +inf is a valid (unbounded) limit, NaN is not
    if (std::isnan(limit_) || limit_ < 0.0) {
        throw ConfigError("Layer limit must be >= 0 or unlimited, got " +
                          std::to_string(limit_));
    }
}

ReinsuranceLayer ReinsuranceLayer::unlimited(double retention, LayerBasis basis) {
    return ReinsuranceLayer(retention, UNLIMITED, basis);
}

double ReinsuranceLayer::ceded(double loss) const {
    if (!std::isfinite(loss) || loss < 0.0) {
        throw ComputationError("Loss must be finite and >= 0, got " +
                               std::to_string(loss));
    }
    double excess = loss - retention_;
    if (excess <= 0.0) {
        return 0.0;
    }
    return std::min(excess, limit_);
}

LayerSplit ReinsuranceLayer::apply(double gross) const {
    LayerSplit split;
    split.gross = gross;
    split.ceded = ceded(gross);
    split.retained = gross - split.ceded;
    split.claims_hit = 0;
    return split;
}

LayerSplit ReinsuranceLayer::apply_to_claims(const std::vector<double>& severities,
                                             double gross) const {
    if (basis_ == LayerBasis::Aggregate) {
        return apply(gross);
    }

    LayerSplit split;
    split.gross = gross;
    split.ceded = 0.0;
    split.claims_hit = 0;
    for (double severity : severities) {
        double recovery = ceded(severity);
        if (recovery > 0.0) {
            split.ceded += recovery;
            ++split.claims_hit;
        }
    }
    split.retained = gross - split.ceded;
    return split;
}

} // namespace xolcalc
