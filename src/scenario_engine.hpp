#ifndef XOLCALC_SCENARIO_ENGINE_HPP
#define XOLCALC_SCENARIO_ENGINE_HPP

#include "frequency.hpp"
#include "severity.hpp"
#include "reinsurance_layer.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xolcalc {

// One simulated period of portfolio experience
struct Trial {
    uint64_t claim_count;
    std::vector<double> severities;
    double gross_loss;
    double ceded_loss;
    double retained_loss;
    uint64_t claims_hit;        // Per-risk basis only

    Trial();
};

// Parameter set of one scenario run (baseline or stressed)
struct ScenarioSpec {
    std::string name;
    uint32_t scenario_id;   // Identity of the scenario in logs and results
    uint32_t stream_id;     // Keys the per-trial random sub-streams
    FrequencyModel frequency;
    SeverityModel severity;

    ScenarioSpec(const std::string& name, uint32_t scenario_id,
                 const FrequencyModel& frequency, const SeverityModel& severity);
};

// Ceded loss per trial, indexed by trial number
// Immutable once the producing run completes. A per-risk run also records
// how many claims it saw and how many of them reached the layer.
class CededLossDistribution {
public:
    explicit CededLossDistribution(std::vector<double> losses);
    CededLossDistribution(std::vector<double> losses, uint64_t total_claims,
                          uint64_t claims_hit);

    size_t size() const { return losses_.size(); }
    bool empty() const { return losses_.empty(); }

    double at(size_t trial_index) const;
    const std::vector<double>& values() const { return losses_; }

    // Ascending copy for percentile computation
    std::vector<double> sorted() const;

    bool has_claim_counts() const { return has_claim_counts_; }
    uint64_t total_claims() const { return total_claims_; }
    uint64_t claims_hit() const { return claims_hit_; }

    // claims_hit / total_claims (0 when no claim occurred); empty unless
    // claim counts were recorded
    std::optional<double> claim_hit_ratio() const;

private:
    std::vector<double> losses_;
    bool has_claim_counts_;
    uint64_t total_claims_;
    uint64_t claims_hit_;
};

// Claim severities of every trial, indexed by trial number
using TrialClaims = std::vector<std::vector<double>>;

// Cooperative cancellation flag, checked between trials
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_;
};

// ScenarioEngine: runs N independent trials of one ScenarioSpec
//
// Per trial: draw frequency -> draw severities -> aggregate -> apply layer.
// Trial i always draws from RandomStream::for_trial(seed, stream_id, i) and
// writes its result to slot i, so output is identical for any thread count.
class ScenarioEngine {
public:
    // num_threads = 0 uses the OpenMP default
    ScenarioEngine(size_t trials, uint64_t seed, int num_threads = 0);

    // Throws AnalysisCancelled if the token fires, ComputationError on
    // numerical failure in any trial
    CededLossDistribution run(const ScenarioSpec& spec,
                              const ReinsuranceLayer& layer,
                              const CancellationToken* cancel = nullptr) const;

    // Claim severities per trial, for pricing several layers over the same trials
    TrialClaims simulate_claims(const ScenarioSpec& spec,
                                const CancellationToken* cancel = nullptr) const;

    // Single trial with all intermediate values kept
    Trial run_trial(const ScenarioSpec& spec, const ReinsuranceLayer& layer,
                    uint64_t trial_index) const;

    // Apply a layer to precomputed claims
    static CededLossDistribution cede(const TrialClaims& claims,
                                      const ReinsuranceLayer& layer);

    size_t trials() const { return trials_; }
    uint64_t seed() const { return seed_; }
    int num_threads() const { return num_threads_; }

private:
    size_t trials_;
    uint64_t seed_;
    int num_threads_;
};

} // namespace xolcalc

#endif // XOLCALC_SCENARIO_ENGINE_HPP
