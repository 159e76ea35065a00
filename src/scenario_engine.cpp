#include "scenario_engine.hpp"
#include "errors.hpp"
#include "portfolio.hpp"
#include "random_stream.hpp"
#include <algorithm>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace xolcalc {

// ============================================================================
// Trial / ScenarioSpec Implementation
// ============================================================================

Trial::Trial()
    : claim_count(0), gross_loss(0.0), ceded_loss(0.0), retained_loss(0.0), claims_hit(0) {}

ScenarioSpec::ScenarioSpec(const std::string& n, uint32_t id,
                           const FrequencyModel& freq, const SeverityModel& sev)
    : name(n), scenario_id(id), stream_id(id), frequency(freq), severity(sev) {}

// ============================================================================
// CededLossDistribution Implementation
// ============================================================================

CededLossDistribution::CededLossDistribution(std::vector<double> losses)
    : losses_(std::move(losses)), has_claim_counts_(false), total_claims_(0), claims_hit_(0) {}

CededLossDistribution::CededLossDistribution(std::vector<double> losses,
                                             uint64_t total_claims, uint64_t claims_hit)
    : losses_(std::move(losses)),
      has_claim_counts_(true),
      total_claims_(total_claims),
      claims_hit_(claims_hit) {}

double CededLossDistribution::at(size_t trial_index) const {
    if (trial_index >= losses_.size()) {
        throw std::out_of_range("Trial index out of range");
    }
    return losses_[trial_index];
}

std::vector<double> CededLossDistribution::sorted() const {
    std::vector<double> sorted_losses = losses_;
    std::sort(sorted_losses.begin(), sorted_losses.end());
    return sorted_losses;
}

std::optional<double> CededLossDistribution::claim_hit_ratio() const {
    if (!has_claim_counts_) {
        return std::nullopt;
    }
    if (total_claims_ == 0) {
        return 0.0;
    }
    return static_cast<double>(claims_hit_) / static_cast<double>(total_claims_);
}

// ============================================================================
// Trial loop
// ============================================================================

namespace {

// Called from a catch block; prefixes numerical failures with their trial
std::exception_ptr annotate_trial_error(size_t trial_index) {
    try {
        throw;
    } catch (const ComputationError& e) {
        return std::make_exception_ptr(ComputationError(
            "Trial " + std::to_string(trial_index) + ": " + e.what()));
    } catch (...) {
        return std::current_exception();
    }
}

// Runs fn(i) for every trial index. The exception of the lowest failing
// trial index is rethrown once the loop has finished. Only trials above an
// index already known to fail are skipped, so the reported failure does not
// depend on scheduling.
template <typename TrialFn>
void for_each_trial(size_t trials, int num_threads,
                    const CancellationToken* cancel, TrialFn&& fn) {
    std::exception_ptr first_error;
    std::atomic<size_t> first_error_index(std::numeric_limits<size_t>::max());

#ifdef HAVE_OPENMP
    int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(static) num_threads(threads)
    for (size_t i = 0; i < trials; ++i) {
        if (i > first_error_index.load(std::memory_order_relaxed) ||
            (cancel && cancel->is_cancelled())) {
            continue;
        }
        try {
            fn(i);
        } catch (...) {
            std::exception_ptr error = annotate_trial_error(i);
            #pragma omp critical(xolcalc_trial_error)
            {
                if (i < first_error_index.load(std::memory_order_relaxed)) {
                    first_error_index.store(i, std::memory_order_relaxed);
                    first_error = error;
                }
            }
        }
    }
#else
    (void)num_threads;
    for (size_t i = 0; i < trials; ++i) {
        if (cancel && cancel->is_cancelled()) {
            break;
        }
        try {
            fn(i);
        } catch (...) {
            first_error_index.store(i);
            first_error = annotate_trial_error(i);
            break;
        }
    }
#endif

    if (cancel && cancel->is_cancelled()) {
        throw AnalysisCancelled("Scenario run cancelled; completed trials discarded");
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

// Sequential sum so the totals do not depend on the thread count
uint64_t sum_counts(const std::vector<uint64_t>& counts) {
    uint64_t total = 0;
    for (uint64_t count : counts) {
        total += count;
    }
    return total;
}

} // anonymous namespace

// ============================================================================
// ScenarioEngine Implementation
// ============================================================================

ScenarioEngine::ScenarioEngine(size_t trials, uint64_t seed, int num_threads)
    : trials_(trials), seed_(seed), num_threads_(num_threads) {
    if (trials_ == 0) {
        throw ConfigError("ScenarioEngine requires at least one trial");
    }
    if (num_threads_ < 0) {
        throw ConfigError("num_threads must be >= 0");
    }
}

Trial ScenarioEngine::run_trial(const ScenarioSpec& spec, const ReinsuranceLayer& layer,
                                uint64_t trial_index) const {
    RandomStream stream = RandomStream::for_trial(seed_, spec.stream_id, trial_index);

    Trial trial;
    trial.claim_count = spec.frequency.draw(stream);
    spec.severity.draw_into(stream, trial.claim_count, trial.severities);
    trial.gross_loss = aggregate_gross_loss(trial.claim_count, trial.severities);

    LayerSplit split = layer.apply_to_claims(trial.severities, trial.gross_loss);
    trial.ceded_loss = split.ceded;
    trial.retained_loss = split.retained;
    trial.claims_hit = split.claims_hit;
    return trial;
}

CededLossDistribution ScenarioEngine::run(const ScenarioSpec& spec,
                                          const ReinsuranceLayer& layer,
                                          const CancellationToken* cancel) const {
    std::vector<double> ceded(trials_, 0.0);
    std::vector<uint64_t> claims(trials_, 0);
    std::vector<uint64_t> hits(trials_, 0);

    for_each_trial(trials_, num_threads_, cancel, [&](size_t i) {
        Trial trial = run_trial(spec, layer, i);
        ceded[i] = trial.ceded_loss;
        claims[i] = trial.claim_count;
        hits[i] = trial.claims_hit;
    });

    if (layer.basis() == LayerBasis::PerRisk) {
        return CededLossDistribution(std::move(ceded), sum_counts(claims), sum_counts(hits));
    }
    return CededLossDistribution(std::move(ceded));
}

TrialClaims ScenarioEngine::simulate_claims(const ScenarioSpec& spec,
                                            const CancellationToken* cancel) const {
    TrialClaims claims(trials_);

    for_each_trial(trials_, num_threads_, cancel, [&](size_t i) {
        RandomStream stream = RandomStream::for_trial(seed_, spec.stream_id, i);
        uint64_t claim_count = spec.frequency.draw(stream);
        spec.severity.draw_into(stream, claim_count, claims[i]);
    });

    return claims;
}

CededLossDistribution ScenarioEngine::cede(const TrialClaims& claims,
                                           const ReinsuranceLayer& layer) {
    std::vector<double> ceded;
    ceded.reserve(claims.size());
    uint64_t total_claims = 0;
    uint64_t claims_hit = 0;
    for (const std::vector<double>& severities : claims) {
        double gross = aggregate_gross_loss(severities.size(), severities);
        LayerSplit split = layer.apply_to_claims(severities, gross);
        ceded.push_back(split.ceded);
        total_claims += severities.size();
        claims_hit += split.claims_hit;
    }

    if (layer.basis() == LayerBasis::PerRisk) {
        return CededLossDistribution(std::move(ceded), total_claims, claims_hit);
    }
    return CededLossDistribution(std::move(ceded));
}

} // namespace xolcalc
