#ifndef XOLCALC_RANDOM_STREAM_HPP
#define XOLCALC_RANDOM_STREAM_HPP

#include <cstdint>
#include <random>

namespace xolcalc {

// RandomStream: one independent sub-stream of draws
// Every trial owns a stream keyed by (seed, scenario id, trial index), so
// the draws a trial sees never depend on which thread ran it or when.
class RandomStream {
public:
    explicit RandomStream(uint64_t seed);

    // Sub-stream for one trial of one scenario
    static RandomStream for_trial(uint64_t seed, uint32_t scenario_id,
                                  uint64_t trial_index);

    double uniform();
    double standard_normal();

    // Discrete count draws (frequency)
    uint64_t poisson(double mean);
    uint64_t binomial(uint64_t trials, double probability);

    // Continuous positive draw (severity)
    double lognormal(double mu, double sigma);

private:
    RandomStream(std::seed_seq& seq);

    std::mt19937_64 rng_;
};

} // namespace xolcalc

#endif // XOLCALC_RANDOM_STREAM_HPP
