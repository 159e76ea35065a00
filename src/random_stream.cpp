#include "random_stream.hpp"
#include <vector>

namespace xolcalc {

RandomStream::RandomStream(uint64_t seed) : rng_(seed) {}

RandomStream::RandomStream(std::seed_seq& seq) : rng_(seq) {}

RandomStream RandomStream::for_trial(uint64_t seed, uint32_t scenario_id,
                                     uint64_t trial_index) {
    // seed_seq mixes every input word, so neighbouring trials and scenarios
    // get uncorrelated generator states
    std::vector<uint32_t> words;
    words.reserve(5);
    words.push_back(static_cast<uint32_t>(seed & 0xFFFFFFFFu));
    words.push_back(static_cast<uint32_t>((seed >> 32) & 0xFFFFFFFFu));
    words.push_back(scenario_id);
    words.push_back(static_cast<uint32_t>(trial_index & 0xFFFFFFFFu));
    words.push_back(static_cast<uint32_t>((trial_index >> 32) & 0xFFFFFFFFu));
    std::seed_seq seq(words.begin(), words.end());
    return RandomStream(seq);
}

double RandomStream::uniform() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

double RandomStream::standard_normal() {
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

uint64_t RandomStream::poisson(double mean) {
    if (mean <= 0.0) {
        return 0;
    }
    std::poisson_distribution<uint64_t> dist(mean);
    return dist(rng_);
}

uint64_t RandomStream::binomial(uint64_t trials, double probability) {
    if (trials == 0 || probability <= 0.0) {
        return 0;
    }
    std::binomial_distribution<uint64_t> dist(trials, probability);
    return dist(rng_);
}

double RandomStream::lognormal(double mu, double sigma) {
    std::lognormal_distribution<double> dist(mu, sigma);
    return dist(rng_);
}

} // namespace xolcalc
