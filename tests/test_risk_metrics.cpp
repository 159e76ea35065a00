#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>
#include "errors.hpp"
#include "random_stream.hpp"
#include "risk_metrics.hpp"

using namespace xolcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Percentile rule
// ============================================================================

TEST_CASE("Percentile interpolates linearly between order statistics", "[metrics][percentile]") {
    std::vector<double> values = {1.0, 2.0, 3.0, 4.0};

    REQUIRE(percentile(values, 0.0) == 1.0);
    REQUIRE(percentile(values, 100.0) == 4.0);
    REQUIRE_THAT(percentile(values, 50.0), WithinRel(2.5, 1e-12));
    REQUIRE_THAT(percentile(values, 99.0), WithinRel(3.97, 1e-12));
}

TEST_CASE("Percentile of 1..100 at 99", "[metrics][percentile]") {
    std::vector<double> values;
    for (int i = 1; i <= 100; ++i) values.push_back(i);

    // position 0.99 * 99 = 98.01 -> 99 + 0.01 * (100 - 99)
    REQUIRE_THAT(percentile(values, 99.0), WithinRel(99.01, 1e-12));
    REQUIRE_THAT(tail_mean(values, 99.01), WithinRel(100.0, 1e-12));
}

TEST_CASE("Percentile errors", "[metrics][percentile][error]") {
    REQUIRE_THROWS_AS(percentile({}, 99.0), ComputationError);
    REQUIRE_THROWS_AS(percentile({1.0, 2.0}, 101.0), ComputationError);
    REQUIRE_THROWS_AS(tail_mean({1.0, 2.0}, 5.0), ComputationError);
}

// ============================================================================
// Metrics on known data
// ============================================================================

TEST_CASE("Risk metrics on a small known distribution", "[metrics]") {
    std::vector<double> losses = {0.0, 20.0, 0.0, 10.0, 0.0};
    RiskMetrics m = calculate_risk_metrics(losses, 3.0);

    REQUIRE_THAT(m.expected_loss, WithinRel(6.0, 1e-12));
    REQUIRE_THAT(m.std_dev, WithinRel(8.0, 1e-12));           // population
    REQUIRE_THAT(m.var_99, WithinRel(19.6, 1e-12));           // 10 + 0.96 * 10
    REQUIRE_THAT(m.tvar_99, WithinRel(20.0, 1e-12));
    REQUIRE_THAT(m.trigger_probability, WithinRel(0.4, 1e-12));
    REQUIRE_THAT(m.value_for_money, WithinRel(2.0, 1e-12));
}

TEST_CASE("Risk metrics of a single trial", "[metrics][boundary]") {
    RiskMetrics m = calculate_risk_metrics(std::vector<double>{1234.5}, 100.0);

    REQUIRE(m.expected_loss == 1234.5);
    REQUIRE(m.std_dev == 0.0);
    REQUIRE(m.var_99 == 1234.5);
    REQUIRE(m.tvar_99 == 1234.5);
    REQUIRE(m.trigger_probability == 1.0);
}

TEST_CASE("Risk metrics when the layer is never triggered", "[metrics][boundary]") {
    RiskMetrics m = calculate_risk_metrics(std::vector<double>(1000, 0.0), 50.0);

    REQUIRE(m.expected_loss == 0.0);
    REQUIRE(m.std_dev == 0.0);
    REQUIRE(m.var_99 == 0.0);
    REQUIRE(m.tvar_99 == 0.0);
    REQUIRE(m.trigger_probability == 0.0);
    REQUIRE(m.value_for_money == 0.0);
}

TEST_CASE("Risk metrics accept a CededLossDistribution", "[metrics]") {
    CededLossDistribution dist({0.0, 20.0, 0.0, 10.0, 0.0});
    RiskMetrics m = calculate_risk_metrics(dist, 3.0);
    REQUIRE_THAT(m.expected_loss, WithinRel(6.0, 1e-12));
}

TEST_CASE("TVaR99 is never below VaR99", "[metrics][invariant]") {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        RandomStream stream(seed);
        std::vector<double> losses;
        size_t n = 50 + seed * 37;
        for (size_t i = 0; i < n; ++i) {
            double gross = stream.lognormal(9.0, 1.0);
            losses.push_back(std::min(std::max(0.0, gross - 15000.0), 40000.0));
        }
        RiskMetrics m = calculate_risk_metrics(losses, 1000.0);
        REQUIRE(m.tvar_99 >= m.var_99);
    }

    // Capped distribution: the whole tail sits at the limit
    std::vector<double> capped(500, 50000.0);
    capped[0] = 0.0;
    RiskMetrics m = calculate_risk_metrics(capped, 1.0);
    REQUIRE(m.var_99 == 50000.0);
    REQUIRE(m.tvar_99 == 50000.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Risk metrics reject empty and non-finite distributions", "[metrics][error]") {
    REQUIRE_THROWS_AS(calculate_risk_metrics(std::vector<double>{}, 1.0), ComputationError);

    std::vector<double> with_nan = {1.0, std::nan(""), 3.0};
    REQUIRE_THROWS_AS(calculate_risk_metrics(with_nan, 1.0), ComputationError);

    std::vector<double> with_inf = {1.0, std::numeric_limits<double>::infinity()};
    REQUIRE_THROWS_AS(calculate_risk_metrics(with_inf, 1.0), ComputationError);
}

TEST_CASE("Risk metrics reject a non-positive premium", "[metrics][error]") {
    std::vector<double> losses = {1.0, 2.0};
    REQUIRE_THROWS_AS(calculate_risk_metrics(losses, 0.0), ConfigError);
    REQUIRE_THROWS_AS(calculate_risk_metrics(losses, -10.0), ConfigError);
}
