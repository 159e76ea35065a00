#include <catch2/catch.hpp>
#include <algorithm>
#include <cmath>
#include <vector>
#include "errors.hpp"
#include "reinsurance_layer.hpp"

using namespace xolcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

// Gross losses from 0 to 120000 with irregular spacing
std::vector<double> gross_grid() {
    std::vector<double> grid;
    for (double g = 0.0; g <= 120000.0; g += 137.31) {
        grid.push_back(g);
    }
    grid.push_back(20000.0);
    grid.push_back(70000.0);
    std::sort(grid.begin(), grid.end());
    return grid;
}

} // anonymous namespace

// ============================================================================
// Layer arithmetic
// ============================================================================

TEST_CASE("ReinsuranceLayer cedes nothing on zero gross loss", "[layer][boundary]") {
    ReinsuranceLayer layer(20000.0, 50000.0);
    REQUIRE(layer.ceded(0.0) == 0.0);

    LayerSplit split = layer.apply(0.0);
    REQUIRE(split.ceded == 0.0);
    REQUIRE(split.retained == 0.0);
}

TEST_CASE("ReinsuranceLayer piecewise behaviour", "[layer]") {
    ReinsuranceLayer layer(20000.0, 50000.0);

    SECTION("Below retention") {
        REQUIRE(layer.ceded(19999.99) == 0.0);
        REQUIRE(layer.ceded(20000.0) == 0.0);
    }

    SECTION("Inside the layer") {
        REQUIRE_THAT(layer.ceded(35000.0), WithinRel(15000.0, 1e-12));
        LayerSplit split = layer.apply(35000.0);
        REQUIRE_THAT(split.retained, WithinRel(20000.0, 1e-12));
    }

    SECTION("Above exhaustion") {
        REQUIRE(layer.exhaustion_point() == 70000.0);
        REQUIRE(layer.ceded(70000.0) == 50000.0);
        REQUIRE(layer.ceded(250000.0) == 50000.0);
        REQUIRE_THAT(layer.apply(250000.0).retained, WithinRel(200000.0, 1e-12));
    }
}

TEST_CASE("ReinsuranceLayer ceded plus retained equals gross", "[layer][invariant]") {
    ReinsuranceLayer layer(20000.0, 50000.0);
    for (double g : gross_grid()) {
        LayerSplit split = layer.apply(g);
        REQUIRE(split.gross == g);
        REQUIRE_THAT(split.ceded + split.retained, WithinAbs(g, 1e-9 * std::max(1.0, g)));
        REQUIRE(split.ceded >= 0.0);
        REQUIRE(split.ceded <= layer.limit());
    }
}

TEST_CASE("ReinsuranceLayer is monotonic non-decreasing in gross loss", "[layer][invariant]") {
    ReinsuranceLayer layer(15000.0, 40000.0);
    double previous = 0.0;
    for (double g : gross_grid()) {
        double ceded = layer.ceded(g);
        REQUIRE(ceded >= previous);
        previous = ceded;
    }
}

TEST_CASE("ReinsuranceLayer with zero retention cedes min(gross, limit)", "[layer]") {
    ReinsuranceLayer layer(0.0, 50000.0);
    for (double g : gross_grid()) {
        REQUIRE(layer.ceded(g) == std::min(g, 50000.0));
    }
}

TEST_CASE("ReinsuranceLayer unlimited cedes max(0, gross - retention)", "[layer]") {
    ReinsuranceLayer layer = ReinsuranceLayer::unlimited(20000.0);
    REQUIRE(layer.is_unlimited());
    for (double g : gross_grid()) {
        REQUIRE(layer.ceded(g) == std::max(0.0, g - 20000.0));
    }
    REQUIRE(layer.ceded(1e12) == 1e12 - 20000.0);
}

TEST_CASE("ReinsuranceLayer with zero limit never cedes", "[layer][boundary]") {
    ReinsuranceLayer layer(1000.0, 0.0);
    REQUIRE(layer.ceded(0.0) == 0.0);
    REQUIRE(layer.ceded(5000.0) == 0.0);
    REQUIRE(layer.apply(5000.0).retained == 5000.0);
}

// ============================================================================
// Layer basis
// ============================================================================

TEST_CASE("ReinsuranceLayer aggregate basis applies the terms to the total", "[layer][basis]") {
    ReinsuranceLayer layer(20000.0, 50000.0);
    REQUIRE(layer.basis() == LayerBasis::Aggregate);

    LayerSplit split = layer.apply_to_claims({15000.0, 12000.0}, 27000.0);
    REQUIRE(split.ceded == 7000.0);
    REQUIRE(split.retained == 20000.0);
    REQUIRE(split.claims_hit == 0);
}

TEST_CASE("ReinsuranceLayer per-risk basis applies the terms to each claim", "[layer][basis]") {
    ReinsuranceLayer layer(25.0, 10.0, LayerBasis::PerRisk);
    std::vector<double> claims = {5.0, 30.0, 60.0, 25.0};
    double gross = 120.0;

    LayerSplit split = layer.apply_to_claims(claims, gross);

    // 0 + 5 + min(35, 10) + 0
    REQUIRE(split.ceded == 15.0);
    REQUIRE(split.retained == 105.0);
    REQUIRE(split.gross == 120.0);
    REQUIRE(split.claims_hit == 2);  // a claim exactly at the retention recovers nothing
}

TEST_CASE("ReinsuranceLayer unlimited per-risk cedes every excess", "[layer][basis]") {
    ReinsuranceLayer layer = ReinsuranceLayer::unlimited(25.0, LayerBasis::PerRisk);
    LayerSplit split = layer.apply_to_claims({26.0, 100.0, 3.0}, 129.0);

    REQUIRE(split.ceded == 1.0 + 75.0);
    REQUIRE(split.claims_hit == 2);

    LayerSplit none = layer.apply_to_claims({}, 0.0);
    REQUIRE(none.ceded == 0.0);
    REQUIRE(none.retained == 0.0);
    REQUIRE(none.claims_hit == 0);
}

TEST_CASE("Layer basis names", "[layer][basis]") {
    REQUIRE(layer_basis_to_string(LayerBasis::Aggregate) == "aggregate");
    REQUIRE(layer_basis_to_string(LayerBasis::PerRisk) == "per_risk");
    REQUIRE(layer_basis_from_string("per_risk") == LayerBasis::PerRisk);
    REQUIRE(layer_basis_from_string("Aggregate") == LayerBasis::Aggregate);
    REQUIRE_THROWS_AS(layer_basis_from_string("per_event"), ConfigError);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("ReinsuranceLayer rejects invalid terms", "[layer][error]") {
    REQUIRE_THROWS_AS(ReinsuranceLayer(-1.0, 50000.0), ConfigError);
    REQUIRE_THROWS_AS(ReinsuranceLayer(20000.0, -1.0), ConfigError);
    REQUIRE_THROWS_AS(ReinsuranceLayer(std::nan(""), 50000.0), ConfigError);
    REQUIRE_THROWS_AS(ReinsuranceLayer(20000.0, std::nan("")), ConfigError);
    REQUIRE_THROWS_AS(ReinsuranceLayer::unlimited(-5.0), ConfigError);
}

TEST_CASE("ReinsuranceLayer rejects invalid gross loss", "[layer][error]") {
    ReinsuranceLayer layer(20000.0, 50000.0);
    REQUIRE_THROWS_AS(layer.ceded(-1.0), ComputationError);
    REQUIRE_THROWS_AS(layer.ceded(std::nan("")), ComputationError);
    REQUIRE_THROWS_AS(layer.apply(INFINITY), ComputationError);
}

TEST_CASE("ReinsuranceLayer per-risk rejects invalid claims", "[layer][error]") {
    ReinsuranceLayer layer(10.0, 5.0, LayerBasis::PerRisk);
    REQUIRE_THROWS_AS(layer.apply_to_claims({20.0, -1.0}, 19.0), ComputationError);
    REQUIRE_THROWS_AS(layer.apply_to_claims({std::nan("")}, 0.0), ComputationError);
}
