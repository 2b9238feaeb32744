#include <catch2/catch.hpp>
#include <stdexcept>
#include "scenario.hpp"

using namespace propcalc;
using Catch::Matchers::WithinRel;

// ============================================================================
// Helpers
// ============================================================================

Configuration make_scenario_config() {
    Configuration config;
    config.price = 100000000.0;
    config.monthly_rent = 500000.0;
    config.interest_rate = 1.6;

    StressScenario scenario;
    scenario.interest_shock = InterestShock{5, 1.0};
    scenario.rent_curve = RentCurveOverride{1.5, 0.5, 10};
    scenario.occupancy_decline = OccupancyDecline{10, 5.0};
    config.scenario = scenario;
    return config;
}

// ============================================================================
// RatePath
// ============================================================================

TEST_CASE("RatePath default constructor initializes all rates to zero", "[scenario][rates]") {
    RatePath rates;

    REQUIRE(rates.get_rate(1) == 0.0);
    REQUIRE(rates.get_rate(25) == 0.0);
    REQUIRE(rates.get_rate(50) == 0.0);
}

TEST_CASE("RatePath flat constructor", "[scenario][rates]") {
    RatePath rates(1.6);

    REQUIRE(rates.get_rate(1) == 1.6);
    REQUIRE(rates.get_rate(50) == 1.6);
}

TEST_CASE("RatePath set and get rates", "[scenario][rates]") {
    RatePath rates;

    rates.set_rate(1, 1.2);
    rates.set_rate(25, 2.5);
    rates.set_rate(50, 3.0);

    REQUIRE_THAT(rates.get_rate(1), WithinRel(1.2, 1e-10));
    REQUIRE_THAT(rates.get_rate(25), WithinRel(2.5, 1e-10));
    REQUIRE_THAT(rates.get_rate(50), WithinRel(3.0, 1e-10));
}

TEST_CASE("RatePath rejects years outside 1-50", "[scenario][rates][boundary]") {
    RatePath rates;

    REQUIRE_THROWS_AS(rates.get_rate(0), std::out_of_range);
    REQUIRE_THROWS_AS(rates.get_rate(51), std::out_of_range);
    REQUIRE_THROWS_AS(rates.set_rate(0, 1.0), std::out_of_range);
    REQUIRE_THROWS_AS(rates.set_rate(51, 1.0), std::out_of_range);
}

TEST_CASE("RatePath shock applies from its year onwards", "[scenario][rates]") {
    RatePath rates(1.6);
    rates.apply_shock(5, 1.0);

    REQUIRE(rates.get_rate(4) == 1.6);
    REQUIRE_THAT(rates.get_rate(5), WithinRel(2.6, 1e-12));
    REQUIRE_THAT(rates.get_rate(50), WithinRel(2.6, 1e-12));
}

TEST_CASE("RatePath shock never goes below zero", "[scenario][rates][boundary]") {
    RatePath rates(1.0);
    rates.apply_shock(1, -3.0);

    REQUIRE(rates.get_rate(1) == 0.0);
    REQUIRE(rates.get_rate(30) == 0.0);
}

// ============================================================================
// Composition
// ============================================================================

TEST_CASE("Baseline inputs carry a flat rate and no overrides", "[scenario]") {
    ProjectionInputs inputs = baseline_inputs(make_scenario_config());

    REQUIRE(inputs.rates.get_rate(1) == 1.6);
    REQUIRE(inputs.rates.get_rate(20) == 1.6);
    REQUIRE_FALSE(inputs.rent_curve.has_value());
    REQUIRE_FALSE(inputs.occupancy_decline.has_value());
}

TEST_CASE("Stressed inputs layer the scenario on the baseline", "[scenario]") {
    Configuration config = make_scenario_config();
    ProjectionInputs inputs = compose_stressed_configuration(config);

    REQUIRE(inputs.rates.get_rate(4) == 1.6);
    REQUIRE_THAT(inputs.rates.get_rate(5), WithinRel(2.6, 1e-12));
    REQUIRE(inputs.rent_curve.has_value());
    REQUIRE(inputs.rent_curve->switch_year == 10);
    REQUIRE(inputs.occupancy_decline.has_value());
    REQUIRE(inputs.occupancy_decline->delta == 5.0);

    // The source configuration is untouched
    REQUIRE(config.interest_rate == 1.6);
    REQUIRE(inputs.config.interest_rate == 1.6);
}

TEST_CASE("Without a scenario the stressed inputs equal the baseline", "[scenario]") {
    Configuration config = make_scenario_config();
    config.scenario.reset();

    ProjectionInputs inputs = compose_stressed_configuration(config);
    for (int year = 1; year <= 50; ++year) {
        REQUIRE(inputs.rates.get_rate(year) == 1.6);
    }
    REQUIRE_FALSE(inputs.rent_curve.has_value());
    REQUIRE_FALSE(inputs.occupancy_decline.has_value());
}

TEST_CASE("Rate sensitivity raises every year", "[scenario][sensitivity]") {
    ProjectionInputs inputs = rate_sensitivity_inputs(make_scenario_config(), 1.0);

    REQUIRE_THAT(inputs.config.interest_rate, WithinRel(2.6, 1e-12));
    REQUIRE_THAT(inputs.rates.get_rate(1), WithinRel(2.6, 1e-12));
    REQUIRE_THAT(inputs.rates.get_rate(35), WithinRel(2.6, 1e-12));
    REQUIRE_FALSE(inputs.rent_curve.has_value());
}
