#include <catch2/catch.hpp>
#include "estimates.hpp"
#include "projection.hpp"

using namespace propcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helper functions for setting up test data
// ============================================================================

// 100M yen RC new build, 95% financed at 1.6% over 30 years
Configuration make_reference_config(int years = 50) {
    Configuration config;
    config.price = 100000000.0;
    config.building_ratio = 60.0;
    config.structure = StructureType::RC;
    config.building_age = 0;
    config.monthly_rent = 500000.0;
    config.occupancy = FlatOccupancy{95.0};
    config.loan_principal = 95000000.0;
    config.interest_rate = 1.6;
    config.loan_term_years = 30;
    config.expenses = SimpleExpensePolicy{15.0, std::nullopt};
    config.projection_years = years;
    return apply_estimated_defaults(config);
}

YearlyResult make_year(int year, double post_tax_cash_flow) {
    YearlyResult r(year);
    r.cash_flow_post_tax = post_tax_cash_flow;
    return r;
}

// ============================================================================
// YearlyResult
// ============================================================================

TEST_CASE("YearlyResult default constructor zeroes every amount", "[projection]") {
    YearlyResult r(3);
    REQUIRE(r.year == 3);
    REQUIRE(r.effective_income == 0.0);
    REQUIRE(r.cash_flow_post_tax == 0.0);
    REQUIRE_FALSE(r.dscr.has_value());
    REQUIRE_FALSE(r.principal_exceeds_depreciation);
}

// ============================================================================
// Reference property
// ============================================================================

TEST_CASE("Reference property yields one result per year", "[projection]") {
    auto results = project_property(baseline_inputs(make_reference_config()));

    REQUIRE(results.size() == 50);
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].year == static_cast<int>(i) + 1);
    }
}

TEST_CASE("Reference loan is repaid at year 30", "[projection][loan]") {
    auto results = project_property(baseline_inputs(make_reference_config()));

    REQUIRE(results[28].loan_balance > 0.0);
    REQUIRE(results[29].loan_balance == 0.0);
    for (size_t i = 30; i < results.size(); ++i) {
        REQUIRE(results[i].debt_service == 0.0);
        REQUIRE(results[i].loan_balance == 0.0);
        REQUIRE_FALSE(results[i].dscr.has_value());
    }

    double total_principal = 0.0;
    for (const auto& r : results) {
        total_principal += r.principal;
    }
    REQUIRE_THAT(total_principal, WithinRel(95000000.0, 1e-9));
}

TEST_CASE("Reference first year pre-tax cash flow is positive", "[projection]") {
    auto results = project_property(baseline_inputs(make_reference_config()));
    const YearlyResult& first = results.front();

    REQUIRE_THAT(first.gross_potential_rent, WithinRel(6000000.0, 1e-12));
    REQUIRE_THAT(first.effective_income, WithinRel(5700000.0, 1e-12));
    REQUIRE_THAT(first.operating_expense, WithinRel(900000.0, 1e-12));
    REQUIRE(first.acquisition_tax == 0.0);
    REQUIRE(first.cash_flow_pre_tax > 0.0);
}

TEST_CASE("Reference depreciation runs for the legal life", "[projection][depreciation]") {
    auto results = project_property(baseline_inputs(make_reference_config()));

    for (int year = 1; year <= 47; ++year) {
        REQUIRE(results[static_cast<size_t>(year - 1)].depreciation > 0.0);
    }
    for (int year = 48; year <= 50; ++year) {
        REQUIRE(results[static_cast<size_t>(year - 1)].depreciation == 0.0);
    }
    REQUIRE_THAT(results.back().cumulative_depreciation, WithinRel(60000000.0, 1e-9));
}

TEST_CASE("Acquisition tax is booked once in the following year", "[projection][property_tax]") {
    auto results = project_property(baseline_inputs(make_reference_config()));

    REQUIRE(results[0].acquisition_tax == 0.0);
    REQUIRE(results[1].acquisition_tax == 1320000.0);
    for (size_t i = 2; i < results.size(); ++i) {
        REQUIRE(results[i].acquisition_tax == 0.0);
    }
}

TEST_CASE("Acquisition tax can be booked in the first year", "[projection][property_tax]") {
    Configuration config = make_reference_config();
    config.property_tax.acquisition_tax_timing = AcquisitionTaxTiming::FirstYear;

    auto results = project_property(baseline_inputs(config));
    REQUIRE(results[0].acquisition_tax == 1320000.0);
    REQUIRE(results[1].acquisition_tax == 0.0);
}

// ============================================================================
// Identities
// ============================================================================

TEST_CASE("Yearly results satisfy the cash flow identities", "[projection]") {
    Configuration config = make_reference_config();
    config.repair_events.push_back(RepairEvent{12, 4000000.0, "Exterior walls"});
    auto results = project_property(baseline_inputs(config));

    for (const auto& r : results) {
        REQUIRE(r.effective_income <= r.gross_potential_rent);
        REQUIRE_THAT(r.debt_service, WithinAbs(r.interest + r.principal, 1e-6));
        REQUIRE_THAT(r.noi, WithinAbs(r.effective_income - r.operating_expense - r.property_tax, 1e-6));
        REQUIRE_THAT(r.cash_flow_pre_tax,
                     WithinAbs(r.effective_income - r.operating_expense - r.repair_cost -
                               r.debt_service - r.property_tax - r.acquisition_tax, 1e-6));
        REQUIRE_THAT(r.cash_flow_post_tax, WithinAbs(r.cash_flow_pre_tax - r.income_tax, 1e-6));
        REQUIRE_THAT(r.taxable_income,
                     WithinAbs(r.effective_income - r.operating_expense - r.repair_cost -
                               r.interest - r.depreciation - r.property_tax - r.acquisition_tax, 1e-6));
        REQUIRE(r.income_tax >= 0.0);
        REQUIRE(r.cumulative_depreciation <= config.building_price() + 1e-6);
    }
}

TEST_CASE("Repair events hit cash flow but not NOI", "[projection][repair]") {
    Configuration config = make_reference_config();
    auto plain = project_property(baseline_inputs(config));

    config.repair_events.push_back(RepairEvent{12, 4000000.0, "Exterior walls"});
    auto repaired = project_property(baseline_inputs(config));

    REQUIRE(repaired[11].repair_cost == 4000000.0);
    REQUIRE(repaired[11].noi == plain[11].noi);
    REQUIRE_THAT(repaired[11].cash_flow_pre_tax,
                 WithinAbs(plain[11].cash_flow_pre_tax - 4000000.0, 1e-6));
    REQUIRE(repaired[11].income_tax <= plain[11].income_tax);
    REQUIRE(repaired[10].cash_flow_pre_tax == plain[10].cash_flow_pre_tax);
}

TEST_CASE("DSCR is NOI less repairs over debt service", "[projection][dscr]") {
    auto results = project_property(baseline_inputs(make_reference_config()));
    const YearlyResult& first = results.front();

    REQUIRE(first.dscr.has_value());
    REQUIRE_THAT(*first.dscr, WithinRel((first.noi - first.repair_cost) / first.debt_service, 1e-12));
    REQUIRE(*first.dscr > 1.0);
}

TEST_CASE("Principal exceeds depreciation flag", "[projection]") {
    auto results = project_property(baseline_inputs(make_reference_config()));

    for (const auto& r : results) {
        REQUIRE(r.principal_exceeds_depreciation == (r.principal > r.depreciation));
    }
    // Principal grows over the loan while depreciation stays flat
    REQUIRE(results[29].principal_exceeds_depreciation);
}

// ============================================================================
// Empty state and horizon
// ============================================================================

TEST_CASE("Empty state yields all-zero results", "[projection][boundary]") {
    SECTION("No price") {
        Configuration config = make_reference_config(35);
        config.price = 0.0;
        auto results = project_property(baseline_inputs(config));

        REQUIRE(results.size() == 35);
        for (const auto& r : results) {
            REQUIRE(r.effective_income == 0.0);
            REQUIRE(r.debt_service == 0.0);
            REQUIRE(r.cash_flow_post_tax == 0.0);
        }
    }

    SECTION("No rent") {
        Configuration config = make_reference_config(20);
        config.monthly_rent = 0.0;
        auto results = project_property(baseline_inputs(config));

        REQUIRE(results.size() == 20);
        REQUIRE(results.front().cash_flow_pre_tax == 0.0);
        REQUIRE(results.back().income_tax == 0.0);
    }
}

TEST_CASE("Horizon is clamped to 1-50 years", "[projection][boundary]") {
    Configuration config = make_reference_config();
    config.projection_years = 80;
    REQUIRE(project_property(baseline_inputs(config)).size() == 50);

    config.projection_years = 0;
    REQUIRE(project_property(baseline_inputs(config)).size() == 1);
}

TEST_CASE("Cash purchase has no debt service", "[projection][loan]") {
    Configuration config = make_reference_config(10);
    config.loan_principal = 0.0;
    auto results = project_property(baseline_inputs(config));

    for (const auto& r : results) {
        REQUIRE(r.interest == 0.0);
        REQUIRE(r.debt_service == 0.0);
        REQUIRE_FALSE(r.dscr.has_value());
    }
}

// ============================================================================
// Stress scenario
// ============================================================================

TEST_CASE("Stressed cash flow never beats the baseline once active", "[projection][scenario]") {
    Configuration config = make_reference_config(35);
    StressScenario scenario;
    scenario.interest_shock = InterestShock{5, 1.0};
    scenario.rent_curve = RentCurveOverride{1.5, 0.5, 10};
    scenario.occupancy_decline = OccupancyDecline{10, 5.0};
    config.scenario = scenario;

    auto baseline = project_property(baseline_inputs(config));
    auto stressed = project_property(compose_stressed_configuration(config));

    REQUIRE(stressed.size() == baseline.size());
    for (size_t i = 4; i < baseline.size(); ++i) {
        REQUIRE(stressed[i].cash_flow_post_tax <= baseline[i].cash_flow_post_tax);
    }
    REQUIRE(stressed[4].interest > baseline[4].interest);
    REQUIRE(stressed[9].occupancy_rate < baseline[9].occupancy_rate);
    // Payoff date does not move under the shock
    REQUIRE(stressed[29].loan_balance == 0.0);
}

TEST_CASE("Interest shock before its year changes nothing", "[projection][scenario]") {
    Configuration config = make_reference_config(10);
    StressScenario scenario;
    scenario.interest_shock = InterestShock{5, 1.0};
    config.scenario = scenario;

    auto baseline = project_property(baseline_inputs(config));
    auto stressed = project_property(compose_stressed_configuration(config));

    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(stressed[i].cash_flow_post_tax == baseline[i].cash_flow_post_tax);
    }
}

TEST_CASE("Negative interest shock cannot lift the stressed series", "[projection][scenario][boundary]") {
    Configuration config = make_reference_config(35);
    StressScenario scenario;
    scenario.interest_shock = InterestShock{5, -1.0};
    config.scenario = scenario;

    auto baseline = project_property(baseline_inputs(config));
    auto stressed = project_property(compose_stressed_configuration(config));

    for (size_t i = 0; i < baseline.size(); ++i) {
        REQUIRE(stressed[i].interest == baseline[i].interest);
        REQUIRE(stressed[i].cash_flow_post_tax <= baseline[i].cash_flow_post_tax);
    }
}

TEST_CASE("Loan terms and yearly rates agree for out of range rates", "[projection][loan][boundary]") {
    Configuration config = make_reference_config(10);
    Configuration capped = config;
    config.interest_rate = 150.0;
    capped.interest_rate = 100.0;

    auto results = project_property(baseline_inputs(config));
    auto expected = project_property(baseline_inputs(capped));
    REQUIRE(results.front().interest == expected.front().interest);
    REQUIRE(results.front().debt_service == expected.front().debt_service);

    // A rate path edited after construction is capped the same way
    ProjectionInputs inputs = baseline_inputs(capped);
    inputs.rates.set_rate(1, 150.0);
    auto edited = project_property(inputs);
    REQUIRE(edited.front().interest == expected.front().interest);
}

TEST_CASE("Huge loan term keeps the loan", "[projection][loan][boundary]") {
    Configuration config = make_reference_config(10);
    config.loan_term_years = 200000000;

    auto results = project_property(baseline_inputs(config));
    REQUIRE(results.front().interest > 0.0);
    REQUIRE(results.front().principal > 0.0);
    REQUIRE(results.front().loan_balance > 0.0);
    REQUIRE(results.front().loan_balance < 95000000.0);
}

// ============================================================================
// Dead cross
// ============================================================================

TEST_CASE("Dead cross is the first positive to non-positive turn", "[projection][dead_cross]") {
    std::vector<YearlyResult> results = {
        make_year(1, 100.0), make_year(2, 50.0), make_year(3, -10.0),
        make_year(4, 20.0), make_year(5, -5.0),
    };
    REQUIRE(find_dead_cross_year(results) == 3);
}

TEST_CASE("Dead cross needs a positive year first", "[projection][dead_cross]") {
    std::vector<YearlyResult> never_positive = {
        make_year(1, -100.0), make_year(2, -50.0), make_year(3, 0.0),
    };
    REQUIRE_FALSE(find_dead_cross_year(never_positive).has_value());

    std::vector<YearlyResult> late = {
        make_year(1, -100.0), make_year(2, 30.0), make_year(3, 0.0),
    };
    REQUIRE(find_dead_cross_year(late) == 3);

    std::vector<YearlyResult> always_positive = {
        make_year(1, 10.0), make_year(2, 30.0),
    };
    REQUIRE_FALSE(find_dead_cross_year(always_positive).has_value());
}
