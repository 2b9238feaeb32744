#include <catch2/catch.hpp>
#include "property_tax.hpp"

using namespace propcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helpers
// ============================================================================

PropertyTaxParams make_tax_params(bool relief = false) {
    PropertyTaxParams params;
    params.land_evaluation_rate = 70.0;
    params.building_evaluation_rate = 50.0;
    params.land_reduction_rate = 16.67;
    params.tax_rate = 1.7;
    params.new_build_relief_enabled = relief;
    params.new_build_relief_years = 5;
    params.new_build_relief_rate = 50.0;
    params.acquisition_tax_rate = 3.0;
    params.acquisition_land_reduction_rate = 50.0;
    return params;
}

constexpr double LAND_PRICE = 40000000.0;
constexpr double BUILDING_PRICE = 60000000.0;

// ============================================================================
// Annual property tax
// ============================================================================

TEST_CASE("Property tax for a new building without relief", "[property_tax]") {
    PropertyTaxAssessment a = assess_property_tax(make_tax_params(), LAND_PRICE, BUILDING_PRICE, 0);

    REQUIRE_THAT(a.land_evaluation, WithinRel(28000000.0, 1e-12));
    REQUIRE_THAT(a.land_taxable, WithinRel(4667600.0, 1e-9));
    REQUIRE_THAT(a.building_evaluation, WithinRel(30000000.0, 1e-12));
    REQUIRE_FALSE(a.relief_applied);
    REQUIRE(a.tax == 589349.0);
}

TEST_CASE("New-build relief strictly lowers the tax", "[property_tax][relief]") {
    PropertyTaxAssessment without = assess_property_tax(make_tax_params(false), LAND_PRICE, BUILDING_PRICE, 0);
    PropertyTaxAssessment with = assess_property_tax(make_tax_params(true), LAND_PRICE, BUILDING_PRICE, 0);

    REQUIRE(with.relief_applied);
    REQUIRE(with.tax < without.tax);
    REQUIRE_THAT(with.building_taxable, WithinRel(15000000.0, 1e-12));
    REQUIRE(with.tax == 334349.0);
}

TEST_CASE("Relief ends after its years", "[property_tax][relief]") {
    PropertyTaxParams params = make_tax_params(true);

    REQUIRE(new_build_relief_active(params, 0));
    REQUIRE(new_build_relief_active(params, 4));
    REQUIRE_FALSE(new_build_relief_active(params, 5));
    REQUIRE_FALSE(new_build_relief_active(params, 20));

    params.new_build_relief_enabled = false;
    REQUIRE_FALSE(new_build_relief_active(params, 0));
}

TEST_CASE("Building evaluation declines with age", "[property_tax]") {
    REQUIRE(building_evaluation_factor(0) == 1.0);
    REQUIRE_THAT(building_evaluation_factor(10), WithinRel(0.85, 1e-12));
    REQUIRE(building_evaluation_factor(70) == 0.0);

    PropertyTaxAssessment young = assess_property_tax(make_tax_params(), LAND_PRICE, BUILDING_PRICE, 5);
    PropertyTaxAssessment old = assess_property_tax(make_tax_params(), LAND_PRICE, BUILDING_PRICE, 10);
    REQUIRE_THAT(old.building_evaluation, WithinRel(25500000.0, 1e-12));
    REQUIRE(old.tax < young.tax);
}

TEST_CASE("Land tax remains once the building is fully written down", "[property_tax][boundary]") {
    PropertyTaxAssessment a = assess_property_tax(make_tax_params(), LAND_PRICE, BUILDING_PRICE, 80);

    REQUIRE(a.building_evaluation == 0.0);
    REQUIRE(a.tax == 79349.0);
}

TEST_CASE("Property tax is zero without a price", "[property_tax][boundary]") {
    PropertyTaxAssessment a = assess_property_tax(make_tax_params(), 0.0, 0.0, 0);
    REQUIRE(a.tax == 0.0);
}

// ============================================================================
// Acquisition tax
// ============================================================================

TEST_CASE("Acquisition tax on purchase evaluations", "[property_tax][acquisition]") {
    REQUIRE(acquisition_tax(make_tax_params(), LAND_PRICE, BUILDING_PRICE) == 1320000.0);
}

TEST_CASE("Acquisition tax ignores building age", "[property_tax][acquisition]") {
    PropertyTaxParams params = make_tax_params();
    params.acquisition_tax_rate = 4.0;
    REQUIRE(acquisition_tax(params, LAND_PRICE, BUILDING_PRICE) == 1760000.0);
}

TEST_CASE("Acquisition tax booking year", "[property_tax][acquisition]") {
    PropertyTaxParams params = make_tax_params();

    REQUIRE(acquisition_tax_year(params) == 2);
    params.acquisition_tax_timing = AcquisitionTaxTiming::FirstYear;
    REQUIRE(acquisition_tax_year(params) == 1);
}
