#include <catch2/catch.hpp>
#include <algorithm>
#include "operating_expense.hpp"

using namespace propcalc;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helpers
// ============================================================================

RateExpenseItem make_rate_item(const std::string& id, double rate, ExpenseBase base = ExpenseBase::GPR) {
    RateExpenseItem item;
    item.id = id;
    item.label = id;
    item.rate = rate;
    item.base = base;
    return item;
}

FixedExpenseItem make_fixed_item(const std::string& id, double annual_amount) {
    FixedExpenseItem item;
    item.id = id;
    item.label = id;
    item.annual_amount = annual_amount;
    return item;
}

EventExpenseItem make_event_item(double amount, int interval, int start_year, EventMode mode) {
    EventExpenseItem item;
    item.id = "event";
    item.label = "event";
    item.amount = amount;
    item.interval_years = interval;
    item.start_year = start_year;
    item.mode = mode;
    return item;
}

DetailedExpensePolicy make_empty_detailed() {
    DetailedExpensePolicy policy;
    policy.leasing.enabled = false;
    return policy;
}

// ============================================================================
// OER templates
// ============================================================================

TEST_CASE("OER template rates at breakpoints", "[operating_expense][oer]") {
    REQUIRE(oer_template_rate(OerPropertyType::RcApartment, OerAgeBand::New) == 15.0);
    REQUIRE(oer_template_rate(OerPropertyType::RcApartment, OerAgeBand::Mid) == 21.0);
    REQUIRE(oer_template_rate(OerPropertyType::RcApartment, OerAgeBand::Old) == 29.0);
    REQUIRE(oer_template_rate(OerPropertyType::WoodApartment, OerAgeBand::New) == 11.0);
    REQUIRE(oer_template_rate(OerPropertyType::Unit, OerAgeBand::Old) == 22.0);
}

TEST_CASE("OER rate interpolates between breakpoints", "[operating_expense][oer]") {
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 0.0), WithinRel(15.0, 1e-12));
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 5.0), WithinRel(18.0, 1e-12));
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 10.0), WithinRel(21.0, 1e-12));
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 15.0), WithinRel(25.0, 1e-12));
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 20.0), WithinRel(29.0, 1e-12));
    REQUIRE_THAT(oer_rate_for_age(OerPropertyType::RcApartment, 40.0), WithinRel(29.0, 1e-12));
}

TEST_CASE("OER age bands", "[operating_expense][oer]") {
    REQUIRE(oer_age_band(0) == OerAgeBand::New);
    REQUIRE(oer_age_band(10) == OerAgeBand::New);
    REQUIRE(oer_age_band(11) == OerAgeBand::Mid);
    REQUIRE(oer_age_band(20) == OerAgeBand::Mid);
    REQUIRE(oer_age_band(21) == OerAgeBand::Old);
}

TEST_CASE("Template inferred from structure and unit count", "[operating_expense][oer]") {
    REQUIRE(infer_oer_property_type(StructureType::RC, 1) == OerPropertyType::Unit);
    REQUIRE(infer_oer_property_type(StructureType::Wood, 8) == OerPropertyType::WoodApartment);
    REQUIRE(infer_oer_property_type(StructureType::HeavySteel, 8) == OerPropertyType::SteelApartment);
    REQUIRE(infer_oer_property_type(StructureType::LightSteel, 8) == OerPropertyType::SteelApartment);
    REQUIRE(infer_oer_property_type(StructureType::SRC, 20) == OerPropertyType::RcApartment);
    REQUIRE(infer_oer_property_type(StructureType::RC, 0) == OerPropertyType::RcApartment);
}

// ============================================================================
// Cleaning
// ============================================================================

TEST_CASE("Cleaning fee by unit bucket and visit tier", "[operating_expense][cleaning]") {
    REQUIRE(cleaning_monthly_fee(9, 1.0) == 8000.0);
    REQUIRE(cleaning_monthly_fee(12, 2.0) == 14000.0);
    REQUIRE(cleaning_monthly_fee(10, 4.0) == 25000.0);
    REQUIRE(cleaning_monthly_fee(13, 1.0) == 10000.0);
    REQUIRE(cleaning_monthly_fee(16, 2.0) == 18000.0);
    // Visits round up to the next tier
    REQUIRE(cleaning_monthly_fee(13, 3.0) == 32000.0);
    REQUIRE(cleaning_monthly_fee(10, 1.5) == 14000.0);
}

TEST_CASE("Cleaning fee outside supported range is zero", "[operating_expense][cleaning][boundary]") {
    REQUIRE(cleaning_monthly_fee(8, 2.0) == 0.0);
    REQUIRE(cleaning_monthly_fee(17, 2.0) == 0.0);
    REQUIRE(cleaning_monthly_fee(10, 0.0) == 0.0);
}

TEST_CASE("Cleaning item is added, updated and removed", "[operating_expense][cleaning]") {
    DetailedExpensePolicy policy = make_empty_detailed();
    policy.fixed_items.push_back(make_fixed_item("elevator", 600000.0));

    auto find_cleaning = [&policy]() {
        return std::find_if(policy.fixed_items.begin(), policy.fixed_items.end(),
                            [](const FixedExpenseItem& item) { return item.id == CLEANING_ITEM_ID; });
    };

    SECTION("Added for a supported building") {
        sync_cleaning_item(policy, 10, 2.0);
        REQUIRE(policy.fixed_items.size() == 2);
        REQUIRE(find_cleaning()->annual_amount == 14000.0 * 12.0);
    }

    SECTION("Updated when visits change") {
        sync_cleaning_item(policy, 10, 2.0);
        sync_cleaning_item(policy, 10, 4.0);
        REQUIRE(policy.fixed_items.size() == 2);
        REQUIRE(find_cleaning()->annual_amount == 25000.0 * 12.0);
    }

    SECTION("Removed when the building leaves the range") {
        sync_cleaning_item(policy, 10, 2.0);
        sync_cleaning_item(policy, 20, 2.0);
        REQUIRE(policy.fixed_items.size() == 1);
        REQUIRE(find_cleaning() == policy.fixed_items.end());
        REQUIRE(policy.fixed_items[0].id == "elevator");
    }
}

// ============================================================================
// Detailed expenses
// ============================================================================

TEST_CASE("Leasing rate from marketing months and tenancy", "[operating_expense][leasing]") {
    LeasingCost leasing;
    leasing.enabled = true;
    leasing.marketing_months = 2.0;
    leasing.average_tenancy_years = 2.0;
    REQUIRE_THAT(leasing_rate(leasing), WithinRel(2.0 / 24.0 * 100.0, 1e-12));

    leasing.enabled = false;
    REQUIRE(leasing_rate(leasing) == 0.0);

    leasing.enabled = true;
    leasing.average_tenancy_years = 0.0;
    REQUIRE(leasing_rate(leasing) == 0.0);
}

TEST_CASE("Rate items use their own base", "[operating_expense][detailed]") {
    DetailedExpensePolicy policy = make_empty_detailed();
    policy.rate_items.push_back(make_rate_item("management", 5.0, ExpenseBase::EGI));
    policy.rate_items.push_back(make_rate_item("maintenance", 10.0, ExpenseBase::GPR));

    ExpenseBreakdown breakdown = compute_detailed_expense(policy, 1, 6000000.0, 5000000.0);
    REQUIRE_THAT(breakdown.rate_items, WithinRel(250000.0 + 600000.0, 1e-12));
    REQUIRE_THAT(breakdown.total, WithinRel(850000.0, 1e-12));
}

TEST_CASE("Disabled items are skipped", "[operating_expense][detailed]") {
    DetailedExpensePolicy policy = make_empty_detailed();
    RateExpenseItem off = make_rate_item("off", 50.0);
    off.enabled = false;
    policy.rate_items.push_back(off);
    FixedExpenseItem fixed_off = make_fixed_item("fixed_off", 1000000.0);
    fixed_off.enabled = false;
    policy.fixed_items.push_back(fixed_off);

    ExpenseBreakdown breakdown = compute_detailed_expense(policy, 1, 6000000.0, 5700000.0);
    REQUIRE(breakdown.total == 0.0);
}

TEST_CASE("Event items in reserve and cash mode", "[operating_expense][detailed]") {
    SECTION("Reserve books amount / interval every year") {
        DetailedExpensePolicy policy = make_empty_detailed();
        policy.event_items.push_back(make_event_item(1200000.0, 12, 3, EventMode::Reserve));

        for (int year = 1; year <= 15; ++year) {
            REQUIRE_THAT(compute_detailed_expense(policy, year, 6000000.0, 5700000.0).event_items,
                         WithinRel(100000.0, 1e-12));
        }
    }

    SECTION("Cash books the full amount in occurrence years") {
        DetailedExpensePolicy policy = make_empty_detailed();
        policy.event_items.push_back(make_event_item(1200000.0, 12, 3, EventMode::Cash));

        REQUIRE(compute_detailed_expense(policy, 1, 6000000.0, 5700000.0).event_items == 0.0);
        REQUIRE(compute_detailed_expense(policy, 3, 6000000.0, 5700000.0).event_items == 1200000.0);
        REQUIRE(compute_detailed_expense(policy, 4, 6000000.0, 5700000.0).event_items == 0.0);
        REQUIRE(compute_detailed_expense(policy, 15, 6000000.0, 5700000.0).event_items == 1200000.0);
    }
}

TEST_CASE("Detailed total sums every part", "[operating_expense][detailed]") {
    DetailedExpensePolicy policy;
    policy.rate_items.push_back(make_rate_item("management", 5.0));
    policy.fixed_items.push_back(make_fixed_item("internet", 240000.0));
    policy.event_items.push_back(make_event_item(500000.0, 5, 1, EventMode::Reserve));
    policy.leasing.enabled = true;
    policy.leasing.marketing_months = 2.0;
    policy.leasing.average_tenancy_years = 2.0;

    ExpenseBreakdown breakdown = compute_detailed_expense(policy, 1, 6000000.0, 5700000.0);
    REQUIRE_THAT(breakdown.rate_items, WithinRel(300000.0, 1e-12));
    REQUIRE(breakdown.fixed_items == 240000.0);
    REQUIRE_THAT(breakdown.event_items, WithinRel(100000.0, 1e-12));
    REQUIRE_THAT(breakdown.leasing, WithinRel(500000.0, 1e-12));
    REQUIRE_THAT(breakdown.total, WithinRel(1140000.0, 1e-12));
}

// ============================================================================
// Simple expenses
// ============================================================================

TEST_CASE("Simple policy applies its rate to GPR", "[operating_expense][simple]") {
    ExpensePolicy policy = SimpleExpensePolicy{15.0, std::nullopt};

    REQUIRE_THAT(compute_operating_expense(policy, 1, 0, 6000000.0, 5700000.0),
                 WithinRel(900000.0, 1e-12));
    // Fixed rate does not change with age
    REQUIRE_THAT(compute_operating_expense(policy, 20, 19, 6000000.0, 5700000.0),
                 WithinRel(900000.0, 1e-12));
}

TEST_CASE("Tracked template follows the age curve", "[operating_expense][simple]") {
    SimpleExpensePolicy simple{15.0, OerPropertyType::RcApartment};

    REQUIRE_THAT(simple_expense_rate(simple, 0), WithinRel(15.0, 1e-12));
    REQUIRE_THAT(simple_expense_rate(simple, 10), WithinRel(21.0, 1e-12));
    REQUIRE_THAT(compute_operating_expense(ExpensePolicy(simple), 11, 10, 6000000.0, 5700000.0),
                 WithinRel(6000000.0 * 0.21, 1e-12));
}

// ============================================================================
// Repairs and presets
// ============================================================================

TEST_CASE("Repair events are summed per year", "[operating_expense][repair]") {
    std::vector<RepairEvent> events = {
        {10, 3000000.0, "Exterior walls"},
        {10, 500000.0, "Water heater"},
        {15, 2000000.0, "Roof"},
    };

    REQUIRE(repair_cost_for_year(events, 9) == 0.0);
    REQUIRE(repair_cost_for_year(events, 10) == 3500000.0);
    REQUIRE(repair_cost_for_year(events, 15) == 2000000.0);
}

TEST_CASE("Detailed preset matches the simple suggestion", "[operating_expense][preset]") {
    for (int age : {0, 7, 15, 30}) {
        DetailedExpensePolicy preset = build_detailed_preset(OerPropertyType::RcApartment, age);
        const double simple = 6000000.0 * oer_rate_for_age(OerPropertyType::RcApartment, age) / 100.0;
        const double detailed = compute_detailed_expense(preset, 1, 6000000.0, 5700000.0).total;

        REQUIRE_THAT(detailed, WithinRel(simple, 1e-9));
    }
}

TEST_CASE("Detailed preset ships leasing disabled", "[operating_expense][preset]") {
    DetailedExpensePolicy preset = build_detailed_preset(OerPropertyType::WoodApartment, 5);

    REQUIRE(preset.rate_items.size() == 5);
    REQUIRE_FALSE(preset.leasing.enabled);
    REQUIRE(preset.leasing.marketing_months == 2.0);
    REQUIRE(preset.fixed_items.empty());
}
