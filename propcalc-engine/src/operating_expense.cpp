#include "operating_expense.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace propcalc {

// ============================================================================
// OER templates
// ============================================================================

namespace {

// Rates excluding consumption tax, indexed [property type][age band]
constexpr std::array<std::array<double, 3>, 4> OER_TEMPLATES = {{
    {{16.0, 18.0, 22.0}},   // UNIT
    {{11.0, 16.0, 24.0}},   // WOOD_APARTMENT
    {{14.0, 20.0, 26.0}},   // STEEL_APARTMENT
    {{15.0, 21.0, 29.0}},   // RC_APARTMENT
}};

constexpr double MID_BREAKPOINT_AGE = 10.0;
constexpr double OLD_BREAKPOINT_AGE = 20.0;

} // anonymous namespace

double oer_template_rate(OerPropertyType type, OerAgeBand band) {
    return OER_TEMPLATES[static_cast<size_t>(type)][static_cast<size_t>(band)];
}

OerAgeBand oer_age_band(int building_age) {
    const int age = std::max(0, building_age);
    if (age <= 10) return OerAgeBand::New;
    if (age <= 20) return OerAgeBand::Mid;
    return OerAgeBand::Old;
}

double oer_rate_for_age(OerPropertyType type, double building_age) {
    const double age = std::isfinite(building_age) ? std::max(0.0, building_age) : 0.0;
    const double new_rate = oer_template_rate(type, OerAgeBand::New);
    const double mid_rate = oer_template_rate(type, OerAgeBand::Mid);
    const double old_rate = oer_template_rate(type, OerAgeBand::Old);

    if (age <= MID_BREAKPOINT_AGE) {
        const double t = age / MID_BREAKPOINT_AGE;
        return new_rate + (mid_rate - new_rate) * t;
    }
    if (age <= OLD_BREAKPOINT_AGE) {
        const double t = (age - MID_BREAKPOINT_AGE) / (OLD_BREAKPOINT_AGE - MID_BREAKPOINT_AGE);
        return mid_rate + (old_rate - mid_rate) * t;
    }
    return old_rate;
}

OerPropertyType infer_oer_property_type(StructureType structure, int unit_count) {
    if (unit_count == 1) {
        return OerPropertyType::Unit;
    }
    switch (structure) {
        case StructureType::Wood:
            return OerPropertyType::WoodApartment;
        case StructureType::HeavySteel:
        case StructureType::LightSteel:
            return OerPropertyType::SteelApartment;
        case StructureType::RC:
        case StructureType::SRC:
            return OerPropertyType::RcApartment;
    }
    return OerPropertyType::RcApartment;
}

// ============================================================================
// Cleaning contract lookup
// ============================================================================

const char* const CLEANING_ITEM_ID = "cleaning";

namespace {

// Monthly fee by [unit bucket][visit tier]; buckets 9-12 and 13-16 units,
// tiers 1, 2 and 4 visits per month
constexpr std::array<std::array<double, 3>, 2> CLEANING_FEES = {{
    {{8000.0, 14000.0, 25000.0}},
    {{10000.0, 18000.0, 32000.0}},
}};

} // anonymous namespace

double cleaning_monthly_fee(int unit_count, double visits_per_month) {
    if (unit_count < CLEANING_MIN_UNITS || unit_count > CLEANING_MAX_UNITS) {
        return 0.0;
    }
    if (!std::isfinite(visits_per_month) || visits_per_month <= 0.0) {
        return 0.0;
    }

    const size_t bucket = unit_count <= 12 ? 0 : 1;
    size_t tier = 2;
    if (visits_per_month <= 1.0) {
        tier = 0;
    } else if (visits_per_month <= 2.0) {
        tier = 1;
    }
    return CLEANING_FEES[bucket][tier];
}

void sync_cleaning_item(DetailedExpensePolicy& policy, int unit_count, double visits_per_month) {
    auto& items = policy.fixed_items;
    auto it = std::find_if(items.begin(), items.end(),
                           [](const FixedExpenseItem& item) { return item.id == CLEANING_ITEM_ID; });

    const double monthly_fee = cleaning_monthly_fee(unit_count, visits_per_month);
    if (monthly_fee <= 0.0) {
        if (it != items.end()) {
            items.erase(it);
        }
        return;
    }

    if (it == items.end()) {
        FixedExpenseItem item;
        item.id = CLEANING_ITEM_ID;
        item.label = "Common area cleaning";
        item.enabled = true;
        items.push_back(item);
        it = items.end() - 1;
    }
    it->annual_amount = monthly_fee * 12.0;
}

// ============================================================================
// Expense calculation
// ============================================================================

ExpenseBreakdown::ExpenseBreakdown()
    : rate_items(0.0), fixed_items(0.0), event_items(0.0), leasing(0.0), total(0.0) {}

double leasing_rate(const LeasingCost& leasing) {
    if (!leasing.enabled || leasing.marketing_months <= 0.0 || leasing.average_tenancy_years <= 0.0) {
        return 0.0;
    }
    return leasing.marketing_months / (leasing.average_tenancy_years * 12.0) * 100.0;
}

ExpenseBreakdown compute_detailed_expense(
    const DetailedExpensePolicy& policy,
    int year,
    double gross_potential_rent,
    double effective_income)
{
    ExpenseBreakdown breakdown;

    for (const auto& item : policy.rate_items) {
        if (!item.enabled) continue;
        const double base = item.base == ExpenseBase::EGI ? effective_income : gross_potential_rent;
        breakdown.rate_items += base * (std::max(0.0, item.rate) / 100.0);
    }

    for (const auto& item : policy.fixed_items) {
        if (!item.enabled) continue;
        breakdown.fixed_items += std::max(0.0, item.annual_amount);
    }

    for (const auto& item : policy.event_items) {
        if (!item.enabled) continue;
        const double amount = std::max(0.0, item.amount);
        const int interval = std::max(1, item.interval_years);
        const int start_year = std::max(1, item.start_year);

        if (item.mode == EventMode::Cash) {
            if (year >= start_year && (year - start_year) % interval == 0) {
                breakdown.event_items += amount;
            }
        } else {
            breakdown.event_items += amount / static_cast<double>(interval);
        }
    }

    breakdown.leasing = gross_potential_rent * (leasing_rate(policy.leasing) / 100.0);

    breakdown.total = breakdown.rate_items + breakdown.fixed_items +
                      breakdown.event_items + breakdown.leasing;
    return breakdown;
}

double simple_expense_rate(const SimpleExpensePolicy& policy, int building_age) {
    if (policy.tracked_template) {
        return oer_rate_for_age(*policy.tracked_template, static_cast<double>(building_age));
    }
    return policy.rate;
}

namespace {

struct ExpenseCalculator {
    int year;
    int building_age;
    double gross_potential_rent;
    double effective_income;

    double operator()(const SimpleExpensePolicy& simple) const {
        return gross_potential_rent * (simple_expense_rate(simple, building_age) / 100.0);
    }

    double operator()(const DetailedExpensePolicy& detailed) const {
        return compute_detailed_expense(detailed, year, gross_potential_rent, effective_income).total;
    }
};

} // anonymous namespace

double compute_operating_expense(
    const ExpensePolicy& policy,
    int year,
    int building_age_at_year,
    double gross_potential_rent,
    double effective_income)
{
    return std::visit(
        ExpenseCalculator{year, building_age_at_year, gross_potential_rent, effective_income},
        policy);
}

double repair_cost_for_year(const std::vector<RepairEvent>& events, int year) {
    double total = 0.0;
    for (const auto& event : events) {
        if (event.year == year && std::isfinite(event.amount)) {
            total += std::max(0.0, event.amount);
        }
    }
    return total;
}

// ============================================================================
// Detailed preset
// ============================================================================

DetailedExpensePolicy build_detailed_preset(OerPropertyType type, int building_age) {
    struct PresetShare {
        const char* id;
        const char* label;
        double share;
    };
    // Shares of the template rate, summing to 1
    static const PresetShare SHARES[] = {
        {"management", "Property management fee", 0.30},
        {"maintenance", "Building maintenance", 0.25},
        {"repairs", "Routine repairs and restoration", 0.25},
        {"utilities", "Common area utilities", 0.10},
        {"insurance", "Insurance and sundries", 0.10},
    };

    const double total_rate = oer_rate_for_age(type, static_cast<double>(building_age));

    DetailedExpensePolicy policy;
    for (const auto& share : SHARES) {
        RateExpenseItem item;
        item.id = share.id;
        item.label = share.label;
        item.rate = total_rate * share.share;
        item.base = ExpenseBase::GPR;
        item.enabled = true;
        policy.rate_items.push_back(item);
    }

    // Turnover costs are part of the template rate; the line is available but off
    policy.leasing.enabled = false;
    policy.leasing.marketing_months = 2.0;
    policy.leasing.average_tenancy_years = 2.0;

    return policy;
}

} // namespace propcalc
