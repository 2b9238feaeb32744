#ifndef PROPCALC_OPERATING_EXPENSE_HPP
#define PROPCALC_OPERATING_EXPENSE_HPP

#include "config.hpp"
#include <vector>

namespace propcalc {

// Template OER (% of GPR) for a property type at the NEW/MID/OLD breakpoints
double oer_template_rate(OerPropertyType type, OerAgeBand band);

OerAgeBand oer_age_band(int building_age);

// Template rate interpolated linearly between the NEW (age 0), MID (age 10)
// and OLD (age 20) breakpoints; flat after 20 years.
double oer_rate_for_age(OerPropertyType type, double building_age);

// Template family for a structure: single units use UNIT, otherwise by frame
OerPropertyType infer_oer_property_type(StructureType structure, int unit_count);

// ============================================================================
// Cleaning contract lookup
// ============================================================================

// Id of the fixed item kept in sync with unit count and visit frequency
extern const char* const CLEANING_ITEM_ID;

constexpr int CLEANING_MIN_UNITS = 9;
constexpr int CLEANING_MAX_UNITS = 16;

// Monthly cleaning fee for a 9-16 unit building. Visits are rounded up to
// the nearest contract tier (1, 2 or 4 per month). Returns 0 outside the
// supported unit range.
double cleaning_monthly_fee(int unit_count, double visits_per_month);

// Add, update or remove the auto-maintained cleaning line
void sync_cleaning_item(DetailedExpensePolicy& policy, int unit_count, double visits_per_month);

// ============================================================================
// Expense calculation
// ============================================================================

struct ExpenseBreakdown {
    double rate_items;
    double fixed_items;
    double event_items;
    double leasing;
    double total;

    ExpenseBreakdown();
};

// Leasing/turnover cost as % of GPR:
// marketing_months / (average_tenancy_years x 12) x 100
double leasing_rate(const LeasingCost& leasing);

ExpenseBreakdown compute_detailed_expense(
    const DetailedExpensePolicy& policy,
    int year,
    double gross_potential_rent,
    double effective_income
);

// Rate in force for a simple policy at a building age
double simple_expense_rate(const SimpleExpensePolicy& policy, int building_age);

// Operating expense for one simulated year under either policy
double compute_operating_expense(
    const ExpensePolicy& policy,
    int year,
    int building_age_at_year,
    double gross_potential_rent,
    double effective_income
);

// One-off repair costs booked in a year
double repair_cost_for_year(const std::vector<RepairEvent>& events, int year);

// Detailed policy whose GPR-based rate items add up to the template rate for
// the property type and age, so it starts level with the simple suggestion.
DetailedExpensePolicy build_detailed_preset(OerPropertyType type, int building_age);

} // namespace propcalc

#endif // PROPCALC_OPERATING_EXPENSE_HPP
