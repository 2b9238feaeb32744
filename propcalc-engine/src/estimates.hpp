#ifndef PROPCALC_ESTIMATES_HPP
#define PROPCALC_ESTIMATES_HPP

#include "config.hpp"
#include <string>
#include <vector>

namespace propcalc {

// A numeric field counts as missing when it is non-finite or <= 0
bool is_missing(double value);

// ============================================================================
// Structure/age heuristics
// ============================================================================

// Building share of price (%), by structure and age row:
// <=5, <=15, <=25, <=35, older
double suggested_building_ratio(StructureType structure, int building_age);

double suggested_interest_rate(StructureType structure);

// Remaining legal life plus a structure bonus, clamped to 10..35 years.
// Wood up to 10 years old gets at least 35.
int suggested_loan_term(StructureType structure, int building_age);

double suggested_occupancy_rate(int building_age);

// 5 years for RC/SRC, 3 for everything else
int suggested_new_build_relief_years(StructureType structure);

// Template OER for the inferred property type at the given age
double suggested_operating_expense_rate(StructureType structure, int unit_count, int building_age);

// ============================================================================
// Defaulting
// ============================================================================

struct DefaultsReport {
    Configuration config;
    std::vector<std::string> filled_fields;   // Dotted config-file names, in fill order
};

// Fill every missing field with its estimate. Applying it to its own
// output changes nothing.
Configuration apply_estimated_defaults(const Configuration& config);

// Same as apply_estimated_defaults and also lists the fields it filled
DefaultsReport apply_estimated_defaults_with_report(const Configuration& config);

} // namespace propcalc

#endif // PROPCALC_ESTIMATES_HPP
