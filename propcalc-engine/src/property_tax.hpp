#ifndef PROPCALC_PROPERTY_TAX_HPP
#define PROPCALC_PROPERTY_TAX_HPP

#include "config.hpp"

namespace propcalc {

// Assessed building value falls by this percentage of the initial
// evaluation for each year of age, down to zero.
constexpr double BUILDING_EVALUATION_DECAY_RATE = 1.5;

// Annual property tax assessment for one year
struct PropertyTaxAssessment {
    double land_evaluation;         // Land price x land evaluation %
    double land_taxable;            // After residential land reduction
    double building_evaluation;     // Building price x evaluation % x aging factor
    double building_taxable;        // After new-build relief, if in force
    bool relief_applied;
    double tax;                     // Rounded to whole yen

    PropertyTaxAssessment();
};

// Aging write-down: max(0, 1 - decay% x age)
double building_evaluation_factor(int building_age);

// True while new-build relief applies to a building of the given age.
// Relief runs while age < new_build_relief_years, so a new build gets it
// for its first new_build_relief_years years.
bool new_build_relief_active(const PropertyTaxParams& params, int building_age);

// Assess the annual property tax for a building of the given age
// (age at acquisition + year - 1).
//
//   taxable = land eval x land reduction% + building eval [x relief rate%]
//   tax     = round(taxable x tax_rate%)
PropertyTaxAssessment assess_property_tax(
    const PropertyTaxParams& params,
    double land_price,
    double building_price,
    int building_age
);

// One-time acquisition tax on the purchase evaluations:
//   round((land eval x acquisition land reduction% + building eval) x rate%)
// The building is evaluated without the aging write-down.
double acquisition_tax(
    const PropertyTaxParams& params,
    double land_price,
    double building_price
);

// Simulated year in which the acquisition tax is booked
int acquisition_tax_year(const PropertyTaxParams& params);

} // namespace propcalc

#endif // PROPCALC_PROPERTY_TAX_HPP
