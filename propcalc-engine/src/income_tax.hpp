#ifndef PROPCALC_INCOME_TAX_HPP
#define PROPCALC_INCOME_TAX_HPP

#include "config.hpp"
#include <vector>

namespace propcalc {

// National income tax bracket: tax = income x rate - deduction
struct TaxBracket {
    double up_to;       // Upper bound of taxable income, inclusive
    double rate;        // Fraction, not percent
    double deduction;
};

const std::vector<TaxBracket>& income_tax_brackets();

// Progressive tax on a taxable income, including the flat resident tax:
//   max(0, round(x * rate - deduction + x * resident_tax_rate%))
// Zero for non-positive or non-finite income.
double progressive_tax(double taxable_income, double resident_tax_rate);

// Rental income used for loss offsetting under the individual regime.
// Interest on the land portion of the loan cannot create a loss, so a
// negative result adds back interest x land_ratio, up to zero.
double loss_adjusted_rental_income(double rental_income, double interest, double land_ratio);

// Corporate tax on the property's taxable income. Income up to the
// threshold is charged at the reduced rate, the rest at the main rate.
// The minimum tax is charged every year, profit or not.
double corporate_tax(const CorporateTax& params, double taxable_income);

// Tax attributable to the property for one year. Never negative.
//
// Individual: progressive(other + adjusted rental) - progressive(other),
// floored at zero.
// Corporate: corporate_tax(taxable_income).
double compute_income_tax(
    const TaxRegime& regime,
    double taxable_income,
    double interest,
    double land_ratio
);

} // namespace propcalc

#endif // PROPCALC_INCOME_TAX_HPP
