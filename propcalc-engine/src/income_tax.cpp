#include "income_tax.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace propcalc {

const std::vector<TaxBracket>& income_tax_brackets() {
    static const std::vector<TaxBracket> brackets = {
        {1950000.0, 0.05, 0.0},
        {3300000.0, 0.10, 97500.0},
        {6950000.0, 0.20, 427500.0},
        {9000000.0, 0.23, 636000.0},
        {18000000.0, 0.33, 1536000.0},
        {40000000.0, 0.40, 2796000.0},
        {std::numeric_limits<double>::infinity(), 0.45, 4796000.0},
    };
    return brackets;
}

double progressive_tax(double taxable_income, double resident_tax_rate) {
    if (!std::isfinite(taxable_income) || taxable_income <= 0.0) {
        return 0.0;
    }

    const auto& brackets = income_tax_brackets();
    auto it = std::find_if(brackets.begin(), brackets.end(),
                           [taxable_income](const TaxBracket& b) { return taxable_income <= b.up_to; });
    if (it == brackets.end()) {
        return 0.0;
    }

    const double income_tax = taxable_income * it->rate - it->deduction;
    const double resident_tax = taxable_income * (resident_tax_rate / 100.0);
    return std::max(0.0, std::round(income_tax + resident_tax));
}

double loss_adjusted_rental_income(double rental_income, double interest, double land_ratio) {
    if (rental_income >= 0.0) {
        return rental_income;
    }
    const double ratio = std::min(1.0, std::max(0.0, land_ratio));
    return std::min(0.0, rental_income + std::max(0.0, interest) * ratio);
}

double corporate_tax(const CorporateTax& params, double taxable_income) {
    double tax = 0.0;

    if (std::isfinite(taxable_income) && taxable_income > 0.0) {
        const bool tiered = params.reduced_rate > 0.0 && params.reduced_rate_threshold > 0.0;
        if (tiered) {
            const double reduced_part = std::min(taxable_income, params.reduced_rate_threshold);
            const double main_part = taxable_income - reduced_part;
            tax = reduced_part * (params.reduced_rate / 100.0) + main_part * (params.rate / 100.0);
        } else {
            tax = taxable_income * (params.rate / 100.0);
        }
    }

    return std::round(tax + std::max(0.0, params.minimum_tax));
}

namespace {

struct IncomeTaxVisitor {
    double taxable_income;
    double interest;
    double land_ratio;

    double operator()(const IndividualTax& individual) const {
        const double rental = loss_adjusted_rental_income(taxable_income, interest, land_ratio);
        const double combined = progressive_tax(individual.other_income + rental,
                                                individual.resident_tax_rate);
        const double baseline = progressive_tax(individual.other_income,
                                                individual.resident_tax_rate);
        return std::max(0.0, combined - baseline);
    }

    double operator()(const CorporateTax& corporate) const {
        return corporate_tax(corporate, taxable_income);
    }
};

} // anonymous namespace

double compute_income_tax(
    const TaxRegime& regime,
    double taxable_income,
    double interest,
    double land_ratio)
{
    return std::visit(IncomeTaxVisitor{taxable_income, interest, land_ratio}, regime);
}

} // namespace propcalc
