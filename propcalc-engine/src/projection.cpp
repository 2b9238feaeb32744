#include "projection.hpp"
#include "amortization.hpp"
#include "depreciation.hpp"
#include "income.hpp"
#include "income_tax.hpp"
#include "operating_expense.hpp"
#include "property_tax.hpp"
#include <algorithm>

namespace propcalc {

// ============================================================================
// YearlyResult Implementation
// ============================================================================

YearlyResult::YearlyResult(int year_)
    : year(year_),
      gross_potential_rent(0.0),
      occupancy_rate(0.0),
      effective_income(0.0),
      operating_expense(0.0),
      repair_cost(0.0),
      property_tax(0.0),
      acquisition_tax(0.0),
      noi(0.0),
      interest(0.0),
      principal(0.0),
      debt_service(0.0),
      loan_balance(0.0),
      depreciation_building(0.0),
      depreciation_equipment(0.0),
      depreciation(0.0),
      cumulative_depreciation(0.0),
      taxable_income(0.0),
      income_tax(0.0),
      cash_flow_pre_tax(0.0),
      cash_flow_post_tax(0.0),
      principal_exceeds_depreciation(false) {}

// ============================================================================
// Year loop
// ============================================================================

namespace {

bool is_empty_state(const Configuration& config) {
    return config.price <= 0.0 || config.monthly_rent <= 0.0;
}

std::vector<YearlyResult> empty_results(int years) {
    std::vector<YearlyResult> results;
    results.reserve(static_cast<size_t>(years));
    for (int year = 1; year <= years; ++year) {
        results.emplace_back(year);
    }
    return results;
}

} // anonymous namespace

std::vector<YearlyResult> project_property(const ProjectionInputs& inputs) {
    const Configuration config = sanitize(inputs.config);
    const int years = config.projection_years;

    if (is_empty_state(config)) {
        return empty_results(years);
    }

    const double building_price = config.building_price();
    const double land_price = config.land_price();
    const double land_ratio = land_price / config.price;

    const LoanTerms terms(config.loan_principal, config.interest_rate, config.loan_term_years);
    LoanState loan = initial_loan_state(terms);

    const DepreciationPlan plan = build_depreciation_plan(config);
    DepreciationState depreciation_state;

    const double acquisition_tax_amount =
        acquisition_tax(config.property_tax, land_price, building_price);
    const int acquisition_year = acquisition_tax_year(config.property_tax);

    std::vector<YearlyResult> results;
    results.reserve(static_cast<size_t>(years));

    for (int year = 1; year <= years; ++year) {
        YearlyResult r(year);
        const int age_at_year = config.building_age + (year - 1);

        const IncomeYear income = project_income(
            config, year, inputs.rent_curve, inputs.occupancy_decline);
        r.gross_potential_rent = income.gross_potential_rent;
        r.occupancy_rate = income.occupancy_rate;
        r.effective_income = income.effective_income;

        r.operating_expense = compute_operating_expense(
            config.expenses, year, age_at_year,
            income.gross_potential_rent, income.effective_income);
        r.repair_cost = repair_cost_for_year(config.repair_events, year);

        r.property_tax = assess_property_tax(
            config.property_tax, land_price, building_price, age_at_year).tax;
        r.acquisition_tax = (year == acquisition_year) ? acquisition_tax_amount : 0.0;

        r.noi = r.effective_income - r.operating_expense - r.property_tax;

        const AmortizationStep step = amortize_year(
            loan, terms, clamp_percent(inputs.rates.get_rate(year)));
        loan = step.next;
        r.interest = step.interest;
        r.principal = step.principal;
        r.debt_service = step.payment();
        r.loan_balance = loan.balance;

        const DepreciationYear dep = depreciate_year(plan, depreciation_state);
        depreciation_state = dep.next;
        r.depreciation_building = dep.building;
        r.depreciation_equipment = dep.equipment;
        r.depreciation = dep.total();
        r.cumulative_depreciation = depreciation_state.total();

        r.taxable_income = r.effective_income - r.operating_expense - r.repair_cost -
                           r.interest - r.depreciation - r.property_tax - r.acquisition_tax;
        r.income_tax = compute_income_tax(config.tax, r.taxable_income, r.interest, land_ratio);

        r.cash_flow_pre_tax = r.effective_income - r.operating_expense - r.repair_cost -
                              r.debt_service - r.property_tax - r.acquisition_tax;
        r.cash_flow_post_tax = r.cash_flow_pre_tax - r.income_tax;

        if (r.debt_service > 0.0) {
            r.dscr = (r.noi - r.repair_cost) / r.debt_service;
        }
        r.principal_exceeds_depreciation = r.principal > r.depreciation;

        results.push_back(r);
    }

    return results;
}

std::optional<int> find_dead_cross_year(const std::vector<YearlyResult>& results) {
    for (size_t i = 1; i < results.size(); ++i) {
        if (results[i - 1].cash_flow_post_tax > 0.0 && results[i].cash_flow_post_tax <= 0.0) {
            return results[i].year;
        }
    }
    return std::nullopt;
}

} // namespace propcalc
