#ifndef PROPCALC_PROJECTION_HPP
#define PROPCALC_PROJECTION_HPP

#include "config.hpp"
#include "scenario.hpp"
#include <optional>
#include <vector>

namespace propcalc {

// Financial result for a single simulated year
struct YearlyResult {
    int year;                           // Simulated year (1-based)
    double gross_potential_rent;        // Full-occupancy rent after decline
    double occupancy_rate;              // Resolved occupancy (0-100)
    double effective_income;            // EGI
    double operating_expense;
    double repair_cost;                 // One-off repair events
    double property_tax;
    double acquisition_tax;             // Non-zero in the booking year only
    double noi;                         // EGI - operating expense - property tax
    double interest;
    double principal;
    double debt_service;                // Interest + principal
    double loan_balance;                // End-of-year balance
    double depreciation_building;
    double depreciation_equipment;
    double depreciation;                // Building + equipment
    double cumulative_depreciation;
    double taxable_income;
    double income_tax;
    double cash_flow_pre_tax;
    double cash_flow_post_tax;
    std::optional<double> dscr;         // (NOI - repairs) / debt service; empty without debt service
    bool principal_exceeds_depreciation;

    explicit YearlyResult(int year_ = 0);
};

// Run the year loop for one set of inputs.
//
// Each year, for building age a = age at acquisition + year - 1:
//   1. Income: GPR with rent decline, occupancy after vacancy model
//   2. Operating expense (simple or detailed) and repair events
//   3. Property tax for age a, acquisition tax in its booking year
//   4. Loan: 12 monthly payments at the year's rate
//   5. Depreciation: straight line until each base is used up
//   6. Taxable income = EGI - opex - repairs - interest - depreciation
//                       - property tax - acquisition tax
//   7. Income tax under the configured regime
//   8. Cash flow pre-tax = EGI - opex - repairs - debt service
//                          - property tax - acquisition tax;
//      post-tax = pre-tax - income tax
//
// Loan balance and depreciation totals are the only state carried between
// years. A configuration without a positive price or rent is an empty
// state and yields projection_years all-zero results.
std::vector<YearlyResult> project_property(const ProjectionInputs& inputs);

// First year whose post-tax cash flow is non-positive after a year in which
// it was positive
std::optional<int> find_dead_cross_year(const std::vector<YearlyResult>& results);

} // namespace propcalc

#endif // PROPCALC_PROJECTION_HPP
