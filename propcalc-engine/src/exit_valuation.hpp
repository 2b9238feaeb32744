#ifndef PROPCALC_EXIT_VALUATION_HPP
#define PROPCALC_EXIT_VALUATION_HPP

#include "config.hpp"
#include "projection.hpp"
#include <optional>
#include <vector>

namespace propcalc {

// Holding periods up to this many years use the short-term gains rate
constexpr int SHORT_TERM_HOLDING_YEARS = 5;

// Sale of the property at the end of the exit year
struct ExitSummary {
    int exit_year;
    double noi;                     // NOI of the exit year
    double sale_price;              // round(NOI / cap rate)
    double brokerage_cost;          // round(sale x brokerage% + fixed)
    double other_costs;             // round(sale x other%)
    double transaction_costs;       // Brokerage + other
    double book_value;              // Price - cumulative depreciation
    double capital_gain;            // Sale - costs - book value
    double capital_gains_tax_rate;  // Short- or long-term rate (%)
    double capital_gains_tax;
    double loan_balance;            // Repaid from the proceeds
    double net_proceeds;
    double npv;
    std::optional<double> irr;                  // Empty when it does not converge
    std::optional<double> equity_multiple;      // Empty without positive equity
    std::vector<double> cash_flows;             // t=0 is -equity

    ExitSummary();
};

// Net present value at rate (fraction, not percent); cash_flows[t] is
// discounted by (1 + rate)^t
double calculate_npv(double rate, const std::vector<double>& cash_flows);

// Internal rate of return by Newton iteration (100 steps, tolerance 1e-7).
// Returns nullopt if it does not converge or the rate falls to -99.99%.
std::optional<double> calculate_irr(const std::vector<double>& cash_flows, double guess = 0.1);

// Value the sale at exit.year, clamped to the projected years.
//
// Cash flows are [-equity, post-tax CF year 1, ..., post-tax CF exit year]
// with the net proceeds added to the exit year. NPV discounts them at the
// strategy's discount rate.
ExitSummary evaluate_exit(
    const ExitStrategy& exit,
    const std::vector<YearlyResult>& results,
    double price,
    double equity
);

} // namespace propcalc

#endif // PROPCALC_EXIT_VALUATION_HPP
