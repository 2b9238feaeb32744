#ifndef PROPCALC_AMORTIZATION_HPP
#define PROPCALC_AMORTIZATION_HPP

#include <algorithm>

namespace propcalc {

// Fixed-payment (annuity) loan repaid monthly
struct LoanTerms {
    double principal;       // Amount borrowed
    double annual_rate;     // Percent per year
    int term_years;

    // Longest term the month count is computed for
    static constexpr int MAX_TERM_YEARS = 50;

    LoanTerms();
    LoanTerms(double principal_, double annual_rate_, int term_years_);

    int total_months() const {
        return term_years > 0 ? std::min(term_years, MAX_TERM_YEARS) * 12 : 0;
    }
};

// Loan state carried from one year to the next
struct LoanState {
    double balance;             // Outstanding principal
    double annual_rate;         // Rate the current payment was computed at
    double monthly_payment;
    int months_paid;

    LoanState();
};

// Result of one simulated year of repayments
struct AmortizationStep {
    double interest;
    double principal;
    LoanState next;             // State at the end of the year

    double payment() const { return interest + principal; }
};

// Standard annuity payment P*r/(1-(1+r)^-n) with r = annual_rate/12/100
// and n = months. Zero-rate loans repay principal evenly.
double monthly_payment(double principal, double annual_rate, int months);

LoanState initial_loan_state(const LoanTerms& terms);

// Advance the loan by one year (12 monthly payments).
//
// rate_for_year is the rate in force for this year. If it differs from the
// rate the current payment was computed at, the remaining balance is
// re-amortized over the remaining term at the new rate: the payment changes,
// the payoff date does not.
//
// The final scheduled payment clears the balance exactly. After the term all
// flows are zero and the balance stays at zero.
AmortizationStep amortize_year(
    const LoanState& state,
    const LoanTerms& terms,
    double rate_for_year
);

} // namespace propcalc

#endif // PROPCALC_AMORTIZATION_HPP
