#include "amortization.hpp"
#include <algorithm>
#include <cmath>

namespace propcalc {

LoanTerms::LoanTerms() : principal(0.0), annual_rate(0.0), term_years(0) {}

LoanTerms::LoanTerms(double principal_, double annual_rate_, int term_years_)
    : principal(principal_), annual_rate(annual_rate_), term_years(term_years_) {}

LoanState::LoanState()
    : balance(0.0), annual_rate(0.0), monthly_payment(0.0), months_paid(0) {}

double monthly_payment(double principal, double annual_rate, int months) {
    if (months <= 0 || principal <= 0.0) {
        return 0.0;
    }
    if (annual_rate == 0.0) {
        return principal / static_cast<double>(months);
    }
    const double r = annual_rate / 12.0 / 100.0;
    return principal * r / (1.0 - std::pow(1.0 + r, -static_cast<double>(months)));
}

LoanState initial_loan_state(const LoanTerms& terms) {
    LoanState state;
    if (terms.principal <= 0.0 || terms.term_years <= 0) {
        return state;
    }
    state.balance = terms.principal;
    state.annual_rate = terms.annual_rate;
    state.monthly_payment = monthly_payment(terms.principal, terms.annual_rate, terms.total_months());
    return state;
}

AmortizationStep amortize_year(
    const LoanState& state,
    const LoanTerms& terms,
    double rate_for_year)
{
    AmortizationStep step;
    step.interest = 0.0;
    step.principal = 0.0;
    step.next = state;

    const int total_months = terms.total_months();
    LoanState& s = step.next;

    if (s.balance <= 0.0 || s.months_paid >= total_months) {
        s.balance = 0.0;
        s.monthly_payment = 0.0;
        return step;
    }

    // Rate change: re-amortize what is left over the months that are left
    if (rate_for_year != s.annual_rate) {
        s.annual_rate = rate_for_year;
        s.monthly_payment = monthly_payment(s.balance, s.annual_rate, total_months - s.months_paid);
    }

    const double r = s.annual_rate / 12.0 / 100.0;
    for (int m = 0; m < 12 && s.months_paid < total_months && s.balance > 0.0; ++m) {
        double interest = s.balance * r;
        double principal = s.monthly_payment - interest;

        // Last scheduled payment (or overshoot) settles the remaining balance
        if (s.months_paid + 1 == total_months || principal > s.balance) {
            principal = s.balance;
        }
        principal = std::max(0.0, principal);

        step.interest += interest;
        step.principal += principal;
        s.balance -= principal;
        s.months_paid += 1;
    }

    if (s.balance < 1e-6) {
        s.balance = 0.0;
    }
    if (s.months_paid >= total_months) {
        s.balance = 0.0;
        s.monthly_payment = 0.0;
    }

    return step;
}

} // namespace propcalc
