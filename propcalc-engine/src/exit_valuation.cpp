#include "exit_valuation.hpp"
#include <algorithm>
#include <cmath>

namespace propcalc {

ExitSummary::ExitSummary()
    : exit_year(0), noi(0.0), sale_price(0.0), brokerage_cost(0.0), other_costs(0.0),
      transaction_costs(0.0), book_value(0.0), capital_gain(0.0),
      capital_gains_tax_rate(0.0), capital_gains_tax(0.0), loan_balance(0.0),
      net_proceeds(0.0), npv(0.0) {}

// ============================================================================
// Discounting
// ============================================================================

double calculate_npv(double rate, const std::vector<double>& cash_flows) {
    const double r = std::isfinite(rate) ? rate : 0.0;
    double npv = 0.0;
    for (size_t t = 0; t < cash_flows.size(); ++t) {
        npv += cash_flows[t] / std::pow(1.0 + r, static_cast<double>(t));
    }
    return npv;
}

std::optional<double> calculate_irr(const std::vector<double>& cash_flows, double guess) {
    constexpr int MAX_ITERATIONS = 100;
    constexpr double TOLERANCE = 1e-7;
    constexpr double RATE_FLOOR = -0.9999;

    double rate = std::isfinite(guess) ? guess : 0.1;

    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        double npv = 0.0;
        double d_npv = 0.0;

        for (size_t t = 0; t < cash_flows.size(); ++t) {
            const double denom = std::pow(1.0 + rate, static_cast<double>(t));
            npv += cash_flows[t] / denom;
            if (t > 0) {
                d_npv += (-static_cast<double>(t) * cash_flows[t]) / (denom * (1.0 + rate));
            }
        }

        if (std::abs(npv) < TOLERANCE) {
            return rate;
        }
        if (d_npv == 0.0) {
            break;
        }

        rate -= npv / d_npv;
        if (!std::isfinite(rate) || rate <= RATE_FLOOR) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

// ============================================================================
// Exit valuation
// ============================================================================

ExitSummary evaluate_exit(
    const ExitStrategy& exit,
    const std::vector<YearlyResult>& results,
    double price,
    double equity)
{
    ExitSummary summary;
    if (results.empty()) {
        return summary;
    }

    const int exit_year = std::min(std::max(1, exit.year), static_cast<int>(results.size()));
    const YearlyResult& at_exit = results[static_cast<size_t>(exit_year - 1)];
    summary.exit_year = exit_year;

    summary.noi = at_exit.noi;
    summary.sale_price = exit.cap_rate > 0.0
        ? std::round(summary.noi / (exit.cap_rate / 100.0))
        : 0.0;
    summary.brokerage_cost = std::round(
        summary.sale_price * (exit.brokerage_rate / 100.0) + exit.brokerage_fixed);
    summary.other_costs = std::round(summary.sale_price * (exit.other_cost_rate / 100.0));
    summary.transaction_costs = summary.brokerage_cost + summary.other_costs;

    summary.book_value = std::max(0.0, price - at_exit.cumulative_depreciation);
    summary.capital_gain = summary.sale_price - summary.transaction_costs - summary.book_value;
    summary.capital_gains_tax_rate = exit_year <= SHORT_TERM_HOLDING_YEARS
        ? exit.short_term_tax_rate
        : exit.long_term_tax_rate;
    summary.capital_gains_tax = summary.capital_gain > 0.0
        ? std::round(summary.capital_gain * (summary.capital_gains_tax_rate / 100.0))
        : 0.0;

    summary.loan_balance = at_exit.loan_balance;
    summary.net_proceeds = std::round(summary.sale_price - summary.transaction_costs -
                                      summary.capital_gains_tax - summary.loan_balance);

    summary.cash_flows.reserve(static_cast<size_t>(exit_year) + 1);
    summary.cash_flows.push_back(-equity);
    for (int year = 1; year <= exit_year; ++year) {
        summary.cash_flows.push_back(results[static_cast<size_t>(year - 1)].cash_flow_post_tax);
    }
    summary.cash_flows.back() += summary.net_proceeds;

    summary.npv = calculate_npv(exit.discount_rate / 100.0, summary.cash_flows);
    summary.irr = calculate_irr(summary.cash_flows);
    if (equity > 0.0) {
        double returned = 0.0;
        for (size_t t = 1; t < summary.cash_flows.size(); ++t) {
            returned += summary.cash_flows[t];
        }
        summary.equity_multiple = returned / equity;
    }

    return summary;
}

} // namespace propcalc
