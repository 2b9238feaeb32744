#ifndef PROPCALC_SIMULATION_HPP
#define PROPCALC_SIMULATION_HPP

#include "acquisition.hpp"
#include "config.hpp"
#include "exit_valuation.hpp"
#include "projection.hpp"
#include <optional>
#include <vector>

namespace propcalc {

// Rate increase (percentage points) for the DSCR sensitivity run
constexpr double RATE_SENSITIVITY_DELTA = 1.0;

// Aggregates over one yearly series
struct SeriesSummary {
    double total_cash_flow;             // Sum of post-tax cash flow
    double min_cash_flow;
    int min_cash_flow_year;
    std::optional<double> min_dscr;     // Over years with debt service
    std::optional<int> dead_cross_year;
    std::vector<int> principal_exceeds_depreciation_years;

    SeriesSummary();
};

// First-year investment metrics. Ratios are percentages; a metric whose
// denominator is zero is left empty.
struct InvestmentMetrics {
    std::optional<double> gross_yield;          // GPR / price
    std::optional<double> noi_yield;            // (NOI - repairs) / total price
    std::optional<double> yield_gap;            // NOI yield - interest rate
    std::optional<double> cash_on_cash_pre_tax;
    std::optional<double> cash_on_cash_post_tax;
    std::optional<double> repayment_ratio;      // Debt service / GPR
    std::optional<double> break_even_ratio;     // (Expenses + debt service) / GPR
    std::optional<double> dscr;
    std::optional<double> dscr_rate_sensitivity; // DSCR with the rate raised by 1 point
};

struct SimulationResult {
    Configuration config;                       // Sanitized configuration that was run
    AcquisitionCosts acquisition;
    std::vector<YearlyResult> baseline;
    std::optional<std::vector<YearlyResult>> scenario;
    std::optional<ExitSummary> exit;
    std::optional<ExitSummary> scenario_exit;
    std::optional<int> dead_cross_year;         // Baseline series
    SeriesSummary baseline_summary;
    std::optional<SeriesSummary> scenario_summary;
    InvestmentMetrics metrics;
};

SeriesSummary summarize_series(const std::vector<YearlyResult>& results);

InvestmentMetrics compute_investment_metrics(
    const Configuration& config,
    const AcquisitionCosts& acquisition,
    const std::vector<YearlyResult>& baseline,
    const std::vector<YearlyResult>& rate_sensitivity
);

// Run the whole engine on one configuration. Never throws for numeric
// input: the configuration is sanitized first, and an empty state (no
// price or no rent) yields all-zero series.
//
// Runs the baseline, the stressed series when a scenario is configured,
// the exit valuation for each series when an exit is configured, and a
// +1 point rate run for the DSCR sensitivity metric.
SimulationResult simulate(const Configuration& config);

} // namespace propcalc

#endif // PROPCALC_SIMULATION_HPP
