#include "simulation.hpp"
#include "scenario.hpp"
#include <limits>

namespace propcalc {

SeriesSummary::SeriesSummary()
    : total_cash_flow(0.0), min_cash_flow(0.0), min_cash_flow_year(0) {}

SeriesSummary summarize_series(const std::vector<YearlyResult>& results) {
    SeriesSummary summary;
    if (results.empty()) {
        return summary;
    }

    summary.min_cash_flow = std::numeric_limits<double>::infinity();
    for (const auto& r : results) {
        summary.total_cash_flow += r.cash_flow_post_tax;
        if (r.cash_flow_post_tax < summary.min_cash_flow) {
            summary.min_cash_flow = r.cash_flow_post_tax;
            summary.min_cash_flow_year = r.year;
        }
        if (r.dscr && (!summary.min_dscr || *r.dscr < *summary.min_dscr)) {
            summary.min_dscr = r.dscr;
        }
        if (r.principal_exceeds_depreciation) {
            summary.principal_exceeds_depreciation_years.push_back(r.year);
        }
    }
    summary.dead_cross_year = find_dead_cross_year(results);
    return summary;
}

namespace {

std::optional<double> percent_of(double numerator, double denominator) {
    if (denominator <= 0.0) {
        return std::nullopt;
    }
    return numerator / denominator * 100.0;
}

} // anonymous namespace

InvestmentMetrics compute_investment_metrics(
    const Configuration& config,
    const AcquisitionCosts& acquisition,
    const std::vector<YearlyResult>& baseline,
    const std::vector<YearlyResult>& rate_sensitivity)
{
    InvestmentMetrics metrics;
    if (baseline.empty()) {
        return metrics;
    }

    const YearlyResult& first = baseline.front();
    const double noi = first.noi - first.repair_cost;
    const double expenses = first.operating_expense + first.property_tax + first.repair_cost;
    const double gpr = first.gross_potential_rent;

    metrics.gross_yield = percent_of(gpr, config.price);
    metrics.noi_yield = percent_of(noi, acquisition.total_price);
    if (metrics.noi_yield) {
        metrics.yield_gap = *metrics.noi_yield - config.interest_rate;
    }
    metrics.cash_on_cash_pre_tax = percent_of(first.cash_flow_pre_tax, acquisition.equity);
    metrics.cash_on_cash_post_tax = percent_of(first.cash_flow_post_tax, acquisition.equity);
    metrics.repayment_ratio = percent_of(first.debt_service, gpr);
    metrics.break_even_ratio = percent_of(expenses + first.debt_service, gpr);
    metrics.dscr = first.dscr;
    if (!rate_sensitivity.empty()) {
        metrics.dscr_rate_sensitivity = rate_sensitivity.front().dscr;
    }

    return metrics;
}

SimulationResult simulate(const Configuration& input) {
    SimulationResult result;
    result.config = sanitize(input);
    const Configuration& config = result.config;

    result.acquisition = compute_acquisition_costs(config);

    result.baseline = project_property(baseline_inputs(config));
    result.baseline_summary = summarize_series(result.baseline);
    result.dead_cross_year = result.baseline_summary.dead_cross_year;

    if (config.scenario) {
        result.scenario = project_property(compose_stressed_configuration(config));
        result.scenario_summary = summarize_series(*result.scenario);
    }

    // No sale is valued for an empty state
    const bool empty_state = config.price <= 0.0 || config.monthly_rent <= 0.0;
    if (config.exit && !empty_state) {
        result.exit = evaluate_exit(*config.exit, result.baseline,
                                    config.price, result.acquisition.equity);
        if (result.scenario) {
            result.scenario_exit = evaluate_exit(*config.exit, *result.scenario,
                                                 config.price, result.acquisition.equity);
        }
    }

    const std::vector<YearlyResult> sensitivity =
        project_property(rate_sensitivity_inputs(config, RATE_SENSITIVITY_DELTA));
    result.metrics = compute_investment_metrics(config, result.acquisition,
                                                result.baseline, sensitivity);

    return result;
}

} // namespace propcalc
