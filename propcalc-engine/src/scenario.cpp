#include "scenario.hpp"
#include <algorithm>
#include <stdexcept>

namespace propcalc {

// ============================================================================
// RatePath Implementation
// ============================================================================

RatePath::RatePath() {
    rates_.fill(0.0);
}

RatePath::RatePath(double flat_rate) {
    rates_.fill(flat_rate);
}

void RatePath::set_rate(int year, double rate) {
    if (year < 1 || year > static_cast<int>(MAX_YEAR)) {
        throw std::out_of_range("Year must be between 1 and 50");
    }
    rates_[year - 1] = rate;
}

double RatePath::get_rate(int year) const {
    if (year < 1 || year > static_cast<int>(MAX_YEAR)) {
        throw std::out_of_range("Year must be between 1 and 50");
    }
    return rates_[year - 1];
}

void RatePath::apply_shock(int from_year, double delta) {
    const int start = std::max(1, from_year);
    for (int year = start; year <= static_cast<int>(MAX_YEAR); ++year) {
        rates_[year - 1] = std::max(0.0, rates_[year - 1] + delta);
    }
}

// ============================================================================
// ProjectionInputs Implementation
// ============================================================================

ProjectionInputs::ProjectionInputs() : rates(0.0) {}

ProjectionInputs::ProjectionInputs(const Configuration& cfg)
    : config(sanitize(cfg)), rates(config.interest_rate) {}

ProjectionInputs baseline_inputs(const Configuration& config) {
    return ProjectionInputs(config);
}

ProjectionInputs compose_stressed_configuration(const Configuration& config) {
    ProjectionInputs inputs(config);
    if (!inputs.config.scenario) {
        return inputs;
    }

    const StressScenario& scenario = *inputs.config.scenario;
    inputs.rates.apply_shock(scenario.interest_shock.year, scenario.interest_shock.delta);
    inputs.rent_curve = scenario.rent_curve;
    inputs.occupancy_decline = scenario.occupancy_decline;
    return inputs;
}

ProjectionInputs rate_sensitivity_inputs(const Configuration& config, double delta) {
    ProjectionInputs inputs(config);
    inputs.config.interest_rate = clamp_percent(inputs.config.interest_rate + delta);
    inputs.rates = RatePath(inputs.config.interest_rate);
    return inputs;
}

} // namespace propcalc
