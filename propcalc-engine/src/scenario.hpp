#ifndef PROPCALC_SCENARIO_HPP
#define PROPCALC_SCENARIO_HPP

#include "config.hpp"
#include <array>
#include <optional>

namespace propcalc {

// RatePath: loan interest rate in force for each simulated year (1-50)
class RatePath {
public:
    static constexpr size_t MAX_YEAR = Configuration::MAX_YEARS;

    RatePath();
    explicit RatePath(double flat_rate);

    // Set/get the rate for a specific year (1-50)
    void set_rate(int year, double rate);
    double get_rate(int year) const;

    // Add delta to every year from from_year onwards; rates never go below 0
    void apply_shock(int from_year, double delta);

private:
    // rates_[year-1] = rate for that year
    std::array<double, MAX_YEAR> rates_;
};

// Everything one run of the year loop needs. The baseline carries a flat
// rate path and no overrides; a stressed run carries the scenario deltas.
// The configuration is sanitized on construction.
struct ProjectionInputs {
    Configuration config;
    RatePath rates;
    std::optional<RentCurveOverride> rent_curve;
    std::optional<OccupancyDecline> occupancy_decline;

    ProjectionInputs();
    explicit ProjectionInputs(const Configuration& cfg);
};

// Baseline inputs: the configured rate every year, no overrides
ProjectionInputs baseline_inputs(const Configuration& config);

// Clone the configuration and layer the stress scenario on top:
//   - interest rate + delta from the shock year onwards
//   - rent decline curve replaced by the early/late pair, if set
//   - occupancy reduced by delta points from its start year, if set
// Without a scenario the result equals baseline_inputs(config).
ProjectionInputs compose_stressed_configuration(const Configuration& config);

// Baseline with the interest rate raised by delta for every year. Used for
// the rate sensitivity metric.
ProjectionInputs rate_sensitivity_inputs(const Configuration& config, double delta);

} // namespace propcalc

#endif // PROPCALC_SCENARIO_HPP
