#ifndef PROPCALC_INCOME_HPP
#define PROPCALC_INCOME_HPP

#include "config.hpp"
#include <optional>

namespace propcalc {

// Gross and effective rent for one year
struct IncomeYear {
    double gross_potential_rent;    // Full-occupancy rent after decline
    double occupancy_rate;          // Resolved occupancy after vacancy model (0-100)
    double effective_income;        // GPR x occupancy, never above GPR
};

// Rent decline compounds once every 2 years: factor = (1-d)^floor((year-1)/2).
// With a curve override the early rate applies up to switch_year and the late
// rate afterwards.
double rent_decline_factor(
    int year,
    double decline_rate,
    const std::optional<RentCurveOverride>& curve = std::nullopt
);

// Index 0-4 into AgeBandedOccupancy::band_rates for a building age
size_t occupancy_band_index(int building_age);

// Occupancy before vacancy adjustments for a building of the given age
double occupancy_for_age(const OccupancyPolicy& policy, int building_age);

// Fraction of the year lost to vacancy (0-1) under the model for a year
double vacancy_loss(const VacancyModel& model, int year);

// Project income for one year.
//
// occupancy_decline (stress scenario) subtracts its delta from the base
// occupancy from start_year onwards, before the vacancy model applies:
//   occupancy = clamp(base - decline) x (1 - vacancy_loss)
IncomeYear project_income(
    const Configuration& config,
    int year,
    const std::optional<RentCurveOverride>& curve = std::nullopt,
    const std::optional<OccupancyDecline>& occupancy_decline = std::nullopt
);

} // namespace propcalc

#endif // PROPCALC_INCOME_HPP
