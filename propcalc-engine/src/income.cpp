#include "income.hpp"
#include <algorithm>
#include <cmath>

namespace propcalc {

double rent_decline_factor(
    int year,
    double decline_rate,
    const std::optional<RentCurveOverride>& curve)
{
    if (year < 1) {
        return 1.0;
    }

    if (curve) {
        const int early_steps = (std::min(year, curve->switch_year) - 1) / 2;
        const int late_steps = std::max(0, year - curve->switch_year) / 2;
        return std::pow(1.0 - curve->early_rate / 100.0, early_steps) *
               std::pow(1.0 - curve->late_rate / 100.0, late_steps);
    }

    return std::pow(1.0 - decline_rate / 100.0, (year - 1) / 2);
}

size_t occupancy_band_index(int building_age) {
    const int age = std::max(0, building_age);
    if (age <= 2) return 0;
    if (age <= 10) return 1;
    if (age <= 20) return 2;
    if (age <= 30) return 3;
    return 4;
}

namespace {

struct OccupancyResolver {
    int building_age;

    double operator()(const FlatOccupancy& flat) const {
        return flat.rate;
    }

    double operator()(const AgeBandedOccupancy& banded) const {
        double rate = banded.band_rates[occupancy_band_index(building_age)];
        return rate > 0.0 ? rate : banded.base_rate;
    }
};

struct VacancyLoss {
    int year;

    double operator()(const FixedVacancy&) const {
        return 0.0;
    }

    double operator()(const CyclicVacancy& cyclic) const {
        if (cyclic.cycle_years <= 0 || year % cyclic.cycle_years != 0) {
            return 0.0;
        }
        return cyclic.vacancy_months / 12.0;
    }

    // Expected value of the vacancy, not a random draw
    double operator()(const ProbabilisticVacancy& probabilistic) const {
        return (probabilistic.probability / 100.0) * (probabilistic.vacancy_months / 12.0);
    }
};

} // anonymous namespace

double occupancy_for_age(const OccupancyPolicy& policy, int building_age) {
    return std::visit(OccupancyResolver{building_age}, policy);
}

double vacancy_loss(const VacancyModel& model, int year) {
    return std::min(1.0, std::max(0.0, std::visit(VacancyLoss{year}, model)));
}

IncomeYear project_income(
    const Configuration& config,
    int year,
    const std::optional<RentCurveOverride>& curve,
    const std::optional<OccupancyDecline>& occupancy_decline)
{
    const int age_at_year = config.building_age + (year - 1);

    double occupancy = occupancy_for_age(config.occupancy, age_at_year);
    if (occupancy_decline && year >= occupancy_decline->start_year) {
        occupancy = std::max(0.0, occupancy - occupancy_decline->delta);
    }
    occupancy = std::min(100.0, std::max(0.0, occupancy * (1.0 - vacancy_loss(config.vacancy, year))));

    IncomeYear income;
    income.gross_potential_rent =
        config.monthly_rent * 12.0 * rent_decline_factor(year, config.rent_decline_rate, curve);
    income.occupancy_rate = occupancy;
    income.effective_income = income.gross_potential_rent * (occupancy / 100.0);
    return income;
}

} // namespace propcalc
