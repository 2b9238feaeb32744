#include "depreciation.hpp"
#include <algorithm>

namespace propcalc {

namespace {

// Residual, relative to the base, below which a schedule counts as exhausted
constexpr double EXHAUSTED_TOLERANCE = 1e-9;

double straight_line_charge(double base, int life, double cumulative) {
    if (base <= 0.0 || life <= 0) {
        return 0.0;
    }
    const double tolerance = base * EXHAUSTED_TOLERANCE;
    const double remaining = base - cumulative;
    if (remaining <= tolerance) {
        return 0.0;
    }
    const double annual = base / static_cast<double>(life);
    // The final charge books whatever is left
    if (remaining - annual <= tolerance) {
        return remaining;
    }
    return annual;
}

} // anonymous namespace

DepreciationPlan::DepreciationPlan()
    : building_base(0.0), building_life(0), equipment_base(0.0), equipment_life(0) {}

DepreciationState::DepreciationState()
    : building_cumulative(0.0), equipment_cumulative(0.0) {}

DepreciationPlan build_depreciation_plan(const Configuration& config) {
    DepreciationPlan plan;

    const double building_price = config.building_price();
    if (building_price <= 0.0) {
        return plan;
    }

    plan.building_base = building_price;
    plan.building_life = remaining_useful_life(config.structure, config.building_age);

    if (config.equipment.enabled && config.equipment.ratio > 0.0) {
        plan.equipment_base = building_price * (config.equipment.ratio / 100.0);
        plan.equipment_life = std::max(1, config.equipment.useful_life);
        plan.building_base = building_price - plan.equipment_base;
    }

    return plan;
}

DepreciationYear depreciate_year(const DepreciationPlan& plan, const DepreciationState& state) {
    DepreciationYear year;
    year.building = straight_line_charge(plan.building_base, plan.building_life,
                                         state.building_cumulative);
    year.equipment = straight_line_charge(plan.equipment_base, plan.equipment_life,
                                          state.equipment_cumulative);

    year.next = state;
    year.next.building_cumulative += year.building;
    year.next.equipment_cumulative += year.equipment;
    return year;
}

} // namespace propcalc
