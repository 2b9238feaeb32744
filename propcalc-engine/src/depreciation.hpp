#ifndef PROPCALC_DEPRECIATION_HPP
#define PROPCALC_DEPRECIATION_HPP

#include "config.hpp"

namespace propcalc {

// Straight-line schedule for the building body and, when split out, its
// equipment. Land is never depreciated.
struct DepreciationPlan {
    double building_base;       // Building price less any equipment share
    int building_life;          // Remaining useful life in years
    double equipment_base;
    int equipment_life;

    DepreciationPlan();

    double depreciable_base() const { return building_base + equipment_base; }
};

// Cumulative charges carried between years
struct DepreciationState {
    double building_cumulative;
    double equipment_cumulative;

    DepreciationState();

    double total() const { return building_cumulative + equipment_cumulative; }
};

struct DepreciationYear {
    double building;
    double equipment;
    DepreciationState next;

    double total() const { return building + equipment; }
};

// Split the building price and pick useful lives:
//   building life  = remaining_useful_life(structure, building_age)
//   equipment life = equipment.useful_life (at least 1)
// A zero price gives an empty plan.
DepreciationPlan build_depreciation_plan(const Configuration& config);

// Charge one year. Each component books base / life until its base is used
// up, then nothing; cumulative charges never exceed the base.
DepreciationYear depreciate_year(const DepreciationPlan& plan, const DepreciationState& state);

} // namespace propcalc

#endif // PROPCALC_DEPRECIATION_HPP
