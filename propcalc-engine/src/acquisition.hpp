#ifndef PROPCALC_ACQUISITION_HPP
#define PROPCALC_ACQUISITION_HPP

#include "config.hpp"

namespace propcalc {

// One-off costs paid at purchase, each rounded to whole yen
struct AcquisitionCosts {
    double misc;
    double water_contribution;
    double fire_insurance;
    double loan_fee;
    double registration;
    double initial_costs;       // Sum of the above
    double total_price;         // Price + initial costs
    double equity;              // Total price - loan principal

    AcquisitionCosts();
};

AcquisitionCosts compute_acquisition_costs(const Configuration& config);

} // namespace propcalc

#endif // PROPCALC_ACQUISITION_HPP
