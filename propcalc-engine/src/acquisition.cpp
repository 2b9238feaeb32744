#include "acquisition.hpp"
#include <cmath>

namespace propcalc {

AcquisitionCosts::AcquisitionCosts()
    : misc(0.0), water_contribution(0.0), fire_insurance(0.0), loan_fee(0.0),
      registration(0.0), initial_costs(0.0), total_price(0.0), equity(0.0) {}

AcquisitionCosts compute_acquisition_costs(const Configuration& config) {
    const AcquisitionCostRates& rates = config.acquisition_costs;

    AcquisitionCosts costs;
    costs.misc = std::round(config.price * (rates.misc / 100.0));
    costs.water_contribution = std::round(config.price * (rates.water_contribution / 100.0));
    costs.fire_insurance = std::round(config.building_price() * (rates.fire_insurance / 100.0));
    costs.loan_fee = std::round(config.loan_principal * (rates.loan_fee / 100.0));
    costs.registration = std::round(config.price * (rates.registration / 100.0));

    costs.initial_costs = costs.misc + costs.water_contribution + costs.fire_insurance +
                          costs.loan_fee + costs.registration;
    costs.total_price = config.price + costs.initial_costs;
    costs.equity = costs.total_price - config.loan_principal;
    return costs;
}

} // namespace propcalc
