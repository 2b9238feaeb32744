#include "property_tax.hpp"
#include <algorithm>
#include <cmath>

namespace propcalc {

PropertyTaxAssessment::PropertyTaxAssessment()
    : land_evaluation(0.0), land_taxable(0.0),
      building_evaluation(0.0), building_taxable(0.0),
      relief_applied(false), tax(0.0) {}

double building_evaluation_factor(int building_age) {
    const int age = std::max(0, building_age);
    return std::max(0.0, 1.0 - (BUILDING_EVALUATION_DECAY_RATE / 100.0) * age);
}

bool new_build_relief_active(const PropertyTaxParams& params, int building_age) {
    return params.new_build_relief_enabled &&
           params.new_build_relief_years > 0 &&
           std::max(0, building_age) < params.new_build_relief_years;
}

PropertyTaxAssessment assess_property_tax(
    const PropertyTaxParams& params,
    double land_price,
    double building_price,
    int building_age)
{
    PropertyTaxAssessment assessment;

    assessment.land_evaluation = std::max(0.0, land_price) * (params.land_evaluation_rate / 100.0);
    assessment.land_taxable = assessment.land_evaluation * (params.land_reduction_rate / 100.0);

    assessment.building_evaluation = std::max(0.0, building_price) *
                                     (params.building_evaluation_rate / 100.0) *
                                     building_evaluation_factor(building_age);

    assessment.relief_applied = new_build_relief_active(params, building_age);
    assessment.building_taxable = assessment.relief_applied
        ? assessment.building_evaluation * (params.new_build_relief_rate / 100.0)
        : assessment.building_evaluation;

    const double taxable = assessment.land_taxable + assessment.building_taxable;
    assessment.tax = std::round(taxable * (params.tax_rate / 100.0));
    return assessment;
}

double acquisition_tax(
    const PropertyTaxParams& params,
    double land_price,
    double building_price)
{
    const double land_evaluation = std::max(0.0, land_price) * (params.land_evaluation_rate / 100.0);
    const double building_evaluation = std::max(0.0, building_price) *
                                       (params.building_evaluation_rate / 100.0);
    const double base = land_evaluation * (params.acquisition_land_reduction_rate / 100.0) +
                        building_evaluation;
    return std::round(base * (params.acquisition_tax_rate / 100.0));
}

int acquisition_tax_year(const PropertyTaxParams& params) {
    return params.acquisition_tax_timing == AcquisitionTaxTiming::FollowingYear ? 2 : 1;
}

} // namespace propcalc
