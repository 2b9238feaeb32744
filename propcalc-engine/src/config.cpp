#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace propcalc {

// ============================================================================
// Configuration Implementation
// ============================================================================

Configuration::Configuration()
    : price(0.0),
      building_ratio(0.0),
      structure(StructureType::RC),
      building_age(0),
      unit_count(0),
      cleaning_visits_per_month(0.0),
      loan_principal(0.0),
      equity_ratio(0.0),
      interest_rate(0.0),
      loan_term_years(0),
      monthly_rent(0.0),
      rent_decline_rate(0.0),
      occupancy(FlatOccupancy{}),
      vacancy(FixedVacancy{}),
      expenses(SimpleExpensePolicy{}),
      tax(IndividualTax{}),
      projection_years(DEFAULT_YEARS) {}

double Configuration::building_price() const {
    return price * (building_ratio / 100.0);
}

double Configuration::land_price() const {
    return std::max(0.0, price - building_price());
}

// ============================================================================
// Sanitizing
// ============================================================================

double clamp_percent(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::min(100.0, std::max(0.0, value));
}

double clamp_amount(double value) {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::max(0.0, value);
}

namespace {

int clamp_count(int value) {
    return std::max(0, value);
}

int clamp_year(int value) {
    return std::max(1, value);
}

struct OccupancySanitizer {
    OccupancyPolicy operator()(const FlatOccupancy& flat) const {
        return FlatOccupancy{clamp_percent(flat.rate)};
    }
    OccupancyPolicy operator()(const AgeBandedOccupancy& banded) const {
        AgeBandedOccupancy out;
        out.base_rate = clamp_percent(banded.base_rate);
        for (size_t i = 0; i < AgeBandedOccupancy::NUM_BANDS; ++i) {
            out.band_rates[i] = clamp_percent(banded.band_rates[i]);
        }
        return out;
    }
};

struct VacancySanitizer {
    VacancyModel operator()(const FixedVacancy& fixed) const {
        return fixed;
    }
    VacancyModel operator()(const CyclicVacancy& cyclic) const {
        return CyclicVacancy{clamp_year(cyclic.cycle_years),
                             std::min(12.0, clamp_amount(cyclic.vacancy_months))};
    }
    VacancyModel operator()(const ProbabilisticVacancy& probabilistic) const {
        return ProbabilisticVacancy{clamp_percent(probabilistic.probability),
                                    std::min(12.0, clamp_amount(probabilistic.vacancy_months))};
    }
};

struct ExpenseSanitizer {
    ExpensePolicy operator()(const SimpleExpensePolicy& simple) const {
        SimpleExpensePolicy out = simple;
        out.rate = clamp_percent(simple.rate);
        return out;
    }
    ExpensePolicy operator()(const DetailedExpensePolicy& detailed) const {
        DetailedExpensePolicy out = detailed;
        for (auto& item : out.rate_items) {
            item.rate = clamp_percent(item.rate);
        }
        for (auto& item : out.fixed_items) {
            item.annual_amount = clamp_amount(item.annual_amount);
        }
        for (auto& item : out.event_items) {
            item.amount = clamp_amount(item.amount);
            item.interval_years = clamp_year(item.interval_years);
            item.start_year = clamp_year(item.start_year);
        }
        out.leasing.marketing_months = clamp_amount(out.leasing.marketing_months);
        out.leasing.average_tenancy_years = clamp_amount(out.leasing.average_tenancy_years);
        return out;
    }
};

struct TaxSanitizer {
    TaxRegime operator()(const IndividualTax& individual) const {
        return IndividualTax{clamp_amount(individual.other_income),
                             clamp_percent(individual.resident_tax_rate)};
    }
    TaxRegime operator()(const CorporateTax& corporate) const {
        CorporateTax out;
        out.rate = clamp_percent(corporate.rate);
        out.reduced_rate = clamp_percent(corporate.reduced_rate);
        out.reduced_rate_threshold = clamp_amount(corporate.reduced_rate_threshold);
        out.minimum_tax = clamp_amount(corporate.minimum_tax);
        return out;
    }
};

} // anonymous namespace

Configuration sanitize(const Configuration& config) {
    Configuration out = config;

    out.price = clamp_amount(config.price);
    out.building_ratio = clamp_percent(config.building_ratio);
    out.building_age = clamp_count(config.building_age);
    out.unit_count = clamp_count(config.unit_count);
    out.cleaning_visits_per_month = clamp_amount(config.cleaning_visits_per_month);

    out.loan_principal = clamp_amount(config.loan_principal);
    out.equity_ratio = clamp_percent(config.equity_ratio);
    out.interest_rate = clamp_percent(config.interest_rate);
    out.loan_term_years = std::min(Configuration::MAX_YEARS, clamp_count(config.loan_term_years));

    out.monthly_rent = clamp_amount(config.monthly_rent);
    out.rent_decline_rate = clamp_percent(config.rent_decline_rate);
    out.occupancy = std::visit(OccupancySanitizer{}, config.occupancy);
    out.vacancy = std::visit(VacancySanitizer{}, config.vacancy);

    out.expenses = std::visit(ExpenseSanitizer{}, config.expenses);
    out.repair_events.clear();
    for (const auto& event : config.repair_events) {
        RepairEvent clean = event;
        clean.amount = clamp_amount(event.amount);
        out.repair_events.push_back(clean);
    }

    out.acquisition_costs.misc = clamp_percent(config.acquisition_costs.misc);
    out.acquisition_costs.water_contribution = clamp_percent(config.acquisition_costs.water_contribution);
    out.acquisition_costs.fire_insurance = clamp_percent(config.acquisition_costs.fire_insurance);
    out.acquisition_costs.loan_fee = clamp_percent(config.acquisition_costs.loan_fee);
    out.acquisition_costs.registration = clamp_percent(config.acquisition_costs.registration);

    PropertyTaxParams& pt = out.property_tax;
    pt.land_evaluation_rate = clamp_percent(config.property_tax.land_evaluation_rate);
    pt.building_evaluation_rate = clamp_percent(config.property_tax.building_evaluation_rate);
    pt.land_reduction_rate = clamp_percent(config.property_tax.land_reduction_rate);
    pt.tax_rate = clamp_percent(config.property_tax.tax_rate);
    pt.new_build_relief_years = clamp_count(config.property_tax.new_build_relief_years);
    pt.new_build_relief_rate = clamp_percent(config.property_tax.new_build_relief_rate);
    pt.acquisition_tax_rate = clamp_percent(config.property_tax.acquisition_tax_rate);
    pt.acquisition_land_reduction_rate = clamp_percent(config.property_tax.acquisition_land_reduction_rate);

    out.equipment.ratio = clamp_percent(config.equipment.ratio);
    out.equipment.useful_life = clamp_count(config.equipment.useful_life);

    out.tax = std::visit(TaxSanitizer{}, config.tax);

    if (config.scenario) {
        StressScenario& s = *out.scenario;
        s.interest_shock.year = clamp_year(config.scenario->interest_shock.year);
        s.interest_shock.delta = clamp_percent(config.scenario->interest_shock.delta);
        if (s.rent_curve) {
            s.rent_curve->early_rate = clamp_percent(s.rent_curve->early_rate);
            s.rent_curve->late_rate = clamp_percent(s.rent_curve->late_rate);
            s.rent_curve->switch_year = clamp_year(s.rent_curve->switch_year);
        }
        if (s.occupancy_decline) {
            s.occupancy_decline->start_year = clamp_year(s.occupancy_decline->start_year);
            s.occupancy_decline->delta = clamp_percent(s.occupancy_decline->delta);
        }
    }

    if (config.exit) {
        ExitStrategy& e = *out.exit;
        e.year = clamp_year(config.exit->year);
        e.cap_rate = clamp_percent(config.exit->cap_rate);
        e.brokerage_rate = clamp_percent(config.exit->brokerage_rate);
        e.brokerage_fixed = clamp_amount(config.exit->brokerage_fixed);
        e.other_cost_rate = clamp_percent(config.exit->other_cost_rate);
        e.short_term_tax_rate = clamp_percent(config.exit->short_term_tax_rate);
        e.long_term_tax_rate = clamp_percent(config.exit->long_term_tax_rate);
        e.discount_rate = clamp_percent(config.exit->discount_rate);
    }

    out.projection_years = std::min(Configuration::MAX_YEARS, clamp_year(config.projection_years));

    return out;
}

// ============================================================================
// Enum names
// ============================================================================

std::string oer_property_type_to_string(OerPropertyType type) {
    switch (type) {
        case OerPropertyType::Unit: return "UNIT";
        case OerPropertyType::WoodApartment: return "WOOD_APARTMENT";
        case OerPropertyType::SteelApartment: return "STEEL_APARTMENT";
        case OerPropertyType::RcApartment: return "RC_APARTMENT";
    }
    return "RC_APARTMENT";
}

OerPropertyType parse_oer_property_type(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "UNIT") return OerPropertyType::Unit;
    if (upper == "WOOD_APARTMENT") return OerPropertyType::WoodApartment;
    if (upper == "STEEL_APARTMENT") return OerPropertyType::SteelApartment;
    if (upper == "RC_APARTMENT") return OerPropertyType::RcApartment;

    throw std::invalid_argument("Unknown OER property type: " + name);
}

} // namespace propcalc
