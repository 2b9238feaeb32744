#include "estimates.hpp"
#include "operating_expense.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace propcalc {

namespace {

// Rows by age <=5, <=15, <=25, <=35, older
constexpr std::array<int, 4> BUILDING_RATIO_AGE_LIMITS = {5, 15, 25, 35};

std::array<double, 5> building_ratio_row(StructureType structure) {
    switch (structure) {
        case StructureType::RC:
        case StructureType::SRC:
            return {70.0, 60.0, 50.0, 40.0, 30.0};
        case StructureType::HeavySteel:
            return {65.0, 55.0, 45.0, 35.0, 25.0};
        case StructureType::LightSteel:
            return {55.0, 45.0, 35.0, 25.0, 15.0};
        case StructureType::Wood:
            return {50.0, 40.0, 30.0, 20.0, 10.0};
    }
    return {70.0, 60.0, 50.0, 40.0, 30.0};
}

int loan_term_bonus(StructureType structure) {
    switch (structure) {
        case StructureType::RC: return 8;
        case StructureType::SRC: return 8;
        case StructureType::HeavySteel: return 10;
        case StructureType::LightSteel: return 12;
        case StructureType::Wood: return 15;
    }
    return 8;
}

constexpr int MIN_LOAN_TERM = 10;
constexpr int MAX_LOAN_TERM = 35;
constexpr double DEFAULT_EQUITY_RATIO = 5.0;

// Records the dotted name of every field it changes
class Filler {
public:
    explicit Filler(std::vector<std::string>& filled) : filled_(filled) {}

    void fill(double& field, double value, const char* name) {
        if (!is_missing(field) || field == value) {
            return;
        }
        field = value;
        filled_.emplace_back(name);
    }

    void fill(int& field, int value, const char* name) {
        if (field > 0 || field == value) {
            return;
        }
        field = value;
        filled_.emplace_back(name);
    }

    void note(const char* name) {
        filled_.emplace_back(name);
    }

private:
    std::vector<std::string>& filled_;
};

struct OccupancyDefaults {
    Filler& filler;
    double suggested;

    void operator()(FlatOccupancy& flat) const {
        filler.fill(flat.rate, suggested, "income.occupancy.rate");
    }
    void operator()(AgeBandedOccupancy& banded) const {
        filler.fill(banded.base_rate, suggested, "income.occupancy.rate");
    }
};

struct VacancyDefaults {
    Filler& filler;

    void operator()(FixedVacancy&) const {}
    void operator()(CyclicVacancy& cyclic) const {
        filler.fill(cyclic.cycle_years, 4, "income.vacancy.cycle_years");
        filler.fill(cyclic.vacancy_months, 3.0, "income.vacancy.vacancy_months");
    }
    void operator()(ProbabilisticVacancy& probabilistic) const {
        filler.fill(probabilistic.probability, 20.0, "income.vacancy.probability");
        filler.fill(probabilistic.vacancy_months, 2.0, "income.vacancy.vacancy_months");
    }
};

struct ExpenseDefaults {
    Filler& filler;
    const Configuration& config;

    void operator()(SimpleExpensePolicy& simple) const {
        if (!is_missing(simple.rate)) {
            return;
        }
        if (!simple.tracked_template) {
            simple.tracked_template = infer_oer_property_type(config.structure, config.unit_count);
            filler.note("expenses.template");
        }
        filler.fill(simple.rate,
                    oer_rate_for_age(*simple.tracked_template, config.building_age),
                    "expenses.rate");
    }

    void operator()(DetailedExpensePolicy& detailed) const {
        filler.fill(detailed.leasing.marketing_months, 2.0, "expenses.leasing.marketing_months");
        filler.fill(detailed.leasing.average_tenancy_years, 2.0,
                    "expenses.leasing.average_tenancy_years");
        sync_cleaning_item(detailed, config.unit_count, config.cleaning_visits_per_month);
    }
};

struct TaxDefaults {
    Filler& filler;

    void operator()(IndividualTax& individual) const {
        filler.fill(individual.resident_tax_rate, 10.0, "tax.resident_tax_rate");
    }
    void operator()(CorporateTax& corporate) const {
        filler.fill(corporate.rate, 23.2, "tax.rate");
        filler.fill(corporate.reduced_rate, 15.0, "tax.reduced_rate");
        filler.fill(corporate.reduced_rate_threshold, 8000000.0, "tax.reduced_rate_threshold");
        filler.fill(corporate.minimum_tax, 70000.0, "tax.minimum_tax");
    }
};

void fill_financing(Configuration& config, Filler& filler) {
    if (config.price > 0.0 && std::isfinite(config.price)) {
        if (is_missing(config.equity_ratio)) {
            const double loan_for_ratio = is_missing(config.loan_principal)
                ? std::round(config.price * (1.0 - DEFAULT_EQUITY_RATIO / 100.0))
                : config.loan_principal;
            const double ratio = (config.price - loan_for_ratio) / config.price * 100.0;
            filler.fill(config.equity_ratio, std::min(100.0, std::max(0.0, ratio)),
                        "loan.equity_ratio");
        }
        if (is_missing(config.loan_principal)) {
            const double equity = std::isfinite(config.equity_ratio) ? config.equity_ratio : 0.0;
            const double loan = std::round(config.price * (1.0 - std::min(100.0, equity) / 100.0));
            filler.fill(config.loan_principal, std::max(0.0, loan), "loan.principal");
        }
    }

    filler.fill(config.interest_rate, suggested_interest_rate(config.structure), "loan.interest_rate");
    filler.fill(config.loan_term_years,
                suggested_loan_term(config.structure, config.building_age),
                "loan.term_years");
}

void fill_property_tax(Configuration& config, Filler& filler) {
    PropertyTaxParams& pt = config.property_tax;
    filler.fill(pt.land_evaluation_rate, 70.0, "property_tax.land_evaluation_rate");
    filler.fill(pt.building_evaluation_rate, 50.0, "property_tax.building_evaluation_rate");
    filler.fill(pt.land_reduction_rate, 16.67, "property_tax.land_reduction_rate");
    filler.fill(pt.tax_rate, 1.7, "property_tax.tax_rate");
    filler.fill(pt.new_build_relief_years, suggested_new_build_relief_years(config.structure),
                "property_tax.new_build_relief.years");
    filler.fill(pt.new_build_relief_rate, 50.0, "property_tax.new_build_relief.rate");
    filler.fill(pt.acquisition_tax_rate, 3.0, "property_tax.acquisition_tax_rate");
    filler.fill(pt.acquisition_land_reduction_rate, 50.0,
                "property_tax.acquisition_land_reduction_rate");
}

void fill_scenario(StressScenario& scenario, Filler& filler) {
    filler.fill(scenario.interest_shock.year, 5, "scenario.interest_shock.year");
    filler.fill(scenario.interest_shock.delta, 1.0, "scenario.interest_shock.delta");

    if (scenario.rent_curve) {
        filler.fill(scenario.rent_curve->early_rate, 1.5, "scenario.rent_curve.early_rate");
        filler.fill(scenario.rent_curve->late_rate, 0.5, "scenario.rent_curve.late_rate");
        filler.fill(scenario.rent_curve->switch_year, 10, "scenario.rent_curve.switch_year");
    }
    if (scenario.occupancy_decline) {
        filler.fill(scenario.occupancy_decline->start_year, 10,
                    "scenario.occupancy_decline.start_year");
        filler.fill(scenario.occupancy_decline->delta, 5.0, "scenario.occupancy_decline.delta");
    }
}

void fill_exit(ExitStrategy& exit, Filler& filler) {
    filler.fill(exit.year, 10, "exit.year");
    filler.fill(exit.cap_rate, 7.0, "exit.cap_rate");
    filler.fill(exit.brokerage_rate, 3.0, "exit.brokerage_rate");
    filler.fill(exit.brokerage_fixed, 600000.0, "exit.brokerage_fixed");
    filler.fill(exit.other_cost_rate, 1.0, "exit.other_cost_rate");
    filler.fill(exit.short_term_tax_rate, 39.0, "exit.short_term_tax_rate");
    filler.fill(exit.long_term_tax_rate, 20.0, "exit.long_term_tax_rate");
    filler.fill(exit.discount_rate, 4.0, "exit.discount_rate");
}

} // anonymous namespace

bool is_missing(double value) {
    return !std::isfinite(value) || value <= 0.0;
}

// ============================================================================
// Structure/age heuristics
// ============================================================================

double suggested_building_ratio(StructureType structure, int building_age) {
    const int age = std::max(0, building_age);
    const auto row = building_ratio_row(structure);
    for (size_t i = 0; i < BUILDING_RATIO_AGE_LIMITS.size(); ++i) {
        if (age <= BUILDING_RATIO_AGE_LIMITS[i]) {
            return row[i];
        }
    }
    return row.back();
}

double suggested_interest_rate(StructureType structure) {
    switch (structure) {
        case StructureType::RC: return 1.6;
        case StructureType::SRC: return 1.6;
        case StructureType::HeavySteel: return 1.8;
        case StructureType::LightSteel: return 2.0;
        case StructureType::Wood: return 2.2;
    }
    return 1.6;
}

int suggested_loan_term(StructureType structure, int building_age) {
    const int age = std::max(0, building_age);
    const int remaining = std::max(0, legal_useful_life(structure) - age);
    int term = remaining + loan_term_bonus(structure);
    if (structure == StructureType::Wood && age <= 10) {
        term = std::max(term, MAX_LOAN_TERM);
    }
    return std::min(MAX_LOAN_TERM, std::max(MIN_LOAN_TERM, term));
}

double suggested_occupancy_rate(int building_age) {
    const int age = std::max(0, building_age);
    if (age <= 10) return 95.0;
    if (age <= 20) return 90.0;
    if (age <= 30) return 85.0;
    return 80.0;
}

int suggested_new_build_relief_years(StructureType structure) {
    return (structure == StructureType::RC || structure == StructureType::SRC) ? 5 : 3;
}

double suggested_operating_expense_rate(StructureType structure, int unit_count, int building_age) {
    return oer_rate_for_age(infer_oer_property_type(structure, unit_count), building_age);
}

// ============================================================================
// Defaulting
// ============================================================================

DefaultsReport apply_estimated_defaults_with_report(const Configuration& input) {
    DefaultsReport report;
    report.config = input;
    Configuration& config = report.config;
    Filler filler(report.filled_fields);

    filler.fill(config.building_ratio,
                suggested_building_ratio(config.structure, config.building_age),
                "property.building_ratio");
    filler.fill(config.cleaning_visits_per_month, 2.0, "property.cleaning_visits_per_month");

    fill_financing(config, filler);

    filler.fill(config.rent_decline_rate, 0.5, "income.rent_decline_rate");
    std::visit(OccupancyDefaults{filler, suggested_occupancy_rate(config.building_age)},
               config.occupancy);
    std::visit(VacancyDefaults{filler}, config.vacancy);

    std::visit(ExpenseDefaults{filler, config}, config.expenses);

    AcquisitionCostRates& costs = config.acquisition_costs;
    filler.fill(costs.water_contribution, 0.2, "acquisition_costs.water_contribution");
    filler.fill(costs.fire_insurance, 0.4, "acquisition_costs.fire_insurance");
    filler.fill(costs.loan_fee, 2.2, "acquisition_costs.loan_fee");
    filler.fill(costs.registration, 1.2, "acquisition_costs.registration");

    fill_property_tax(config, filler);

    filler.fill(config.equipment.ratio, 20.0, "depreciation.equipment_split.ratio");
    filler.fill(config.equipment.useful_life, 15, "depreciation.equipment_split.useful_life");

    std::visit(TaxDefaults{filler}, config.tax);

    if (config.scenario) {
        fill_scenario(*config.scenario, filler);
    }
    if (config.exit) {
        fill_exit(*config.exit, filler);
    }

    filler.fill(config.projection_years, Configuration::DEFAULT_YEARS, "projection.years");

    return report;
}

Configuration apply_estimated_defaults(const Configuration& config) {
    return apply_estimated_defaults_with_report(config).config;
}

} // namespace propcalc
