#ifndef PROPCALC_CONFIG_HPP
#define PROPCALC_CONFIG_HPP

#include "structure.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace propcalc {

// All amounts are base currency (yen). All rates are percentages (0-100).

// ============================================================================
// Occupancy
// ============================================================================

struct FlatOccupancy {
    double rate = 0.0;
};

// Five age bands, keyed by building age at the simulated year:
// 0-2, 3-10, 11-20, 21-30, 31+
struct AgeBandedOccupancy {
    static constexpr size_t NUM_BANDS = 5;

    double base_rate = 0.0;                      // Fallback for bands left at 0
    std::array<double, NUM_BANDS> band_rates{};  // 0 = use base_rate
};

using OccupancyPolicy = std::variant<FlatOccupancy, AgeBandedOccupancy>;

// ============================================================================
// Vacancy models
// ============================================================================

struct FixedVacancy {};

// Every cycle_years the unit sits empty for vacancy_months
struct CyclicVacancy {
    int cycle_years = 0;
    double vacancy_months = 0.0;
};

// Expected vacancy each year: probability% x vacancy_months / 12
struct ProbabilisticVacancy {
    double probability = 0.0;
    double vacancy_months = 0.0;
};

using VacancyModel = std::variant<FixedVacancy, CyclicVacancy, ProbabilisticVacancy>;

// ============================================================================
// Operating expenses
// ============================================================================

enum class OerPropertyType : uint8_t {
    Unit = 0,             // Single condominium unit
    WoodApartment = 1,
    SteelApartment = 2,
    RcApartment = 3
};

enum class OerAgeBand : uint8_t {
    New = 0,   // up to 10 years
    Mid = 1,   // 11-20 years
    Old = 2    // over 20 years
};

enum class ExpenseBase : uint8_t {
    GPR = 0,
    EGI = 1
};

enum class EventMode : uint8_t {
    Reserve = 0,   // cost / interval booked every year
    Cash = 1       // full cost booked in the occurrence year
};

struct RateExpenseItem {
    std::string id;
    std::string label;
    double rate = 0.0;
    ExpenseBase base = ExpenseBase::GPR;
    bool enabled = true;
};

struct FixedExpenseItem {
    std::string id;
    std::string label;
    double annual_amount = 0.0;
    bool enabled = true;
};

struct EventExpenseItem {
    std::string id;
    std::string label;
    double amount = 0.0;
    int interval_years = 1;
    int start_year = 1;
    EventMode mode = EventMode::Reserve;
    bool enabled = true;
};

struct LeasingCost {
    bool enabled = true;
    double marketing_months = 0.0;        // Advertising/brokerage months per turnover
    double average_tenancy_years = 0.0;
};

// Single percentage of GPR. When tracked_template is set the rate follows the
// template curve as the building ages instead of staying fixed.
struct SimpleExpensePolicy {
    double rate = 0.0;
    std::optional<OerPropertyType> tracked_template;
};

struct DetailedExpensePolicy {
    std::vector<RateExpenseItem> rate_items;
    std::vector<FixedExpenseItem> fixed_items;
    std::vector<EventExpenseItem> event_items;
    LeasingCost leasing;
};

using ExpensePolicy = std::variant<SimpleExpensePolicy, DetailedExpensePolicy>;

struct RepairEvent {
    int year = 0;
    double amount = 0.0;
    std::string label;
};

// ============================================================================
// Acquisition, tax and depreciation parameters
// ============================================================================

struct AcquisitionCostRates {
    double misc = 0.0;                 // % of price
    double water_contribution = 0.0;   // % of price
    double fire_insurance = 0.0;       // % of building price
    double loan_fee = 0.0;             // % of loan principal
    double registration = 0.0;         // % of price
};

enum class AcquisitionTaxTiming : uint8_t {
    FirstYear = 0,
    FollowingYear = 1
};

struct PropertyTaxParams {
    double land_evaluation_rate = 0.0;        // Assessed land value as % of land price
    double building_evaluation_rate = 0.0;    // Assessed building value as % of building price
    double land_reduction_rate = 0.0;         // Residential land special reduction (e.g. 16.67)
    double tax_rate = 0.0;                    // Fixed asset + city planning tax
    bool new_build_relief_enabled = false;
    int new_build_relief_years = 0;
    double new_build_relief_rate = 0.0;       // Taxable share of building value during relief
    double acquisition_tax_rate = 0.0;
    double acquisition_land_reduction_rate = 0.0;
    AcquisitionTaxTiming acquisition_tax_timing = AcquisitionTaxTiming::FollowingYear;
};

struct EquipmentSplit {
    bool enabled = false;
    double ratio = 0.0;          // % of building price
    int useful_life = 0;
};

struct IndividualTax {
    double other_income = 0.0;          // Salary and other taxable income
    double resident_tax_rate = 0.0;
};

struct CorporateTax {
    double rate = 0.0;
    double reduced_rate = 0.0;              // Applies to income up to the threshold
    double reduced_rate_threshold = 0.0;
    double minimum_tax = 0.0;               // Charged every year regardless of profit
};

using TaxRegime = std::variant<IndividualTax, CorporateTax>;

// ============================================================================
// Stress scenario and exit
// ============================================================================

struct InterestShock {
    int year = 0;
    double delta = 0.0;     // Percentage points added from year onwards
};

struct RentCurveOverride {
    double early_rate = 0.0;    // Decline per 2 years before switch_year
    double late_rate = 0.0;     // Decline per 2 years after switch_year
    int switch_year = 0;
};

struct OccupancyDecline {
    int start_year = 0;
    double delta = 0.0;     // Percentage points subtracted from occupancy
};

struct StressScenario {
    InterestShock interest_shock;
    std::optional<RentCurveOverride> rent_curve;
    std::optional<OccupancyDecline> occupancy_decline;
};

struct ExitStrategy {
    int year = 0;
    double cap_rate = 0.0;
    double brokerage_rate = 0.0;
    double brokerage_fixed = 0.0;
    double other_cost_rate = 0.0;
    double short_term_tax_rate = 0.0;   // Holding period <= 5 years
    double long_term_tax_rate = 0.0;
    double discount_rate = 0.0;
};

// ============================================================================
// Configuration
// ============================================================================

// One immutable record per simulation run
struct Configuration {
    static constexpr int MAX_YEARS = 50;
    static constexpr int DEFAULT_YEARS = 35;

    // Property
    double price;                    // Acquisition price (building + land)
    double building_ratio;           // Building share of price
    StructureType structure;
    int building_age;                // Age at acquisition
    int unit_count;
    double cleaning_visits_per_month;

    // Financing
    double loan_principal;
    double equity_ratio;
    double interest_rate;
    int loan_term_years;

    // Income
    double monthly_rent;             // Full-occupancy rent
    double rent_decline_rate;        // Compounded every 2 years
    OccupancyPolicy occupancy;
    VacancyModel vacancy;

    // Expenses
    ExpensePolicy expenses;
    std::vector<RepairEvent> repair_events;

    AcquisitionCostRates acquisition_costs;
    PropertyTaxParams property_tax;
    EquipmentSplit equipment;
    TaxRegime tax;

    std::optional<StressScenario> scenario;
    std::optional<ExitStrategy> exit;

    int projection_years;

    Configuration();

    double building_price() const;
    double land_price() const;
};

// Clamp every field into its documented range. Never throws.
Configuration sanitize(const Configuration& config);

// Clamp a percentage into [0, 100]; non-finite values become 0
double clamp_percent(double value);

// Clamp an amount to >= 0; non-finite values become 0
double clamp_amount(double value);

std::string oer_property_type_to_string(OerPropertyType type);
OerPropertyType parse_oer_property_type(const std::string& name);

} // namespace propcalc

#endif // PROPCALC_CONFIG_HPP
