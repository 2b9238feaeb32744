#include "config_loader.hpp"
#include "../operating_expense.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace propcalc {
namespace io {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Reads typed fields from one JSON object, reporting type mismatches as
// warnings under the field's dotted path
class SectionReader {
public:
    SectionReader(const json& node, std::string path, std::vector<std::string>& warnings)
        : node_(node), path_(std::move(path)), warnings_(warnings) {}

    bool has(const char* key) const {
        read_keys_.insert(key);
        return node_.contains(key) && !node_.at(key).is_null();
    }

    std::string path(const char* key) const {
        return path_.empty() ? std::string(key) : path_ + "." + key;
    }

    void warn(const std::string& field, const std::string& problem) const {
        warnings_.push_back("Field '" + field + "' ungathered: " + problem);
    }

    void read(const char* key, double& out) const {
        if (!has(key)) return;
        const json& value = node_.at(key);
        if (!value.is_number()) {
            warn(path(key), "expected number");
            return;
        }
        out = value.get<double>();
    }

    void read(const char* key, int& out) const {
        if (!has(key)) return;
        const json& value = node_.at(key);
        if (!value.is_number()) {
            warn(path(key), "expected number");
            return;
        }
        const double number = value.get<double>();
        if (!std::isfinite(number) || std::abs(number) > 1e9) {
            warn(path(key), "out of range");
            return;
        }
        out = static_cast<int>(std::lround(number));
    }

    void read(const char* key, bool& out) const {
        if (!has(key)) return;
        const json& value = node_.at(key);
        if (!value.is_boolean()) {
            warn(path(key), "expected true or false");
            return;
        }
        out = value.get<bool>();
    }

    void read(const char* key, std::string& out) const {
        if (!has(key)) return;
        const json& value = node_.at(key);
        if (!value.is_string()) {
            warn(path(key), "expected string");
            return;
        }
        out = value.get<std::string>();
    }

    // Parse a named enum with the given parser; unknown names are warnings
    template <typename T, typename Parser>
    bool read_enum(const char* key, T& out, Parser parse) const {
        std::string name;
        const size_t before = warnings_.size();
        read(key, name);
        if (name.empty() || warnings_.size() != before) {
            return false;
        }
        try {
            out = parse(name);
            return true;
        } catch (const std::invalid_argument& e) {
            warn(path(key), e.what());
            return false;
        }
    }

    std::optional<SectionReader> child(const char* key) const {
        if (!has(key)) return std::nullopt;
        const json& value = node_.at(key);
        if (!value.is_object()) {
            warn(path(key), "expected object");
            return std::nullopt;
        }
        return SectionReader(value, path(key), warnings_);
    }

    const json* array(const char* key) const {
        if (!has(key)) return nullptr;
        const json& value = node_.at(key);
        if (!value.is_array()) {
            warn(path(key), "expected array");
            return nullptr;
        }
        return &value;
    }

    const json& node() const { return node_; }
    std::vector<std::string>& warnings() const { return warnings_; }

    // Section toggled on: present, and "enabled" is not false
    bool enabled() const {
        bool on = true;
        read("enabled", on);
        return on;
    }

    // Warn about every key of this object that no parser asked for
    void report_unread() const {
        for (auto it = node_.begin(); it != node_.end(); ++it) {
            if (read_keys_.count(it.key()) == 0) {
                warn(path(it.key().c_str()), "unrecognized field");
            }
        }
    }

private:
    const json& node_;
    std::string path_;
    std::vector<std::string>& warnings_;
    mutable std::set<std::string> read_keys_;
};

// ============================================================================
// Section parsers
// ============================================================================

void parse_property(const SectionReader& s, Configuration& config) {
    s.read("price", config.price);
    s.read("building_ratio", config.building_ratio);
    s.read_enum("structure", config.structure, parse_structure);
    s.read("building_age", config.building_age);
    s.read("unit_count", config.unit_count);
    s.read("cleaning_visits_per_month", config.cleaning_visits_per_month);
    s.report_unread();
}

void parse_loan(const SectionReader& s, Configuration& config) {
    s.read("principal", config.loan_principal);
    s.read("equity_ratio", config.equity_ratio);
    s.read("interest_rate", config.interest_rate);
    s.read("term_years", config.loan_term_years);
    s.report_unread();
}

void parse_occupancy(const SectionReader& income, Configuration& config) {
    if (!income.has("occupancy")) return;

    // Shorthand: a bare number is a flat rate
    if (income.node().at("occupancy").is_number()) {
        FlatOccupancy flat;
        income.read("occupancy", flat.rate);
        config.occupancy = flat;
        return;
    }

    auto s = income.child("occupancy");
    if (!s) return;

    std::string mode = "flat";
    s->read("mode", mode);
    mode = to_lower(mode);

    if (mode == "age_banded") {
        AgeBandedOccupancy banded;
        s->read("rate", banded.base_rate);
        if (const json* bands = s->array("band_rates")) {
            if (bands->size() != AgeBandedOccupancy::NUM_BANDS) {
                s->warn(s->path("band_rates"), "expected 5 values");
            } else {
                for (size_t i = 0; i < AgeBandedOccupancy::NUM_BANDS; ++i) {
                    const json& value = (*bands)[i];
                    if (value.is_number()) {
                        banded.band_rates[i] = value.get<double>();
                    } else if (!value.is_null()) {
                        s->warn(s->path("band_rates") + "[" + std::to_string(i) + "]",
                                "expected number");
                    }
                }
            }
        }
        s->report_unread();
        config.occupancy = banded;
        return;
    }

    if (mode != "flat") {
        s->warn(s->path("mode"), "unknown occupancy mode '" + mode + "'");
    }
    FlatOccupancy flat;
    s->read("rate", flat.rate);
    s->report_unread();
    config.occupancy = flat;
}

void parse_vacancy(const SectionReader& income, Configuration& config) {
    auto s = income.child("vacancy");
    if (!s) return;

    std::string model = "fixed";
    s->read("model", model);
    model = to_lower(model);

    if (model == "cyclic") {
        CyclicVacancy cyclic;
        s->read("cycle_years", cyclic.cycle_years);
        s->read("vacancy_months", cyclic.vacancy_months);
        config.vacancy = cyclic;
    } else if (model == "probabilistic") {
        ProbabilisticVacancy probabilistic;
        s->read("probability", probabilistic.probability);
        s->read("vacancy_months", probabilistic.vacancy_months);
        config.vacancy = probabilistic;
    } else {
        if (model != "fixed") {
            s->warn(s->path("model"), "unknown vacancy model '" + model + "'");
        }
        config.vacancy = FixedVacancy{};
    }
    s->report_unread();
}

void parse_income(const SectionReader& s, Configuration& config) {
    s.read("monthly_rent", config.monthly_rent);
    s.read("rent_decline_rate", config.rent_decline_rate);
    parse_occupancy(s, config);
    parse_vacancy(s, config);
    s.report_unread();
}

ExpenseBase parse_expense_base(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "gpr") return ExpenseBase::GPR;
    if (lower == "egi") return ExpenseBase::EGI;
    throw std::invalid_argument("Unknown expense base: " + name);
}

EventMode parse_event_mode(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "reserve") return EventMode::Reserve;
    if (lower == "cash") return EventMode::Cash;
    throw std::invalid_argument("Unknown event mode: " + name);
}

// Visit each object element of an array field, warning on anything else
template <typename Fn>
void for_each_object(const SectionReader& s, const char* key, Fn fn) {
    const json* items = s.array(key);
    if (!items) return;
    for (size_t i = 0; i < items->size(); ++i) {
        const std::string item_path = s.path(key) + "[" + std::to_string(i) + "]";
        const json& item = (*items)[i];
        if (!item.is_object()) {
            s.warn(item_path, "expected object");
            continue;
        }
        const SectionReader reader(item, item_path, s.warnings());
        fn(reader);
        reader.report_unread();
    }
}

DetailedExpensePolicy parse_detailed_expenses(const SectionReader& s, const Configuration& config) {
    DetailedExpensePolicy policy;

    if (s.has("preset")) {
        OerPropertyType type = infer_oer_property_type(config.structure, config.unit_count);
        std::string preset;
        s.read("preset", preset);
        if (!preset.empty() && to_lower(preset) != "auto") {
            s.read_enum("preset", type, parse_oer_property_type);
        }
        policy = build_detailed_preset(type, config.building_age);
    }

    if (s.has("rate_items")) {
        policy.rate_items.clear();
        for_each_object(s, "rate_items", [&](const SectionReader& item) {
            RateExpenseItem rate_item;
            item.read("id", rate_item.id);
            item.read("label", rate_item.label);
            item.read("rate", rate_item.rate);
            item.read_enum("base", rate_item.base, parse_expense_base);
            item.read("enabled", rate_item.enabled);
            policy.rate_items.push_back(rate_item);
        });
    }

    for_each_object(s, "fixed_items", [&](const SectionReader& item) {
        FixedExpenseItem fixed_item;
        item.read("id", fixed_item.id);
        item.read("label", fixed_item.label);
        item.read("annual_amount", fixed_item.annual_amount);
        item.read("enabled", fixed_item.enabled);
        policy.fixed_items.push_back(fixed_item);
    });

    for_each_object(s, "event_items", [&](const SectionReader& item) {
        EventExpenseItem event_item;
        item.read("id", event_item.id);
        item.read("label", event_item.label);
        item.read("amount", event_item.amount);
        item.read("interval_years", event_item.interval_years);
        item.read("start_year", event_item.start_year);
        item.read_enum("mode", event_item.mode, parse_event_mode);
        item.read("enabled", event_item.enabled);
        policy.event_items.push_back(event_item);
    });

    if (auto leasing = s.child("leasing")) {
        leasing->read("enabled", policy.leasing.enabled);
        leasing->read("marketing_months", policy.leasing.marketing_months);
        leasing->read("average_tenancy_years", policy.leasing.average_tenancy_years);
        leasing->report_unread();
    }

    return policy;
}

void parse_expenses(const SectionReader& s, Configuration& config) {
    std::string mode = "simple";
    s.read("mode", mode);
    mode = to_lower(mode);

    if (mode == "detailed") {
        config.expenses = parse_detailed_expenses(s, config);
        s.report_unread();
        return;
    }

    if (mode != "simple") {
        s.warn(s.path("mode"), "unknown expense mode '" + mode + "'");
    }
    SimpleExpensePolicy simple;
    s.read("rate", simple.rate);
    OerPropertyType type = OerPropertyType::RcApartment;
    if (s.read_enum("template", type, parse_oer_property_type)) {
        simple.tracked_template = type;
    }
    s.report_unread();
    config.expenses = simple;
}

void parse_repair_events(const SectionReader& root, Configuration& config) {
    for_each_object(root, "repair_events", [&](const SectionReader& item) {
        RepairEvent event;
        item.read("year", event.year);
        item.read("amount", event.amount);
        item.read("label", event.label);
        config.repair_events.push_back(event);
    });
}

void parse_acquisition_costs(const SectionReader& s, Configuration& config) {
    AcquisitionCostRates& costs = config.acquisition_costs;
    s.read("misc", costs.misc);
    s.read("water_contribution", costs.water_contribution);
    s.read("fire_insurance", costs.fire_insurance);
    s.read("loan_fee", costs.loan_fee);
    s.read("registration", costs.registration);
    s.report_unread();
}

AcquisitionTaxTiming parse_acquisition_tax_timing(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "first_year") return AcquisitionTaxTiming::FirstYear;
    if (lower == "following_year") return AcquisitionTaxTiming::FollowingYear;
    throw std::invalid_argument("Unknown acquisition tax timing: " + name);
}

void parse_property_tax(const SectionReader& s, Configuration& config) {
    PropertyTaxParams& pt = config.property_tax;
    s.read("land_evaluation_rate", pt.land_evaluation_rate);
    s.read("building_evaluation_rate", pt.building_evaluation_rate);
    s.read("land_reduction_rate", pt.land_reduction_rate);
    s.read("tax_rate", pt.tax_rate);
    s.read("acquisition_tax_rate", pt.acquisition_tax_rate);
    s.read("acquisition_land_reduction_rate", pt.acquisition_land_reduction_rate);
    s.read_enum("acquisition_tax_timing", pt.acquisition_tax_timing, parse_acquisition_tax_timing);

    if (auto relief = s.child("new_build_relief")) {
        pt.new_build_relief_enabled = true;
        relief->read("enabled", pt.new_build_relief_enabled);
        relief->read("years", pt.new_build_relief_years);
        relief->read("rate", pt.new_build_relief_rate);
        relief->report_unread();
    }
    s.report_unread();
}

void parse_depreciation(const SectionReader& s, Configuration& config) {
    if (auto split = s.child("equipment_split")) {
        config.equipment.enabled = true;
        split->read("enabled", config.equipment.enabled);
        split->read("ratio", config.equipment.ratio);
        split->read("useful_life", config.equipment.useful_life);
        split->report_unread();
    }
    s.report_unread();
}

void parse_tax(const SectionReader& s, Configuration& config) {
    std::string regime = "individual";
    s.read("regime", regime);
    regime = to_lower(regime);

    if (regime == "corporate") {
        CorporateTax corporate;
        s.read("rate", corporate.rate);
        s.read("reduced_rate", corporate.reduced_rate);
        s.read("reduced_rate_threshold", corporate.reduced_rate_threshold);
        s.read("minimum_tax", corporate.minimum_tax);
        s.report_unread();
        config.tax = corporate;
        return;
    }

    if (regime != "individual") {
        s.warn(s.path("regime"), "unknown tax regime '" + regime + "'");
    }
    IndividualTax individual;
    s.read("other_income", individual.other_income);
    s.read("resident_tax_rate", individual.resident_tax_rate);
    s.report_unread();
    config.tax = individual;
}

void parse_scenario(const SectionReader& s, Configuration& config) {
    if (!s.enabled()) return;

    StressScenario scenario;
    if (auto shock = s.child("interest_shock")) {
        shock->read("year", scenario.interest_shock.year);
        shock->read("delta", scenario.interest_shock.delta);
        shock->report_unread();
    }
    if (auto curve = s.child("rent_curve")) {
        if (curve->enabled()) {
            RentCurveOverride rent_curve;
            curve->read("early_rate", rent_curve.early_rate);
            curve->read("late_rate", rent_curve.late_rate);
            curve->read("switch_year", rent_curve.switch_year);
            curve->report_unread();
            scenario.rent_curve = rent_curve;
        }
    }
    if (auto decline = s.child("occupancy_decline")) {
        if (decline->enabled()) {
            OccupancyDecline occupancy_decline;
            decline->read("start_year", occupancy_decline.start_year);
            decline->read("delta", occupancy_decline.delta);
            decline->report_unread();
            scenario.occupancy_decline = occupancy_decline;
        }
    }
    s.report_unread();
    config.scenario = scenario;
}

void parse_exit(const SectionReader& s, Configuration& config) {
    if (!s.enabled()) return;

    ExitStrategy exit;
    s.read("year", exit.year);
    s.read("cap_rate", exit.cap_rate);
    s.read("brokerage_rate", exit.brokerage_rate);
    s.read("brokerage_fixed", exit.brokerage_fixed);
    s.read("other_cost_rate", exit.other_cost_rate);
    s.read("short_term_tax_rate", exit.short_term_tax_rate);
    s.read("long_term_tax_rate", exit.long_term_tax_rate);
    s.read("discount_rate", exit.discount_rate);
    s.report_unread();
    config.exit = exit;
}

} // anonymous namespace

LoadedConfiguration load_configuration_from_string(const std::string& json_string) {
    LoadedConfiguration loaded;

    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ConfigParseError("Configuration root must be a JSON object");
    }

    Configuration& config = loaded.config;
    SectionReader root(j, "", loaded.warnings);

    // Property first: detailed expense presets depend on it
    if (auto s = root.child("property")) parse_property(*s, config);
    if (auto s = root.child("loan")) parse_loan(*s, config);
    if (auto s = root.child("income")) parse_income(*s, config);
    if (auto s = root.child("expenses")) parse_expenses(*s, config);
    parse_repair_events(root, config);
    if (auto s = root.child("acquisition_costs")) parse_acquisition_costs(*s, config);
    if (auto s = root.child("property_tax")) parse_property_tax(*s, config);
    if (auto s = root.child("depreciation")) parse_depreciation(*s, config);
    if (auto s = root.child("tax")) parse_tax(*s, config);
    if (auto s = root.child("scenario")) parse_scenario(*s, config);
    if (auto s = root.child("exit")) parse_exit(*s, config);
    if (auto s = root.child("projection")) {
        s->read("years", config.projection_years);
        s->report_unread();
    }
    root.report_unread();

    return loaded;
}

LoadedConfiguration load_configuration_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load_configuration_from_string(buffer.str());
}

} // namespace io
} // namespace propcalc
