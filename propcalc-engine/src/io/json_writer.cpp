#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace propcalc {
namespace io {

namespace {

std::string escape_json(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// Streams nested objects/arrays, handling separators and indentation
class JsonEmitter {
public:
    JsonEmitter(std::ostream& os, bool pretty) : os_(os), pretty_(pretty) {
        os_ << std::fixed << std::setprecision(6);
    }

    void begin_object(const char* key = nullptr) {
        prefix(key);
        os_ << "{";
        first_.push_back(true);
    }

    void end_object() {
        close("}");
    }

    void begin_array(const char* key = nullptr) {
        prefix(key);
        os_ << "[";
        first_.push_back(true);
    }

    void end_array() {
        close("]");
    }

    void field(const char* key, double value) {
        prefix(key);
        write_number(value);
    }

    void field(const char* key, int value) {
        prefix(key);
        os_ << value;
    }

    void field(const char* key, bool value) {
        prefix(key);
        os_ << (value ? "true" : "false");
    }

    void field(const char* key, const std::string& value) {
        prefix(key);
        os_ << "\"" << escape_json(value) << "\"";
    }

    void field(const char* key, const char* value) {
        field(key, std::string(value));
    }

    void field(const char* key, const std::optional<double>& value) {
        if (value) {
            field(key, *value);
        } else {
            null_field(key);
        }
    }

    void field(const char* key, const std::optional<int>& value) {
        if (value) {
            field(key, *value);
        } else {
            null_field(key);
        }
    }

    void null_field(const char* key) {
        prefix(key);
        os_ << "null";
    }

    void value(double v) {
        prefix(nullptr);
        write_number(v);
    }

    void value(int v) {
        prefix(nullptr);
        os_ << v;
    }

    void value(const std::string& v) {
        prefix(nullptr);
        os_ << "\"" << escape_json(v) << "\"";
    }

    void finish() {
        if (pretty_) {
            os_ << "\n";
        }
    }

private:
    void prefix(const char* key) {
        if (!first_.empty()) {
            if (!first_.back()) {
                os_ << ",";
            }
            first_.back() = false;
            newline();
        }
        if (key) {
            os_ << "\"" << escape_json(key) << "\":" << (pretty_ ? " " : "");
        }
    }

    void close(const char* bracket) {
        const bool empty = first_.back();
        first_.pop_back();
        if (!empty) {
            newline();
        }
        os_ << bracket;
    }

    void newline() {
        if (!pretty_) return;
        os_ << "\n";
        for (size_t i = 0; i < first_.size(); ++i) {
            os_ << "  ";
        }
    }

    void write_number(double v) {
        if (std::isfinite(v)) {
            os_ << v;
        } else {
            os_ << "null";
        }
    }

    std::ostream& os_;
    bool pretty_;
    std::vector<bool> first_;
};

void write_yearly_result(JsonEmitter& out, const YearlyResult& r) {
    out.begin_object();
    out.field("year", r.year);
    out.field("gross_potential_rent", r.gross_potential_rent);
    out.field("occupancy_rate", r.occupancy_rate);
    out.field("effective_income", r.effective_income);
    out.field("operating_expense", r.operating_expense);
    out.field("repair_cost", r.repair_cost);
    out.field("property_tax", r.property_tax);
    out.field("acquisition_tax", r.acquisition_tax);
    out.field("noi", r.noi);
    out.field("interest", r.interest);
    out.field("principal", r.principal);
    out.field("debt_service", r.debt_service);
    out.field("loan_balance", r.loan_balance);
    out.field("depreciation_building", r.depreciation_building);
    out.field("depreciation_equipment", r.depreciation_equipment);
    out.field("depreciation", r.depreciation);
    out.field("cumulative_depreciation", r.cumulative_depreciation);
    out.field("taxable_income", r.taxable_income);
    out.field("income_tax", r.income_tax);
    out.field("cash_flow_pre_tax", r.cash_flow_pre_tax);
    out.field("cash_flow_post_tax", r.cash_flow_post_tax);
    out.field("dscr", r.dscr);
    out.field("principal_exceeds_depreciation", r.principal_exceeds_depreciation);
    out.end_object();
}

void write_series(JsonEmitter& out, const char* key,
                  const std::vector<YearlyResult>& results,
                  const SeriesSummary& summary) {
    out.begin_object(key);

    out.begin_object("summary");
    out.field("total_cash_flow", summary.total_cash_flow);
    out.field("min_cash_flow", summary.min_cash_flow);
    out.field("min_cash_flow_year", summary.min_cash_flow_year);
    out.field("min_dscr", summary.min_dscr);
    out.field("dead_cross_year", summary.dead_cross_year);
    out.begin_array("principal_exceeds_depreciation_years");
    for (int year : summary.principal_exceeds_depreciation_years) {
        out.value(year);
    }
    out.end_array();
    out.end_object();

    out.begin_array("years");
    for (const auto& r : results) {
        write_yearly_result(out, r);
    }
    out.end_array();

    out.end_object();
}

void write_exit(JsonEmitter& out, const char* key, const std::optional<ExitSummary>& exit) {
    if (!exit) {
        out.null_field(key);
        return;
    }
    out.begin_object(key);
    out.field("exit_year", exit->exit_year);
    out.field("noi", exit->noi);
    out.field("sale_price", exit->sale_price);
    out.field("brokerage_cost", exit->brokerage_cost);
    out.field("other_costs", exit->other_costs);
    out.field("transaction_costs", exit->transaction_costs);
    out.field("book_value", exit->book_value);
    out.field("capital_gain", exit->capital_gain);
    out.field("capital_gains_tax_rate", exit->capital_gains_tax_rate);
    out.field("capital_gains_tax", exit->capital_gains_tax);
    out.field("loan_balance", exit->loan_balance);
    out.field("net_proceeds", exit->net_proceeds);
    out.field("npv", exit->npv);
    out.field("irr", exit->irr);
    out.field("equity_multiple", exit->equity_multiple);
    out.begin_array("cash_flows");
    for (double cf : exit->cash_flows) {
        out.value(cf);
    }
    out.end_array();
    out.end_object();
}

void write_strings(JsonEmitter& out, const char* key, const std::vector<std::string>& values) {
    out.begin_array(key);
    for (const auto& v : values) {
        out.value(v);
    }
    out.end_array();
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const RunNotes& notes, bool pretty_print) {
    JsonEmitter out(os, pretty_print);
    out.begin_object();

    out.field("projection_years", static_cast<int>(result.baseline.size()));
    out.field("dead_cross_year", result.dead_cross_year);

    const AcquisitionCosts& acq = result.acquisition;
    out.begin_object("acquisition");
    out.field("price", result.config.price);
    out.field("building_price", result.config.building_price());
    out.field("land_price", result.config.land_price());
    out.field("loan_principal", result.config.loan_principal);
    out.field("misc", acq.misc);
    out.field("water_contribution", acq.water_contribution);
    out.field("fire_insurance", acq.fire_insurance);
    out.field("loan_fee", acq.loan_fee);
    out.field("registration", acq.registration);
    out.field("initial_costs", acq.initial_costs);
    out.field("total_price", acq.total_price);
    out.field("equity", acq.equity);
    out.end_object();

    const InvestmentMetrics& m = result.metrics;
    out.begin_object("metrics");
    out.field("gross_yield", m.gross_yield);
    out.field("noi_yield", m.noi_yield);
    out.field("yield_gap", m.yield_gap);
    out.field("cash_on_cash_pre_tax", m.cash_on_cash_pre_tax);
    out.field("cash_on_cash_post_tax", m.cash_on_cash_post_tax);
    out.field("repayment_ratio", m.repayment_ratio);
    out.field("break_even_ratio", m.break_even_ratio);
    out.field("dscr", m.dscr);
    out.field("dscr_rate_sensitivity", m.dscr_rate_sensitivity);
    out.end_object();

    write_series(out, "baseline", result.baseline, result.baseline_summary);
    if (result.scenario && result.scenario_summary) {
        write_series(out, "scenario", *result.scenario, *result.scenario_summary);
    } else {
        out.null_field("scenario");
    }

    write_exit(out, "exit", result.exit);
    write_exit(out, "scenario_exit", result.scenario_exit);

    write_strings(out, "warnings", notes.warnings);
    write_strings(out, "defaults_applied", notes.defaults_applied);

    out.end_object();
    out.finish();
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const RunNotes& notes, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, notes, pretty_print);
}

} // namespace io
} // namespace propcalc
