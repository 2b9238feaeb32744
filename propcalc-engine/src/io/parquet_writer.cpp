#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace propcalc {
namespace io {

#ifdef HAVE_ARROW

namespace {

struct AmountColumn {
    const char* name;
    double YearlyResult::*member;
};

const AmountColumn AMOUNT_COLUMNS[] = {
    {"gross_potential_rent", &YearlyResult::gross_potential_rent},
    {"occupancy_rate", &YearlyResult::occupancy_rate},
    {"effective_income", &YearlyResult::effective_income},
    {"operating_expense", &YearlyResult::operating_expense},
    {"repair_cost", &YearlyResult::repair_cost},
    {"property_tax", &YearlyResult::property_tax},
    {"acquisition_tax", &YearlyResult::acquisition_tax},
    {"noi", &YearlyResult::noi},
    {"interest", &YearlyResult::interest},
    {"principal", &YearlyResult::principal},
    {"debt_service", &YearlyResult::debt_service},
    {"loan_balance", &YearlyResult::loan_balance},
    {"depreciation_building", &YearlyResult::depreciation_building},
    {"depreciation_equipment", &YearlyResult::depreciation_equipment},
    {"depreciation", &YearlyResult::depreciation},
    {"cumulative_depreciation", &YearlyResult::cumulative_depreciation},
    {"taxable_income", &YearlyResult::taxable_income},
    {"income_tax", &YearlyResult::income_tax},
    {"cash_flow_pre_tax", &YearlyResult::cash_flow_pre_tax},
    {"cash_flow_post_tax", &YearlyResult::cash_flow_post_tax},
};

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

void ParquetWriter::write_series(const std::vector<YearlyResult>& results,
                                 const std::string& series_name,
                                 const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("No yearly results to write to " + filepath);
    }

    const int64_t rows = static_cast<int64_t>(results.size());
    arrow::FieldVector fields;
    arrow::ArrayVector columns;

    // series, year
    arrow::StringBuilder series_builder;
    arrow::Int32Builder year_builder;
    check(series_builder.Reserve(rows), "reserve memory for series column");
    check(year_builder.Reserve(rows), "reserve memory for year column");
    for (const auto& r : results) {
        check(series_builder.Append(series_name), "append series");
        check(year_builder.Append(r.year), "append year");
    }

    std::shared_ptr<arrow::Array> series_array;
    check(series_builder.Finish(&series_array), "finish series array");
    fields.push_back(arrow::field("series", arrow::utf8()));
    columns.push_back(series_array);

    std::shared_ptr<arrow::Array> year_array;
    check(year_builder.Finish(&year_array), "finish year array");
    fields.push_back(arrow::field("year", arrow::int32()));
    columns.push_back(year_array);

    // Amount columns
    for (const auto& column : AMOUNT_COLUMNS) {
        arrow::DoubleBuilder builder;
        check(builder.Reserve(rows), std::string("reserve memory for ") + column.name + " column");
        for (const auto& r : results) {
            check(builder.Append(r.*column.member), std::string("append ") + column.name);
        }
        std::shared_ptr<arrow::Array> array;
        check(builder.Finish(&array), std::string("finish ") + column.name + " array");
        fields.push_back(arrow::field(column.name, arrow::float64()));
        columns.push_back(array);
    }

    // dscr is nullable
    arrow::DoubleBuilder dscr_builder;
    arrow::BooleanBuilder flag_builder;
    check(dscr_builder.Reserve(rows), "reserve memory for dscr column");
    check(flag_builder.Reserve(rows), "reserve memory for principal_exceeds_depreciation column");
    for (const auto& r : results) {
        if (r.dscr) {
            check(dscr_builder.Append(*r.dscr), "append dscr");
        } else {
            check(dscr_builder.AppendNull(), "append dscr");
        }
        check(flag_builder.Append(r.principal_exceeds_depreciation),
              "append principal_exceeds_depreciation");
    }

    std::shared_ptr<arrow::Array> dscr_array;
    check(dscr_builder.Finish(&dscr_array), "finish dscr array");
    fields.push_back(arrow::field("dscr", arrow::float64(), true));
    columns.push_back(dscr_array);

    std::shared_ptr<arrow::Array> flag_array;
    check(flag_builder.Finish(&flag_array), "finish principal_exceeds_depreciation array");
    fields.push_back(arrow::field("principal_exceeds_depreciation", arrow::boolean()));
    columns.push_back(flag_array);

    auto table = arrow::Table::Make(arrow::schema(fields), columns);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_series(const std::vector<YearlyResult>& /* results */,
                                 const std::string& /* series_name */,
                                 const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace propcalc
