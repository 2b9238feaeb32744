#ifndef PROPCALC_PARQUET_WRITER_HPP
#define PROPCALC_PARQUET_WRITER_HPP

#include "../projection.hpp"
#include <string>
#include <vector>

namespace propcalc {
namespace io {

class ParquetWriter {
public:
    /**
     * Write a yearly series to a Parquet file, one row per simulated year.
     *
     * Output schema:
     *   - series: utf8 ("baseline" or "scenario")
     *   - year: int32 (1-based)
     *   - one float64 column per YearlyResult amount
     *   - dscr: float64, null in years without debt service
     *   - principal_exceeds_depreciation: bool
     *
     * @param results Yearly results to export
     * @param series_name Label written into the series column
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the series is empty or the file cannot be written
     */
    static void write_series(const std::vector<YearlyResult>& results,
                             const std::string& series_name,
                             const std::string& filepath);
};

} // namespace io
} // namespace propcalc

#endif // PROPCALC_PARQUET_WRITER_HPP
