#ifndef PROPCALC_IO_JSON_WRITER_HPP
#define PROPCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../simulation.hpp"

namespace propcalc {
namespace io {

// Messages about the run that travel with the results
struct RunNotes {
    std::vector<std::string> warnings;          // Ungathered configuration fields
    std::vector<std::string> defaults_applied;  // Fields filled by estimation
};

// Write SimulationResult to JSON format.
// Top-level keys: acquisition, metrics, baseline, scenario, exit,
// scenario_exit, dead_cross_year, warnings, defaults_applied. Absent
// optional parts are written as null; so are non-finite numbers.
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  const RunNotes& notes = RunNotes(),
                                  bool pretty_print = true);

// Write SimulationResult to JSON file
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  const RunNotes& notes = RunNotes(),
                                  bool pretty_print = true);

} // namespace io
} // namespace propcalc

#endif // PROPCALC_IO_JSON_WRITER_HPP
