#ifndef PROPCALC_IO_CONFIG_LOADER_HPP
#define PROPCALC_IO_CONFIG_LOADER_HPP

#include "../config.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace propcalc {
namespace io {

/**
 * @brief Exception thrown when a configuration file cannot be used at all
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parsed configuration plus the fields that could not be gathered
 *
 * A field with the wrong JSON type or an unknown enum name is reported in
 * warnings and left at its missing value, so defaulting can fill it. Keys
 * that no section reads are reported as unrecognized.
 */
struct LoadedConfiguration {
    Configuration config;
    std::vector<std::string> warnings;
};

/**
 * @brief Parses a property configuration from a JSON string
 *
 * Sections: property, loan, income, expenses, repair_events,
 * acquisition_costs, property_tax, depreciation, tax, scenario, exit,
 * projection. Every section and field is optional.
 *
 * @param json_string JSON configuration as string
 * @return Configuration and non-fatal warnings
 * @throws ConfigParseError if the text is not JSON or the root is not an object
 */
LoadedConfiguration load_configuration_from_string(const std::string& json_string);

/**
 * @brief Parses a property configuration from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or is not valid JSON
 */
LoadedConfiguration load_configuration_from_file(const std::string& file_path);

} // namespace io
} // namespace propcalc

#endif // PROPCALC_IO_CONFIG_LOADER_HPP
