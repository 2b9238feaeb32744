#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "estimates.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "io/config_loader.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string config_path;
    std::string output_path = "-";          // "-" = stdout
    std::string parquet_path;
    std::string scenario_parquet_path;
    bool apply_defaults = true;
    bool compact = false;
    std::string log_level = "INFO";
    std::string log_file;
    std::string log_format = "json";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "PropCalc Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON property configuration\n";
    std::cerr << "  --no-defaults               Run the configuration as given, without estimated defaults\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Write JSON on a single line\n";
    std::cerr << "  --parquet <path>            Also write the baseline yearly series as Parquet\n";
    std::cerr << "  --scenario-parquet <path>   Also write the stressed yearly series as Parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Append log lines to a file as well as stderr\n";
    std::cerr << "  --log-format <format>       json or text (default: json)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config property.json --output result.json\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--parquet" && i + 1 < argc) {
            args.parquet_path = argv[++i];
        } else if (arg == "--scenario-parquet" && i + 1 < argc) {
            args.scenario_parquet_path = argv[++i];
        } else if (arg == "--no-defaults") {
            args.apply_defaults = false;
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-format" && i + 1 < argc) {
            args.log_format = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.log_format != "json" && args.log_format != "text") {
        std::cerr << "Error: --log-format must be json or text\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    propcalc::LoggerConfig log_config;
    log_config.min_level = propcalc::string_to_level(args.log_level);
    log_config.enable_json = args.log_format == "json";
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    propcalc::Logger::get_instance().configure(log_config);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    configure_logging(args);
    auto& logger = propcalc::Logger::get_instance();

    try {
        propcalc::io::LoadedConfiguration loaded =
            propcalc::io::load_configuration_from_file(args.config_path);

        propcalc::io::RunNotes notes;
        notes.warnings = loaded.warnings;
        for (const auto& warning : loaded.warnings) {
            logger.log_warning(warning);
        }

        propcalc::Configuration config = loaded.config;
        if (args.apply_defaults) {
            propcalc::DefaultsReport report = propcalc::apply_estimated_defaults_with_report(config);
            config = report.config;
            notes.defaults_applied = report.filled_fields;
            logger.log_defaults_applied(report.filled_fields);
        }

        logger.log_run_start(args.config_path, propcalc::sanitize(config).projection_years);

        auto start = std::chrono::high_resolution_clock::now();
        propcalc::SimulationResult result = propcalc::simulate(config);
        auto end = std::chrono::high_resolution_clock::now();

        if (args.output_path == "-") {
            propcalc::io::write_simulation_result_json(std::cout, result, notes, !args.compact);
        } else {
            propcalc::io::write_simulation_result_json(args.output_path, result, notes, !args.compact);
            logger.log_output_written("json", args.output_path);
        }

        if (!args.parquet_path.empty()) {
            propcalc::io::ParquetWriter::write_series(result.baseline, "baseline", args.parquet_path);
            logger.log_output_written("parquet", args.parquet_path);
        }

        if (!args.scenario_parquet_path.empty()) {
            if (result.scenario) {
                propcalc::io::ParquetWriter::write_series(*result.scenario, "scenario",
                                                          args.scenario_parquet_path);
                logger.log_output_written("parquet", args.scenario_parquet_path);
            } else {
                logger.log_warning("No stress scenario configured; " +
                                   args.scenario_parquet_path + " not written");
            }
        }

        propcalc::RunMetrics metrics;
        metrics.execution_time_ms =
            std::chrono::duration<double, std::milli>(end - start).count();
        metrics.years_projected = static_cast<int>(result.baseline.size());
        metrics.scenario_run = result.scenario.has_value();
        metrics.exit_valued = result.exit.has_value();
        metrics.total_cash_flow = result.baseline_summary.total_cash_flow;
        metrics.dead_cross_year = result.dead_cross_year.value_or(0);
        metrics.warning_count = notes.warnings.size();
        logger.log_run_complete(metrics);
        logger.flush();

        return 0;
    } catch (const std::exception& e) {
        logger.log_error(e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
