/**
 * @file logger.hpp
 * @brief Structured logging for the command-line engine
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Console (stderr) and/or append-to-file output
 * - Run events: start, defaults applied, completion, warnings, errors
 *
 * The simulation core never logs; only the CLI and the I/O layer do.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PROPCALC_LOGGER_HPP
#define PROPCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace propcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information (each defaulted field, intermediate values)
    INFO,    ///< Run start and completion
    WARN,    ///< Non-fatal issues (ungathered configuration fields)
    ERROR    ///< Failures that abort the run
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (unknown names give INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Summary figures reported when a run completes
 */
struct RunMetrics {
    double execution_time_ms;        ///< Wall time of the simulation
    int years_projected;             ///< Length of each series
    bool scenario_run;               ///< Stressed series produced
    bool exit_valued;                ///< Exit summary produced
    double total_cash_flow;          ///< Baseline post-tax total
    int dead_cross_year;             ///< 0 when none
    size_t warning_count;

    RunMetrics()
        : execution_time_ms(0.0), years_projected(0), scenario_run(false),
          exit_valued(false), total_cash_flow(0.0), dead_cross_year(0),
          warning_count(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("propcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "propcalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_run_start("property.json", 35);
 *   RunMetrics metrics;
 *   metrics.execution_time_ms = 0.8;
 *   logger.log_run_complete(metrics);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file (append mode) when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a simulation run
     *
     * @param config_source Configuration file path
     * @param projection_years Requested horizon
     */
    void log_run_start(const std::string& config_source, int projection_years);

    /**
     * @brief Log fields filled by the defaulting step
     *
     * One INFO line with the count, plus one DEBUG line per field.
     */
    void log_defaults_applied(const std::vector<std::string>& filled_fields);

    /**
     * @brief Log completion of a simulation run
     */
    void log_run_complete(const RunMetrics& metrics);

    /**
     * @brief Log result file written
     *
     * @param format "json" or "parquet"
     * @param path Output path ("-" for stdout)
     */
    void log_output_written(const std::string& format, const std::string& path);

    /**
     * @brief Log warning message
     */
    void log_warning(const std::string& warning_message);

    /**
     * @brief Log error message
     */
    void log_error(const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace propcalc

#endif // PROPCALC_LOGGER_HPP
