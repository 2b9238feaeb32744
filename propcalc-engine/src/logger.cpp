/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace propcalc {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(const std::string& config_source, int projection_years) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["config_source"] = config_source;
    fields["projection_years"] = std::to_string(projection_years);

    log(LogLevel::INFO, "Starting simulation", fields);
}

void Logger::log_defaults_applied(const std::vector<std::string>& filled_fields) {
    std::map<std::string, std::string> fields;
    fields["event"] = "defaults_applied";
    fields["filled_count"] = std::to_string(filled_fields.size());

    log(LogLevel::INFO, "Applied estimated defaults", fields);

    for (const auto& name : filled_fields) {
        std::map<std::string, std::string> field_entry;
        field_entry["event"] = "default_filled";
        field_entry["field"] = name;
        log(LogLevel::DEBUG, "Field estimated", field_entry);
    }
}

void Logger::log_run_complete(const RunMetrics& metrics) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["execution_time_ms"] = format_number(metrics.execution_time_ms);
    fields["years_projected"] = std::to_string(metrics.years_projected);
    fields["scenario_run"] = metrics.scenario_run ? "true" : "false";
    fields["exit_valued"] = metrics.exit_valued ? "true" : "false";
    fields["total_cash_flow"] = format_number(metrics.total_cash_flow);
    fields["dead_cross_year"] = metrics.dead_cross_year > 0
        ? std::to_string(metrics.dead_cross_year)
        : "none";
    fields["warning_count"] = std::to_string(metrics.warning_count);

    log(LogLevel::INFO, "Simulation completed", fields);
}

void Logger::log_output_written(const std::string& format, const std::string& path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "output_written";
    fields["format"] = format;
    fields["path"] = path;

    log(LogLevel::INFO, "Wrote results", fields);
}

void Logger::log_warning(const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Run failed", fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace propcalc
