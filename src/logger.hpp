/**
 * @file logger.hpp
 * @brief Structured logging for the simulation engine
 *
 * The Logger provides:
 * - Log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines on stderr and/or a log file
 * - Scenario context (scenario name, scenario id, phase)
 * - Analysis events: configuration, scenario start/complete, layer pricing
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef XOLCALC_LOGGER_HPP
#define XOLCALC_LOGGER_HPP

#include "analysis.hpp"
#include "simulation_config.hpp"
#include "scenario_engine.hpp"
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace xolcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-scenario model parameters
    INFO,    ///< Analysis and scenario lifecycle
    WARN,    ///< Non-fatal issues
    ERROR    ///< Failures, exceptions
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
 * @brief Parse log level from string
 *
 * @throws ConfigError for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Scenario context attached to every event
 */
struct ExecutionContext {
    std::string scenario_name;       ///< "baseline", "stressed", "layer_comparison"
    uint32_t scenario_id;            ///< Scenario identity
    std::string phase;               ///< "simulate" or "metrics"

    ExecutionContext()
        : scenario_name(""), scenario_id(0), phase("") {}

    ExecutionContext(const std::string& name, uint32_t id)
        : scenario_name(name), scenario_id(id), phase("") {}
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
          log_file_path("xolcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = false;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   ExecutionContext ctx("baseline", BASELINE_SCENARIO_ID);
 *   logger.log_scenario_complete(ctx, result);
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
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the validated parameters of an analysis
     */
    void log_analysis_start(const SimulationConfig& config);

    /**
     * @brief Log a configuration file that was read
     *
     * @param source File path or "<string>"
     * @param layer_option_count Number of alternative layers found
     */
    void log_config_loaded(const std::string& source, size_t layer_option_count);

    /**
     * @brief Log the start of one scenario run
     *
     * Model parameters are included at DEBUG level only.
     */
    void log_scenario_start(
        const ExecutionContext& ctx,
        size_t trials,
        const ScenarioSpec& spec
    );

    /**
     * @brief Log scenario metrics and timing
     */
    void log_scenario_complete(
        const ExecutionContext& ctx,
        const ScenarioResult& result
    );

    /**
     * @brief Log the metrics of one priced layer option
     */
    void log_layer_comparison(
        const ExecutionContext& ctx,
        const LayerComparison& comparison
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const ExecutionContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const ExecutionContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex write_mutex_;

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace xolcalc

#endif // XOLCALC_LOGGER_HPP
