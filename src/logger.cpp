/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace xolcalc {

namespace {

std::string format_limit(double limit) {
    return limit == ReinsuranceLayer::UNLIMITED ? "unlimited" : std::to_string(limit);
}

void add_metrics(std::map<std::string, std::string>& fields,
                 const std::string& prefix,
                 const RiskMetrics& metrics) {
    fields[prefix + "expected_loss"] = std::to_string(metrics.expected_loss);
    fields[prefix + "std_dev"] = std::to_string(metrics.std_dev);
    fields[prefix + "var_99"] = std::to_string(metrics.var_99);
    fields[prefix + "tvar_99"] = std::to_string(metrics.tvar_99);
    fields[prefix + "trigger_probability"] = std::to_string(metrics.trigger_probability);
    fields[prefix + "value_for_money"] = std::to_string(metrics.value_for_money);
    if (metrics.claim_hit_ratio) {
        fields[prefix + "claim_hit_ratio"] = std::to_string(*metrics.claim_hit_ratio);
    }
}

} // anonymous namespace

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG" || level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "INFO" || level_str == "info") return LogLevel::INFO;
    if (level_str == "WARN" || level_str == "warn") return LogLevel::WARN;
    if (level_str == "ERROR" || level_str == "error") return LogLevel::ERROR;
    throw ConfigError("Unknown log level: " + level_str);
}

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
    std::lock_guard<std::mutex> lock(write_mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_analysis_start(const SimulationConfig& config) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_start";
    fields["trials"] = std::to_string(config.trials);
    fields["seed"] = std::to_string(config.effective_seed());
    fields["seed_source"] = config.seed ? "config" : "default";
    fields["frequency"] = frequency_distribution_to_string(config.frequency.distribution);
    if (config.frequency.distribution == FrequencyDistribution::Binomial) {
        fields["policy_count"] = std::to_string(config.frequency.policy_count);
        fields["claim_probability"] = std::to_string(config.frequency.claim_probability);
    } else {
        fields["lambda"] = std::to_string(config.frequency.lambda);
    }
    fields["severity_mu"] = std::to_string(config.severity.mu);
    fields["severity_sigma"] = std::to_string(config.severity.sigma);
    fields["retention"] = std::to_string(config.retention);
    fields["limit"] = format_limit(config.limit);
    fields["layer_basis"] = layer_basis_to_string(config.layer_basis);
    fields["inflation_rate"] = std::to_string(config.inflation_rate);
    fields["premium"] = std::to_string(config.premium);
    fields["common_random_numbers"] = config.common_random_numbers ? "true" : "false";
    fields["num_threads"] = std::to_string(config.num_threads);

    log(LogLevel::INFO, "Starting analysis", fields);
}

void Logger::log_config_loaded(const std::string& source, size_t layer_option_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["source"] = source;
    fields["layer_options"] = std::to_string(layer_option_count);

    log(LogLevel::INFO, "Loaded configuration", fields);
}

void Logger::log_scenario_start(
    const ExecutionContext& ctx,
    size_t trials,
    const ScenarioSpec& spec
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_start";
    fields["scenario"] = ctx.scenario_name;
    fields["scenario_id"] = std::to_string(ctx.scenario_id);
    fields["phase"] = ctx.phase;
    fields["trials"] = std::to_string(trials);
    fields["stream_id"] = std::to_string(spec.stream_id);

    log(LogLevel::INFO, "Starting scenario", fields);

    if (config_.min_level <= LogLevel::DEBUG) {
        std::map<std::string, std::string> params;
        params["event"] = "scenario_parameters";
        params["scenario"] = ctx.scenario_name;
        params["expected_claims"] = std::to_string(spec.frequency.expected_count());
        params["severity_mu"] = std::to_string(spec.severity.params().mu);
        params["severity_sigma"] = std::to_string(spec.severity.params().sigma);
        params["severity_mean"] = std::to_string(spec.severity.params().mean());
        log(LogLevel::DEBUG, "Scenario parameters", params);
    }
}

void Logger::log_scenario_complete(
    const ExecutionContext& ctx,
    const ScenarioResult& result
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_complete";
    fields["scenario"] = ctx.scenario_name;
    fields["scenario_id"] = std::to_string(ctx.scenario_id);
    fields["trials"] = std::to_string(result.trials);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["trials_per_sec"] = std::to_string(
        result.execution_time_ms > 0 ? (result.trials * 1000.0 / result.execution_time_ms) : 0
    );
    add_metrics(fields, "", result.metrics);

    log(LogLevel::INFO, "Scenario completed", fields);
}

void Logger::log_layer_comparison(
    const ExecutionContext& ctx,
    const LayerComparison& comparison
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "layer_comparison";
    fields["scenario"] = ctx.scenario_name;
    fields["option"] = comparison.option.name;
    fields["retention"] = std::to_string(comparison.option.retention);
    fields["limit"] = format_limit(comparison.option.limit);
    fields["layer_basis"] = layer_basis_to_string(comparison.option.basis);
    fields["premium"] = std::to_string(comparison.option.premium);
    add_metrics(fields, "baseline.", comparison.baseline);
    add_metrics(fields, "stressed.", comparison.stressed);

    log(LogLevel::INFO, "Priced layer option", fields);
}

void Logger::log_error(
    const ExecutionContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["scenario"] = ctx.scenario_name;
    fields["scenario_id"] = std::to_string(ctx.scenario_id);
    fields["phase"] = ctx.phase;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Scenario failed", fields);
}

void Logger::log_warning(
    const ExecutionContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["scenario"] = ctx.scenario_name;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
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
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace xolcalc
