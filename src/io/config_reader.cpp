#include "config_reader.hpp"
#include "../errors.hpp"
#include "../logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace xolcalc {
namespace io {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "trials", "seed", "frequency", "severity", "layer", "premium",
    "inflation_rate", "common_random_numbers", "threads", "layer_options"
};

// Whole JSON number; fractional and negative values are rejected rather than
// truncated or wrapped by json::get
uint64_t unsigned_from_json(const json& value, const std::string& key) {
    if (!value.is_number_unsigned()) {
        throw ConfigError(key + " must be a non-negative integer, got " + value.dump());
    }
    return value.get<uint64_t>();
}

int integer_from_json(const json& value, const std::string& key, int min_value) {
    if (!value.is_number_integer()) {
        throw ConfigError(key + " must be an integer, got " + value.dump());
    }
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigError(key + " is out of range: " + value.dump());
        }
        return value.get<int>();
    }
    int64_t number = value.get<int64_t>();
    if (number < min_value || number > std::numeric_limits<int>::max()) {
        throw ConfigError(key + " is out of range: " + value.dump());
    }
    return static_cast<int>(number);
}

double limit_from_json(const json& value, const std::string& where) {
    if (value.is_null()) {
        return ReinsuranceLayer::UNLIMITED;
    }
    if (value.is_string()) {
        return parse_limit(value.get<std::string>());
    }
    if (!value.is_number()) {
        throw ConfigError(where + ".limit must be a number, null or \"unlimited\"");
    }
    return value.get<double>();
}

FrequencyParams parse_frequency(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("frequency must be an object");
    }
    FrequencyDistribution distribution = FrequencyDistribution::Poisson;
    if (j.contains("distribution")) {
        distribution = frequency_distribution_from_string(j.at("distribution").get<std::string>());
    }

    if (distribution == FrequencyDistribution::Binomial) {
        if (!j.contains("policies") || !j.contains("claim_probability")) {
            throw ConfigError("binomial frequency requires 'policies' and 'claim_probability'");
        }
        uint64_t policies = unsigned_from_json(j.at("policies"), "frequency.policies");
        if (policies == 0) {
            throw ConfigError("frequency.policies must be a positive integer");
        }
        return FrequencyParams::binomial(policies, j.at("claim_probability").get<double>());
    }

    if (!j.contains("lambda")) {
        throw ConfigError("poisson frequency requires 'lambda'");
    }
    return FrequencyParams::poisson(j.at("lambda").get<double>());
}

SeverityParams parse_severity(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("severity must be an object");
    }
    bool has_log_params = j.contains("mu") || j.contains("sigma");
    bool has_moments = j.contains("mean") || j.contains("std_dev");

    if (has_log_params && has_moments) {
        throw ConfigError("severity takes either {mu, sigma} or {mean, std_dev}, not both");
    }
    if (has_moments) {
        if (!j.contains("mean") || !j.contains("std_dev")) {
            throw ConfigError("severity requires both 'mean' and 'std_dev'");
        }
        return SeverityParams::from_moments(j.at("mean").get<double>(),
                                            j.at("std_dev").get<double>());
    }
    if (!j.contains("mu") || !j.contains("sigma")) {
        throw ConfigError("severity requires 'mu' and 'sigma' (or 'mean' and 'std_dev')");
    }
    return SeverityParams(j.at("mu").get<double>(), j.at("sigma").get<double>());
}

LayerOption parse_layer_option(const json& j, size_t index, LayerBasis default_basis) {
    std::string where = "layer_options[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw ConfigError(where + " must be an object");
    }
    if (!j.contains("retention") || !j.contains("premium")) {
        throw ConfigError(where + " requires 'retention' and 'premium'");
    }

    LayerOption option;
    option.name = j.contains("name") ? j.at("name").get<std::string>() : where;
    option.retention = j.at("retention").get<double>();
    option.limit = j.contains("limit") ? limit_from_json(j.at("limit"), where)
                                       : ReinsuranceLayer::UNLIMITED;
    option.premium = j.at("premium").get<double>();
    option.basis = j.contains("basis")
        ? layer_basis_from_string(j.at("basis").get<std::string>())
        : default_basis;

    // Surface bad terms here, with the option's position in the message
    try {
        ReinsuranceLayer layer(option.retention, option.limit);
        (void)layer;
    } catch (const ConfigError& e) {
        throw ConfigError(where + ": " + e.what());
    }
    if (!(option.premium > 0.0)) {
        throw ConfigError(where + ".premium must be > 0");
    }
    return option;
}

AnalysisConfig parse_analysis_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    Logger& logger = Logger::get_instance();
    for (const auto& [key, value] : j.items()) {
        if (KNOWN_KEYS.count(key) == 0) {
            logger.log_warning(ExecutionContext("config", 0),
                               "Ignoring unknown configuration key: " + key);
        }
    }

    AnalysisConfig config;
    SimulationConfig& sim = config.simulation;

    if (j.contains("trials")) {
        const json& trials = j.at("trials");
        if (trials.is_number_integer() && !trials.is_number_unsigned()) {
            throw ConfigError("trials must be greater than 0");
        }
        uint64_t count = unsigned_from_json(trials, "trials");
        if (count == 0) {
            throw ConfigError("trials must be greater than 0");
        }
        sim.trials = static_cast<size_t>(count);
    }
    if (j.contains("seed") && !j.at("seed").is_null()) {
        sim.seed = unsigned_from_json(j.at("seed"), "seed");
    }
    if (j.contains("frequency")) {
        sim.frequency = parse_frequency(j.at("frequency"));
    }
    if (j.contains("severity")) {
        sim.severity = parse_severity(j.at("severity"));
    }
    if (j.contains("layer")) {
        const json& layer = j.at("layer");
        if (!layer.is_object() || !layer.contains("retention")) {
            throw ConfigError("layer must be an object with a 'retention'");
        }
        sim.retention = layer.at("retention").get<double>();
        sim.limit = layer.contains("limit") ? limit_from_json(layer.at("limit"), "layer")
                                            : ReinsuranceLayer::UNLIMITED;
        if (layer.contains("basis")) {
            sim.layer_basis = layer_basis_from_string(layer.at("basis").get<std::string>());
        }
    }
    if (j.contains("premium")) {
        sim.premium = j.at("premium").get<double>();
    }
    if (j.contains("inflation_rate")) {
        sim.inflation_rate = j.at("inflation_rate").get<double>();
    }
    if (j.contains("common_random_numbers")) {
        sim.common_random_numbers = j.at("common_random_numbers").get<bool>();
    }
    if (j.contains("threads")) {
        sim.num_threads = integer_from_json(j.at("threads"), "threads", 0);
    }
    if (j.contains("layer_options")) {
        const json& options = j.at("layer_options");
        if (!options.is_array()) {
            throw ConfigError("layer_options must be an array");
        }
        for (size_t i = 0; i < options.size(); ++i) {
            config.layer_options.push_back(parse_layer_option(options[i], i, sim.layer_basis));
        }
    }

    sim.validate();
    return config;
}

} // anonymous namespace

double parse_limit(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "unlimited" || lower == "inf" || lower == "infinity") {
        return ReinsuranceLayer::UNLIMITED;
    }

    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid limit: " + text);
    }
    if (consumed != text.size()) {
        throw ConfigError("Invalid limit: " + text);
    }
    if (!(value >= 0.0)) {
        throw ConfigError("Limit must be >= 0, got " + text);
    }
    return value;
}

AnalysisConfig parse_analysis_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    AnalysisConfig config = parse_analysis_config_from_string(buffer.str());
    Logger::get_instance().log_config_loaded(file_path, config.layer_options.size());
    return config;
}

AnalysisConfig parse_analysis_config_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigError("JSON parse error: " + std::string(e.what()));
    }

    try {
        return parse_analysis_config(j);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid configuration value: " + std::string(e.what()));
    }
}

} // namespace io
} // namespace xolcalc
