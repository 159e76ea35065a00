#ifndef XOLCALC_IO_CONFIG_READER_HPP
#define XOLCALC_IO_CONFIG_READER_HPP

#include "../analysis.hpp"
#include "../simulation_config.hpp"
#include <string>
#include <vector>

namespace xolcalc {
namespace io {

// Contents of an analysis configuration file
struct AnalysisConfig {
    SimulationConfig simulation;
    std::vector<LayerOption> layer_options;
};

/**
 * @brief Parses an analysis configuration from a JSON file
 *
 * Top-level keys: trials, seed, frequency, severity, layer, premium,
 * inflation_rate, common_random_numbers, threads, layer_options.
 * `layer.basis` ("aggregate" or "per_risk") is also the default basis of
 * every layer option. Integer fields must be whole JSON numbers.
 * Absent keys keep the SimulationConfig defaults; present keys must be
 * well-formed. The result is validated before it is returned.
 *
 * @throws ConfigError if the file cannot be read, the JSON is invalid or a
 *         value is missing, mistyped or out of range
 */
AnalysisConfig parse_analysis_config_from_file(const std::string& file_path);

/**
 * @brief Parses an analysis configuration from a JSON string
 *
 * @throws ConfigError as parse_analysis_config_from_file
 */
AnalysisConfig parse_analysis_config_from_string(const std::string& json_string);

/**
 * @brief Parses a layer limit written as text
 *
 * Accepts a non-negative number, "unlimited" or "inf".
 *
 * @throws ConfigError for anything else
 */
double parse_limit(const std::string& text);

} // namespace io
} // namespace xolcalc

#endif // XOLCALC_IO_CONFIG_READER_HPP
