#ifndef XOLCALC_ERRORS_HPP
#define XOLCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace xolcalc {

/**
 * @brief Invalid simulation parameters
 *
 * Raised during validation, before any random draw is made.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Numerical degeneracy during simulation or metric reduction
 *
 * The scenario that raised it produces no result.
 */
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A scenario run was aborted through its CancellationToken
 */
class AnalysisCancelled : public std::runtime_error {
public:
    explicit AnalysisCancelled(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace xolcalc

#endif // XOLCALC_ERRORS_HPP
