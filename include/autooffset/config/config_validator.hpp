/**
 * @file config_validator.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <string>
#include <vector>

#include "autooffset/config/config_models.hpp"

namespace aof {

/**
 * @brief Severity level for configuration validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One configuration validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Validates an `AppConfig` before the service starts.
 *
 * Checks machine identity and endpoints, tool bindings, batch and scale
 * limits, gauge command encodings and frame layout consistency.
 */
class ConfigurationValidator {
public:
    static constexpr double kMaxOffsetRate = 10.0;

    static std::vector<ValidationIssue> validate(const AppConfig& config);
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace aof
