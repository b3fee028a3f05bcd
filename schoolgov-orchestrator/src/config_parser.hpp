#ifndef SCHOOLGOV_ORCHESTRATOR_CONFIG_PARSER_HPP
#define SCHOOLGOV_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "pipeline_config.hpp"
#include <string>

namespace schoolgov {
namespace orchestrator {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a pipeline configuration from a JSON file
 *
 * Relative data source and output paths are resolved against the directory
 * of the configuration file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed pipeline configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws PipelineConfigError if configuration is invalid
 */
PipelineConfig parse_pipeline_config_from_file(const std::string& file_path);

/**
 * @brief Parses a pipeline configuration from a JSON string
 *
 * Example document:
 *   @code
 *   {
 *     "description": "Nightly recompute",
 *     "data_sources": {
 *       "schools":         {"type": "csv", "path": "${DATA_DIR}/schools.csv"},
 *       "yearly_metrics":  {"type": "csv", "path": "${DATA_DIR}/yearly_metrics.csv"},
 *       "infrastructure":  {"type": "csv", "path": "${DATA_DIR}/infrastructure.csv"},
 *       "teacher_metrics": {"type": "csv", "path": "${DATA_DIR}/teacher_metrics.csv"}
 *     },
 *     "stages": [
 *       {"id": "classroom_gaps", "type": "classroom_gap_resolver"},
 *       {"id": "teacher_gaps", "type": "teacher_gap_resolver"},
 *       {"id": "risk", "type": "risk_scorer", "depends_on": ["classroom_gaps", "teacher_gaps"]},
 *       {"id": "budget", "type": "budget_allocator", "depends_on": ["risk"],
 *        "config": {"classroom_budget": 250000000, "teacher_posts": 5000}}
 *     ],
 *     "output": {"type": "json", "path": "out"},
 *     "orchestrator": {"fallback_strategy": "fail_fast", "max_retry_attempts": 2},
 *     "logging": {"level": "INFO", "json": true}
 *   }
 *   @endcode
 *
 * @param json_string JSON configuration as string
 * @return Parsed pipeline configuration
 * @throws ConfigParseError if JSON is invalid
 * @throws PipelineConfigError if configuration is invalid
 */
PipelineConfig parse_pipeline_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace schoolgov

#endif // SCHOOLGOV_ORCHESTRATOR_CONFIG_PARSER_HPP
