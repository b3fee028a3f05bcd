#ifndef SCHOOLGOV_ORCHESTRATOR_PIPELINE_CONFIG_HPP
#define SCHOOLGOV_ORCHESTRATOR_PIPELINE_CONFIG_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace schoolgov {
namespace orchestrator {

/**
 * @brief Exception thrown when a pipeline configuration is invalid
 */
class PipelineConfigError : public std::runtime_error {
public:
    explicit PipelineConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A fact table supplied by ingestion
 */
struct DataSource {
    std::string id;           // "schools", "yearly_metrics", "infrastructure", "teacher_metrics", "proposals"
    std::string type;         // "csv"
    std::string path;         // File path

    DataSource() = default;
    DataSource(const std::string& id_, const std::string& type_, const std::string& path_)
        : id(id_), type(type_), path(path_) {}
};

/**
 * @brief A stage node in the pipeline
 */
struct StageNode {
    std::string id;                                // Unique identifier, e.g., "risk"
    std::string type;                              // Stage type: "risk_scorer", "budget_allocator", ...
    std::map<std::string, std::string> config;     // Stage-specific parameters
    std::vector<std::string> depends_on;           // Stage ids that must run first

    StageNode() = default;
    StageNode(const std::string& id_, const std::string& type_)
        : id(id_), type(type_) {}
    StageNode(const std::string& id_, const std::string& type_, const std::vector<std::string>& depends_on_)
        : id(id_), type(type_), depends_on(depends_on_) {}
};

/**
 * @brief Where derived tables are written
 */
struct OutputConfig {
    std::string type;         // "json" or "parquet"
    std::string path;         // Output directory

    OutputConfig() = default;
    OutputConfig(const std::string& type_, const std::string& path_)
        : type(type_), path(path_) {}
};

/**
 * @brief What the orchestrator does after a stage fails
 */
enum class FallbackStrategy {
    FAIL_FAST,       ///< Stop the run at the first failure
    SKIP_OPTIONAL,   ///< Continue past stages whose config sets optional=true
    BEST_EFFORT      ///< Run every stage and report all failures
};

/**
 * @brief Parse "fail_fast", "skip_optional" or "best_effort"
 * @throws PipelineConfigError on any other value
 */
FallbackStrategy parse_fallback_strategy(const std::string& value);

std::string to_string(FallbackStrategy strategy);

/**
 * @brief Retry and fallback settings
 */
struct OrchestratorSettings {
    FallbackStrategy fallback_strategy;
    bool enable_retry;
    int max_retry_attempts;
    int retry_delay_ms;

    OrchestratorSettings()
        : fallback_strategy(FallbackStrategy::FAIL_FAST),
          enable_retry(true),
          max_retry_attempts(2),
          retry_delay_ms(1000) {}
};

/**
 * @brief Logger settings carried in the pipeline file
 */
struct LoggingSettings {
    std::string level;        // DEBUG, INFO, WARN, ERROR
    bool json;
    std::string file;         // Empty: console only

    LoggingSettings() : level("INFO"), json(true) {}
};

/**
 * @brief The complete pipeline configuration
 */
struct PipelineConfig {
    std::string description;                           // Human-readable description
    std::vector<StageNode> stages;                     // Stage nodes, declaration order
    std::map<std::string, DataSource> data_sources;    // Fact inputs keyed by id
    OutputConfig output;                               // Derived table sink
    OrchestratorSettings orchestrator;
    LoggingSettings logging;
    std::vector<std::string> years;                    // Empty: every year in the facts

    PipelineConfig() = default;
};

/**
 * @brief Data source ids every pipeline needs
 */
const std::vector<std::string>& required_data_sources();

/**
 * @brief Validates a pipeline configuration
 *
 * Validates:
 * - At least one stage exists
 * - Stage IDs are non-empty and unique, stage types are non-empty
 * - depends_on only names declared stages and forms no cycle
 * - The four fact data sources are present with a path
 * - Output type is "json" or "parquet" and a path is given
 * - Any explicit year list holds well-formed academic years
 *
 * @param config The pipeline configuration to validate
 * @throws PipelineConfigError if validation fails
 */
void validate_pipeline_config(const PipelineConfig& config);

/**
 * @brief Computes the stage execution order
 *
 * Topological sort over depends_on. Among stages that are ready at the same
 * time, declaration order is kept.
 *
 * @param config The pipeline configuration
 * @return Stage IDs in execution order
 * @throws PipelineConfigError on an unknown dependency or a cycle
 */
std::vector<std::string> compute_execution_order(const PipelineConfig& config);

/**
 * @brief Finds a stage by id
 *
 * @return nullptr when no stage has the id
 */
const StageNode* find_stage(const PipelineConfig& config, const std::string& stage_id);

/**
 * @brief The nine-stage pipeline over CSV facts in data_dir
 *
 * Stages, each depending on the ones it reads:
 * classroom_gaps, teacher_gaps, risk, priority, trend, district, budget,
 * forecast, proposals. The proposal stage is optional; proposals.csv is read
 * when present in data_dir.
 *
 * @param data_dir Directory holding schools.csv, yearly_metrics.csv, infrastructure.csv, teacher_metrics.csv
 * @param output_dir Directory for the derived tables
 * @param output_type "json" or "parquet"
 */
PipelineConfig default_pipeline_config(const std::string& data_dir,
                                       const std::string& output_dir,
                                       const std::string& output_type = "json");

} // namespace orchestrator
} // namespace schoolgov

#endif // SCHOOLGOV_ORCHESTRATOR_PIPELINE_CONFIG_HPP
