/**
 * @file orchestrator.hpp
 * @brief Pipeline driver running the derived-metrics stages with retry and fallback
 *
 * The Orchestrator is responsible for:
 * - Loading the fact tables and proposals named in the pipeline configuration
 * - Running stages in dependency order over the selected academic years
 * - Retrying failed stages and table writes with exponential backoff
 * - Applying the fallback strategy when a stage fails for good
 * - Writing the derived tables as JSON or Parquet
 *
 * A StageOrderingError is a composition bug, not a transient fault: it is
 * never retried and always stops the run.
 */

#ifndef SCHOOLGOV_ORCHESTRATOR_HPP
#define SCHOOLGOV_ORCHESTRATOR_HPP

#include "stage_interface.hpp"
#include "stage_factory.hpp"
#include "pipeline_config.hpp"
#include "logger.hpp"
#include "io/table_export.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace schoolgov {

/**
 * @brief Outcome of a pipeline run
 */
struct PipelineResult {
    bool success;                                   ///< True if every selected stage and write succeeded
    bool partial_result;                            ///< True if some stages failed but the run continued
    std::map<std::string, StageResult> stage_results;  ///< Results per stage id
    std::vector<std::string> stages_run;            ///< Stage ids in the order they ran
    std::vector<std::string> stages_skipped;        ///< Stage ids skipped after an upstream failure
    std::vector<std::string> years;                 ///< Academic years the run covered
    std::map<std::string, std::vector<std::string>> stage_years;  ///< Years each stage ran over
    std::vector<std::string> files_written;         ///< Derived table files
    std::vector<std::string> errors;                ///< Errors encountered during execution
    std::vector<std::string> warnings;              ///< Non-fatal warnings, prefixed with the stage id
    double total_execution_time_ms;
    std::string failed_stage_id;                    ///< Stage that stopped the run (if any)

    PipelineResult()
        : success(true), partial_result(false), total_execution_time_ms(0.0) {}
};

/**
 * @brief Runs a pipeline configuration
 *
 * Usage Example:
 *   @code
 *   auto config = orchestrator::parse_pipeline_config_from_file("pipeline.json");
 *   Orchestrator orchestrator(config);
 *   PipelineResult result = orchestrator.execute();
 *
 *   if (!result.success) {
 *       std::cerr << "Pipeline failed at: " << result.failed_stage_id << std::endl;
 *   }
 *   @endcode
 */
class Orchestrator {
public:
    /**
     * @param config Pipeline configuration; validated here
     * @param logger Logger instance (optional, uses the singleton if nullptr)
     *
     * @throws orchestrator::PipelineConfigError If the configuration is invalid
     */
    explicit Orchestrator(const orchestrator::PipelineConfig& config, Logger* logger = nullptr);

    /**
     * @brief Load the inputs, run every selected stage and write the derived tables
     */
    PipelineResult execute();

    /**
     * @brief Run the selected stages against caller-owned tables without writing
     *
     * @param facts Fact tables
     * @param tables Derived tables, updated in place
     * @param proposals Submitted proposals, or nullptr
     */
    PipelineResult run(const FactTables& facts, DerivedTables& tables, const ProposalSet* proposals = nullptr);

    /**
     * @brief Write every populated derived table to the configured output directory
     *
     * Each write is retried on TransientIOError. Persistent failures are
     * recorded in result.errors and clear result.success.
     */
    void write_outputs(const DerivedTables& tables, PipelineResult& result);

    /**
     * @brief Restrict the run to a subset of stage ids (empty selects all)
     *
     * A selected stage whose inputs were not produced fails with StageOrderingError.
     *
     * @throws orchestrator::PipelineConfigError If an id is not in the configuration
     */
    void select_stages(const std::vector<std::string>& stage_ids);

    // Register custom stage types before execute()
    StageFactory& stage_factory() { return stage_factory_; }

    // Inputs loaded by execute()
    const FactTables* facts() const { return facts_.get(); }
    const DerivedTables* derived_tables() const { return tables_.get(); }

private:
    orchestrator::PipelineConfig config_;
    Logger* logger_;
    StageFactory stage_factory_;
    std::set<std::string> selected_;

    std::unique_ptr<FactTables> facts_;
    std::unique_ptr<DerivedTables> tables_;
    std::unique_ptr<ProposalSet> proposals_;

    void load_inputs();
    PipelineResult run_stages(const FactTables& facts, DerivedTables& tables, const ProposalSet* proposals);
    std::vector<std::string> resolve_years(const FactTables& facts, PipelineResult& result) const;
    std::map<std::string, std::unique_ptr<IPipelineStage>> initialize_stages(const std::vector<std::string>& order);
    std::map<std::string, std::vector<std::string>> plan_stage_years(
        const std::vector<std::string>& order,
        const std::map<std::string, std::unique_ptr<IPipelineStage>>& stages,
        const FactTables& facts,
        const std::vector<std::string>& years
    ) const;
    StageResult execute_with_retry(
        const orchestrator::StageNode& node,
        IPipelineStage& stage,
        PipelineContext& ctx,
        const std::vector<std::string>& years,
        size_t attempt = 0
    );
    void write_table_with_retry(const io::TableData& table, const std::string& path, size_t attempt = 0);
    bool is_selected(const std::string& stage_id) const;
    bool is_optional_stage(const std::string& stage_id) const;
    bool should_continue_after_error(const std::string& stage_id) const;
    int backoff_delay_ms(size_t attempt) const;
    void log_stage_failure(const orchestrator::StageNode& node, const StageResult& result);
};

} // namespace schoolgov

#endif // SCHOOLGOV_ORCHESTRATOR_HPP
