/**
 * @file stage_interface.hpp
 * @brief Abstract interface for the pipeline stages
 *
 * Every derived-metrics stage (gap resolution through proposal validation) is
 * wrapped in an IPipelineStage so the orchestrator can run them in dependency
 * order with uniform logging, retry and fallback handling.
 *
 * Design Principles:
 * - Idempotent: running a stage twice for a year yields the same rows
 * - Atomic per year: a year's rows are computed in full, then swapped in
 * - Explicit inputs: stages read facts and derived tables from the PipelineContext
 */

#ifndef SCHOOLGOV_STAGE_INTERFACE_HPP
#define SCHOOLGOV_STAGE_INTERFACE_HPP

#include "derived_tables.hpp"
#include "proposal_validator.hpp"
#include "school.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace schoolgov {

/**
 * @brief Stage metadata
 */
struct StageInfo {
    std::string name;            ///< Human-readable stage name (e.g., "Composite Risk Scorer")
    std::string version;         ///< Semantic version string
    std::string stage_type;      ///< Registry key (e.g., "risk_scorer")
    std::string output_table;    ///< Derived table the stage writes

    StageInfo(
        const std::string& name_,
        const std::string& version_,
        const std::string& stage_type_,
        const std::string& output_table_
    ) : name(name_), version(version_), stage_type(stage_type_), output_table(output_table_) {}
};

/**
 * @brief Result of one stage run
 */
struct StageResult {
    bool success;                                  ///< True if every requested year was written
    double execution_time_ms;                      ///< Wall time of the run
    size_t input_rows;                             ///< Fact or derived rows read
    size_t rows_written;                           ///< Rows swapped into the output table
    size_t years_processed;                        ///< Year partitions replaced
    std::vector<std::string> warnings;             ///< Masked conditions surfaced to the operator
    std::string error_message;                     ///< Set when success == false
    std::map<std::string, std::string> summary;    ///< Stage-specific statistics

    StageResult()
        : success(true), execution_time_ms(0.0), input_rows(0), rows_written(0), years_processed(0) {}
};

/**
 * @brief Inputs and outputs shared by the stages of one pipeline run
 *
 * Facts are read-only. Derived tables are written by exactly one stage each.
 */
struct PipelineContext {
    const FactTables* facts;
    DerivedTables* tables;
    const ProposalSet* proposals;   ///< nullptr when no proposals were supplied

    PipelineContext() : facts(nullptr), tables(nullptr), proposals(nullptr) {}
    PipelineContext(const FactTables* facts_, DerivedTables* tables_, const ProposalSet* proposals_ = nullptr)
        : facts(facts_), tables(tables_), proposals(proposals_) {}
};

/**
 * @brief Base exception for stage failures
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when stage parameters are invalid
 */
class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError("Configuration error: " + message) {}
};

/**
 * @brief Raised when a stage runs before its prerequisite tables exist for a year
 *
 * A programming error in the pipeline composition. Never retried.
 */
class StageOrderingError : public PipelineError {
public:
    explicit StageOrderingError(const std::string& message)
        : PipelineError("Stage ordering violation: " + message) {}
};

/**
 * @brief Raised when a stage fails while computing
 */
class ExecutionError : public PipelineError {
public:
    explicit ExecutionError(const std::string& message)
        : PipelineError("Execution failed: " + message) {}
};

/**
 * @brief Raised when a sink fails to persist a table; safe to retry
 */
class TransientIOError : public PipelineError {
public:
    explicit TransientIOError(const std::string& message)
        : PipelineError("I/O failure: " + message) {}
};

/**
 * @brief Abstract interface for pipeline stages
 *
 * Lifecycle:
 *   1. initialize(config) - parse and validate stage parameters
 *   2. run(ctx, years) - compute and swap in the requested years (may be called repeatedly)
 *   3. dispose() - release the stage
 *
 * Usage Example:
 *   @code
 *   StageFactory factory;
 *   auto stage = factory.create_stage("risk_scorer");
 *   stage->initialize({});
 *
 *   PipelineContext ctx(&facts, &tables);
 *   StageResult result = stage->run(ctx, {"2022-23", "2023-24"});
 *   @endcode
 */
class IPipelineStage {
public:
    virtual ~IPipelineStage() = default;

    /**
     * @brief Initialize the stage with its configuration
     *
     * @param config Stage-specific parameters (key-value pairs)
     *
     * @throws ConfigurationError If a parameter is invalid
     */
    virtual void initialize(const std::map<std::string, std::string>& config) = 0;

    virtual StageInfo get_info() const = 0;

    /**
     * @brief Recompute the stage's output table for the given years
     *
     * @param ctx Facts, derived tables and optional proposals
     * @param years Academic years to recompute, ascending
     *
     * @return StageResult with row counts, warnings and summary statistics
     *
     * @throws StageOrderingError If a prerequisite table is missing for a year
     * @throws ExecutionError If computation fails
     */
    virtual StageResult run(PipelineContext& ctx, const std::vector<std::string>& years) = 0;

    /**
     * @brief Years the stage's input tables must hold to run over the given years
     *
     * The orchestrator runs the upstream stages over these years as well.
     */
    virtual std::vector<std::string> input_years(const FactTables& /* facts */,
                                                 const std::vector<std::string>& years) const {
        return years;
    }

    virtual void dispose() noexcept = 0;

    virtual bool is_initialized() const = 0;
};

} // namespace schoolgov

#endif // SCHOOLGOV_STAGE_INTERFACE_HPP
