/**
 * @file pipeline_stages.hpp
 * @brief IPipelineStage adapters for the nine derived-metrics stages
 *
 * Each adapter wraps one schoolgov-engine computation: it checks that the
 * tables it reads are populated for the requested years, computes each year's
 * full row set, swaps it into its output table and reports summary
 * statistics and warnings for the stage_complete log event.
 *
 * Stage types and their output tables:
 *   classroom_gap_resolver -> classroom_gaps
 *   teacher_gap_resolver   -> teacher_gaps
 *   risk_scorer            -> risk_scores
 *   prioritisation         -> priority_index
 *   risk_trend             -> risk_trends
 *   district_aggregator    -> district_compliance
 *   budget_allocator       -> budget_simulation
 *   forecaster             -> enrolment_forecasts
 *   proposal_validator     -> proposal_validations
 */

#ifndef SCHOOLGOV_PIPELINE_STAGES_HPP
#define SCHOOLGOV_PIPELINE_STAGES_HPP

#include "stage_interface.hpp"
#include "budget_allocator.hpp"
#include "forecaster.hpp"
#include <memory>

namespace schoolgov {

/**
 * @brief Stage type identifiers
 */
namespace StageType {
    constexpr const char* CLASSROOM_GAP = "classroom_gap_resolver";
    constexpr const char* TEACHER_GAP = "teacher_gap_resolver";
    constexpr const char* RISK = "risk_scorer";
    constexpr const char* PRIORITISATION = "prioritisation";
    constexpr const char* RISK_TREND = "risk_trend";
    constexpr const char* DISTRICT = "district_aggregator";
    constexpr const char* BUDGET = "budget_allocator";
    constexpr const char* FORECAST = "forecaster";
    constexpr const char* PROPOSAL = "proposal_validator";
}

/**
 * @brief Shared lifecycle and bookkeeping for the stage adapters
 *
 * run() checks prerequisites first; a StageOrderingError escapes to the
 * caller. Any other failure during compute() is reported through
 * StageResult::success = false so the orchestrator can retry.
 */
class StageBase : public IPipelineStage {
public:
    void initialize(const std::map<std::string, std::string>& config) override;
    StageResult run(PipelineContext& ctx, const std::vector<std::string>& years) override;
    void dispose() noexcept override;
    bool is_initialized() const override { return initialized_; }

protected:
    StageBase() : initialized_(false) {}

    // Stage-specific parameters; called from initialize()
    virtual void configure(const std::map<std::string, std::string>& /* config */) {}

    // Throws StageOrderingError when an input table lacks a requested year
    virtual void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const = 0;

    virtual void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) = 0;

    // Throws StageOrderingError naming the stage, table and year
    void require_year(bool present, const std::string& table, const std::string& year) const;

    // Every fact year up to and including the last requested year
    static std::vector<std::string> history_years(const FactTables& facts, const std::vector<std::string>& years);
    static std::vector<std::string> with_history(const FactTables& facts, const std::vector<std::string>& years);

    std::map<std::string, std::string> config_;

private:
    bool initialized_;
};

class ClassroomGapStage : public StageBase {
public:
    StageInfo get_info() const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

class TeacherGapStage : public StageBase {
public:
    StageInfo get_info() const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

class RiskScoringStage : public StageBase {
public:
    StageInfo get_info() const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

/**
 * Needs risk scores for every fact year up to the requested year, since the
 * persistent flag looks back over the school's history.
 */
class PrioritisationStage : public StageBase {
public:
    StageInfo get_info() const override;
    std::vector<std::string> input_years(const FactTables& facts,
                                         const std::vector<std::string>& years) const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

/**
 * Recomputes trends from the full risk history, then swaps in the requested years.
 */
class RiskTrendStage : public StageBase {
public:
    StageInfo get_info() const override;
    std::vector<std::string> input_years(const FactTables& facts,
                                         const std::vector<std::string>& years) const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

class DistrictAggregationStage : public StageBase {
public:
    StageInfo get_info() const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

/**
 * Configuration Keys:
 *   - "classroom_budget": currency units (default: 500000000)
 *   - "cost_per_classroom": currency units (default: 500000)
 *   - "teacher_posts": teacher-post cap (default: 10000)
 */
class BudgetAllocationStage : public StageBase {
public:
    StageInfo get_info() const override;

    const BudgetConfig& budget_config() const { return budget_; }

protected:
    void configure(const std::map<std::string, std::string>& config) override;
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;

private:
    BudgetConfig budget_;
};

/**
 * Projects from the latest fact year whatever years are requested; rows are
 * partitioned by base year.
 *
 * Configuration Keys:
 *   - "estimator": "weighted_moving_average" (default) or "bias_corrected"
 */
class ForecastStage : public StageBase {
public:
    StageInfo get_info() const override;
    std::vector<std::string> input_years(const FactTables& facts,
                                         const std::vector<std::string>& years) const override;

protected:
    void configure(const std::map<std::string, std::string>& config) override;
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;

private:
    std::unique_ptr<GrowthEstimator> estimator_;
};

/**
 * Validates the submitted proposals for the requested years. A proposal id
 * already present in the output table keeps its original decision.
 */
class ProposalValidationStage : public StageBase {
public:
    StageInfo get_info() const override;

protected:
    void check_prerequisites(const PipelineContext& ctx, const std::vector<std::string>& years) const override;
    void compute(PipelineContext& ctx, const std::vector<std::string>& years, StageResult& result) override;
};

} // namespace schoolgov

#endif // SCHOOLGOV_PIPELINE_STAGES_HPP
