/**
 * @file pipeline_stages.cpp
 * @brief Implementation of the stage adapters
 */

#include "pipeline_stages.hpp"
#include "district_aggregator.hpp"
#include "gap_resolver.hpp"
#include "norms.hpp"
#include "prioritisation.hpp"
#include "risk_scorer.hpp"
#include "risk_trend.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

namespace schoolgov {

namespace {

std::string format_double(double value, int precision = 4) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

int64_t parse_int64_param(const std::map<std::string, std::string>& config,
                          const std::string& key,
                          int64_t default_value) {
    auto it = config.find(key);
    if (it == config.end()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw ConfigurationError(key + " must be an integer, got '" + it->second + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError(key + " must be an integer, got '" + it->second + "'");
    } catch (const std::out_of_range&) {
        throw ConfigurationError(key + " is out of range: " + it->second);
    }
}

} // anonymous namespace

// ============================================================================
// StageBase
// ============================================================================

void StageBase::initialize(const std::map<std::string, std::string>& config) {
    if (initialized_) {
        throw ConfigurationError("Stage already initialized. Call dispose() first.");
    }
    configure(config);
    config_ = config;
    initialized_ = true;
}

StageResult StageBase::run(PipelineContext& ctx, const std::vector<std::string>& years) {
    if (!initialized_) {
        throw ExecutionError("Stage not initialized. Call initialize() first.");
    }
    if (!ctx.facts || !ctx.tables) {
        throw ExecutionError("Pipeline context is missing facts or derived tables");
    }

    // Ordering violations are not data errors; let them reach the orchestrator
    check_prerequisites(ctx, years);

    StageResult result;
    auto start = std::chrono::high_resolution_clock::now();

    try {
        compute(ctx, years, result);
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end - start).count();

    return result;
}

void StageBase::dispose() noexcept {
    config_.clear();
    initialized_ = false;
}

void StageBase::require_year(bool present, const std::string& table, const std::string& year) const {
    if (!present) {
        throw StageOrderingError(get_info().stage_type + " needs " + table + " for " + year);
    }
}

std::vector<std::string> StageBase::history_years(const FactTables& facts,
                                                  const std::vector<std::string>& years) {
    std::vector<std::string> result;
    if (years.empty()) {
        return result;
    }
    const std::string last = *std::max_element(years.begin(), years.end());
    for (const auto& year : facts.academic_years()) {
        if (year <= last) {
            result.push_back(year);
        }
    }
    return result;
}

// History years plus the requested ones, ascending
std::vector<std::string> StageBase::with_history(const FactTables& facts,
                                                 const std::vector<std::string>& years) {
    std::set<std::string> all(years.begin(), years.end());
    for (const auto& year : history_years(facts, years)) {
        all.insert(year);
    }
    return std::vector<std::string>(all.begin(), all.end());
}

// ============================================================================
// Gap resolvers
// ============================================================================

StageInfo ClassroomGapStage::get_info() const {
    return StageInfo("Gap Resolver", "1.0.0", StageType::CLASSROOM_GAP, "classroom_gaps");
}

void ClassroomGapStage::check_prerequisites(const PipelineContext& /* ctx */,
                                            const std::vector<std::string>& /* years */) const {
    // Reads facts only
}

void ClassroomGapStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                                StageResult& result) {
    int64_t total_required = 0;
    int64_t total_gap = 0;
    size_t with_gap = 0;
    size_t missing_infrastructure = 0;
    size_t unmapped = 0;

    for (const auto& year : years) {
        std::vector<ClassroomGapRow> rows = resolve_classroom_gaps(*ctx.facts, year);

        for (const auto& row : rows) {
            total_required += row.required_classrooms;
            total_gap += row.classroom_gap;
            if (row.classroom_gap > 0) ++with_gap;
            if (!row.has_infrastructure_record) ++missing_infrastructure;
            if (!CapacityNorms::is_mapped_classroom_category(row.school_category)) ++unmapped;
        }

        result.input_rows += rows.size();
        result.rows_written += rows.size();
        ctx.tables->classroom_gaps.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    if (missing_infrastructure > 0) {
        result.warnings.push_back(std::to_string(missing_infrastructure) +
                                  " school-years have no infrastructure record; usable classrooms taken as 0");
    }
    if (unmapped > 0) {
        result.warnings.push_back(std::to_string(unmapped) +
                                  " school-years have no reference record or an unmapped category; default norm " +
                                  std::to_string(CapacityNorms::DEFAULT_NORM) + " applied");
    }

    result.summary["total_required_classrooms"] = std::to_string(total_required);
    result.summary["school_years_with_gap"] = std::to_string(with_gap);
    result.summary["total_classroom_gap"] = std::to_string(total_gap);
}

StageInfo TeacherGapStage::get_info() const {
    return StageInfo("Teacher Adequacy Resolver", "1.0.0", StageType::TEACHER_GAP, "teacher_gaps");
}

void TeacherGapStage::check_prerequisites(const PipelineContext& /* ctx */,
                                          const std::vector<std::string>& /* years */) const {
    // Reads facts only
}

void TeacherGapStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                              StageResult& result) {
    int64_t total_required = 0;
    int64_t total_gap = 0;
    size_t with_gap = 0;
    size_t missing_teachers = 0;
    size_t unmapped = 0;

    for (const auto& year : years) {
        std::vector<TeacherGapRow> rows = resolve_teacher_gaps(*ctx.facts, year);

        for (const auto& row : rows) {
            total_required += row.required_teachers;
            total_gap += row.teacher_gap;
            if (row.teacher_gap > 0) ++with_gap;
            if (!row.has_teacher_record) ++missing_teachers;
            if (!CapacityNorms::is_mapped_teacher_category(row.school_category)) ++unmapped;
        }

        result.input_rows += rows.size();
        result.rows_written += rows.size();
        ctx.tables->teacher_gaps.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    if (missing_teachers > 0) {
        result.warnings.push_back(std::to_string(missing_teachers) +
                                  " school-years have no teacher record; teachers taken as 0");
    }
    if (unmapped > 0) {
        result.warnings.push_back(std::to_string(unmapped) +
                                  " school-years have no reference record or an unmapped category; default norm " +
                                  std::to_string(CapacityNorms::DEFAULT_NORM) + " applied");
    }

    result.summary["total_required_teachers"] = std::to_string(total_required);
    result.summary["school_years_with_gap"] = std::to_string(with_gap);
    result.summary["total_teacher_gap"] = std::to_string(total_gap);
}

// ============================================================================
// Risk scorer
// ============================================================================

StageInfo RiskScoringStage::get_info() const {
    return StageInfo("Composite Risk Scorer", "1.0.0", StageType::RISK, "risk_scores");
}

void RiskScoringStage::check_prerequisites(const PipelineContext& ctx,
                                           const std::vector<std::string>& years) const {
    for (const auto& year : years) {
        require_year(ctx.tables->classroom_gaps.has_year(year), "classroom_gaps", year);
        require_year(ctx.tables->teacher_gaps.has_year(year), "teacher_gaps", year);
    }
}

void RiskScoringStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                               StageResult& result) {
    std::map<RiskLevel, size_t> level_counts;
    double risk_sum = 0.0;
    size_t scored = 0;

    for (const auto& year : years) {
        const auto& classroom_gaps = ctx.tables->classroom_gaps.rows(year);
        const auto& teacher_gaps = ctx.tables->teacher_gaps.rows(year);
        if (classroom_gaps.size() != teacher_gaps.size()) {
            result.warnings.push_back("Gap tables for " + year + " cover different school sets (" +
                                      std::to_string(classroom_gaps.size()) + " classroom rows, " +
                                      std::to_string(teacher_gaps.size()) + " teacher rows)");
        }

        std::vector<RiskRow> rows = score_risk(*ctx.facts, classroom_gaps, teacher_gaps, year);

        for (const auto& row : rows) {
            level_counts[row.risk_level]++;
            risk_sum += row.risk_score;
        }
        scored += rows.size();

        result.input_rows += classroom_gaps.size() + teacher_gaps.size();
        result.rows_written += rows.size();
        ctx.tables->risk_scores.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    for (RiskLevel level : {RiskLevel::Low, RiskLevel::Moderate, RiskLevel::High, RiskLevel::Critical}) {
        result.summary["count_" + to_string(level)] = std::to_string(level_counts[level]);
    }
    result.summary["mean_risk_score"] = format_double(scored > 0 ? risk_sum / static_cast<double>(scored) : 0.0);
}

// ============================================================================
// Prioritisation
// ============================================================================

StageInfo PrioritisationStage::get_info() const {
    return StageInfo("Prioritisation Ranker", "1.0.0", StageType::PRIORITISATION, "priority_index");
}

std::vector<std::string> PrioritisationStage::input_years(const FactTables& facts,
                                                          const std::vector<std::string>& years) const {
    return with_history(facts, years);
}

void PrioritisationStage::check_prerequisites(const PipelineContext& ctx,
                                              const std::vector<std::string>& years) const {
    for (const auto& year : history_years(*ctx.facts, years)) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
    }
    for (const auto& year : years) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
    }
}

void PrioritisationStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                                  StageResult& result) {
    std::map<PriorityBucket, size_t> bucket_counts;
    size_t persistent = 0;
    size_t unassigned = 0;

    for (const auto& year : years) {
        std::vector<PriorityRow> rows = rank_priorities(*ctx.facts, ctx.tables->risk_scores, year);

        for (const auto& row : rows) {
            bucket_counts[row.priority_bucket]++;
            if (row.persistent_high_risk) ++persistent;
            if (row.district.empty()) ++unassigned;
        }

        result.input_rows += ctx.tables->risk_scores.rows(year).size();
        result.rows_written += rows.size();
        ctx.tables->priority_index.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    if (unassigned > 0) {
        result.warnings.push_back(std::to_string(unassigned) +
                                  " ranked rows have no school district; district rank taken among them");
    }

    for (PriorityBucket bucket : {PriorityBucket::Top5, PriorityBucket::Top10,
                                  PriorityBucket::Top20, PriorityBucket::Standard}) {
        result.summary["count_" + to_string(bucket)] = std::to_string(bucket_counts[bucket]);
    }
    result.summary["persistent_high_risk"] = std::to_string(persistent);
}

// ============================================================================
// Trend tracker
// ============================================================================

StageInfo RiskTrendStage::get_info() const {
    return StageInfo("Trend Tracker", "1.0.0", StageType::RISK_TREND, "risk_trends");
}

std::vector<std::string> RiskTrendStage::input_years(const FactTables& facts,
                                                     const std::vector<std::string>& years) const {
    return with_history(facts, years);
}

void RiskTrendStage::check_prerequisites(const PipelineContext& ctx,
                                         const std::vector<std::string>& years) const {
    for (const auto& year : history_years(*ctx.facts, years)) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
    }
    for (const auto& year : years) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
    }
}

void RiskTrendStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                             StageResult& result) {
    auto trends = compute_risk_trends(ctx.tables->risk_scores);

    std::map<TrendDirection, size_t> direction_counts;
    size_t chronic = 0;
    size_t volatile_rows = 0;

    result.input_rows = ctx.tables->risk_scores.size();

    for (const auto& year : years) {
        std::vector<RiskTrendRow> rows;
        auto it = trends.find(year);
        if (it != trends.end()) {
            rows = std::move(it->second);
        }

        for (const auto& row : rows) {
            direction_counts[row.trend_direction]++;
            if (row.chronic) ++chronic;
            if (row.is_volatile) ++volatile_rows;
        }

        result.rows_written += rows.size();
        ctx.tables->risk_trends.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    for (TrendDirection direction : {TrendDirection::Baseline, TrendDirection::Improving,
                                     TrendDirection::Stable, TrendDirection::Deteriorating}) {
        result.summary["count_" + to_string(direction)] = std::to_string(direction_counts[direction]);
    }
    result.summary["chronic"] = std::to_string(chronic);
    result.summary["volatile"] = std::to_string(volatile_rows);
}

// ============================================================================
// District aggregator
// ============================================================================

StageInfo DistrictAggregationStage::get_info() const {
    return StageInfo("District Aggregator", "1.0.0", StageType::DISTRICT, "district_compliance");
}

void DistrictAggregationStage::check_prerequisites(const PipelineContext& ctx,
                                                   const std::vector<std::string>& years) const {
    for (const auto& year : years) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
        require_year(ctx.tables->classroom_gaps.has_year(year), "classroom_gaps", year);
        require_year(ctx.tables->teacher_gaps.has_year(year), "teacher_gaps", year);
    }
}

void DistrictAggregationStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                                       StageResult& result) {
    size_t unassigned = 0;
    std::set<std::string> districts;

    // Aggregate every requested year before re-ranking the whole table
    std::map<std::string, std::vector<DistrictScoreRow>> aggregated;
    for (const auto& year : years) {
        const auto& risk = ctx.tables->risk_scores.rows(year);
        DistrictAggregation agg = aggregate_districts(*ctx.facts, risk,
                                                      ctx.tables->classroom_gaps.rows(year),
                                                      ctx.tables->teacher_gaps.rows(year),
                                                      year);
        unassigned += agg.unassigned_rows;
        result.input_rows += risk.size();
        aggregated[year] = std::move(agg.rows);
    }

    for (auto& entry : aggregated) {
        result.rows_written += entry.second.size();
        ctx.tables->district_scores.replace_year(entry.first, std::move(entry.second));
        result.years_processed++;
    }
    finalize_district_rankings(ctx.tables->district_scores);

    std::map<char, size_t> grade_counts;
    for (const auto& year : years) {
        for (const auto& row : ctx.tables->district_scores.rows(year)) {
            districts.insert(row.district);
            grade_counts[row.compliance_grade]++;
        }
    }

    if (unassigned > 0) {
        result.warnings.push_back(std::to_string(unassigned) +
                                  " risk rows skipped: school has no reference record or no district");
    }

    result.summary["districts_scored"] = std::to_string(districts.size());
    for (char grade : {'A', 'B', 'C', 'D', 'F'}) {
        result.summary[std::string("grade_") + grade] = std::to_string(grade_counts[grade]);
    }
}

// ============================================================================
// Budget allocator
// ============================================================================

StageInfo BudgetAllocationStage::get_info() const {
    return StageInfo("Budget Allocator", "1.0.0", StageType::BUDGET, "budget_simulation");
}

void BudgetAllocationStage::configure(const std::map<std::string, std::string>& config) {
    BudgetConfig budget;
    budget.classroom_budget = parse_int64_param(config, "classroom_budget", budget.classroom_budget);
    budget.cost_per_classroom = parse_int64_param(config, "cost_per_classroom", budget.cost_per_classroom);
    budget.teacher_posts = parse_int64_param(config, "teacher_posts", budget.teacher_posts);

    try {
        budget.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
    budget_ = budget;
}

void BudgetAllocationStage::check_prerequisites(const PipelineContext& ctx,
                                                const std::vector<std::string>& years) const {
    for (const auto& year : years) {
        require_year(ctx.tables->risk_scores.has_year(year), "risk_scores", year);
        require_year(ctx.tables->classroom_gaps.has_year(year), "classroom_gaps", year);
        require_year(ctx.tables->teacher_gaps.has_year(year), "teacher_gaps", year);
    }
}

void BudgetAllocationStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                                    StageResult& result) {
    const int64_t classroom_cap = budget_.classroom_cap();
    const int64_t teacher_cap = budget_.teacher_posts;

    int64_t classrooms_allocated = 0;
    int64_t teachers_allocated = 0;
    size_t classrooms_resolved = 0;
    size_t teachers_resolved = 0;
    int64_t remaining_classroom_deficit = 0;
    int64_t remaining_teacher_deficit = 0;

    for (const auto& year : years) {
        const auto& risk = ctx.tables->risk_scores.rows(year);
        const auto ordered = priority_order(*ctx.facts, risk,
                                            ctx.tables->classroom_gaps.rows(year),
                                            ctx.tables->teacher_gaps.rows(year));
        std::vector<BudgetRow> rows = allocate_budget(ordered, year, classroom_cap, teacher_cap);

        for (const auto& row : rows) {
            classrooms_allocated += row.classrooms_allocated;
            teachers_allocated += row.teachers_allocated;
            if (row.classroom_resolved) ++classrooms_resolved;
            if (row.teacher_resolved) ++teachers_resolved;
            remaining_classroom_deficit += row.classroom_gap - row.classrooms_allocated;
            remaining_teacher_deficit += row.teacher_gap - row.teachers_allocated;
        }

        if (rows.size() < risk.size()) {
            result.warnings.push_back(std::to_string(risk.size() - rows.size()) +
                                      " scored school-years in " + year +
                                      " have no teacher gap row and were not allocated");
        }

        result.input_rows += risk.size();
        result.rows_written += rows.size();
        ctx.tables->budget_simulation.replace_year(year, std::move(rows));
        result.years_processed++;
    }

    result.summary["classroom_cap"] = std::to_string(classroom_cap);
    result.summary["teacher_cap"] = std::to_string(teacher_cap);
    result.summary["classrooms_allocated"] = std::to_string(classrooms_allocated);
    result.summary["teachers_allocated"] = std::to_string(teachers_allocated);
    result.summary["classroom_resolved"] = std::to_string(classrooms_resolved);
    result.summary["teacher_resolved"] = std::to_string(teachers_resolved);
    result.summary["remaining_classroom_deficit"] = std::to_string(remaining_classroom_deficit);
    result.summary["remaining_teacher_deficit"] = std::to_string(remaining_teacher_deficit);
}

// ============================================================================
// Forecaster
// ============================================================================

StageInfo ForecastStage::get_info() const {
    return StageInfo("Forecaster", "1.0.0", StageType::FORECAST, "enrolment_forecasts");
}

void ForecastStage::configure(const std::map<std::string, std::string>& config) {
    auto it = config.find("estimator");
    const std::string name = it != config.end() ? it->second : "";
    try {
        estimator_ = make_growth_estimator(name);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
}

// Only the base year's gap rows are read
std::vector<std::string> ForecastStage::input_years(const FactTables& facts,
                                                    const std::vector<std::string>& /* years */) const {
    auto base_year = facts.latest_year();
    if (!base_year) {
        return {};
    }
    return {*base_year};
}

void ForecastStage::check_prerequisites(const PipelineContext& ctx,
                                        const std::vector<std::string>& /* years */) const {
    auto base_year = ctx.facts->latest_year();
    if (!base_year) {
        return;
    }
    require_year(ctx.tables->classroom_gaps.has_year(*base_year), "classroom_gaps", *base_year);
    require_year(ctx.tables->teacher_gaps.has_year(*base_year), "teacher_gaps", *base_year);
}

void ForecastStage::compute(PipelineContext& ctx, const std::vector<std::string>& /* years */,
                            StageResult& result) {
    auto base_year = ctx.facts->latest_year();
    if (!base_year) {
        result.warnings.push_back("No enrolment facts; nothing to forecast");
        return;
    }

    std::vector<ForecastRow> rows = forecast_enrolment(*ctx.facts,
                                                       ctx.tables->classroom_gaps.rows(*base_year),
                                                       ctx.tables->teacher_gaps.rows(*base_year),
                                                       *base_year,
                                                       *estimator_);

    double growth_sum = 0.0;
    size_t schools = 0;
    size_t short_history = 0;
    std::map<int, int64_t> classroom_gap_by_horizon;
    std::map<int, int64_t> teacher_gap_by_horizon;

    for (const auto& row : rows) {
        if (row.years_ahead == 1) {
            growth_sum += row.growth_rate;
            ++schools;
            if (ctx.facts->enrolment_history(row.school_id).size() < 2) {
                ++short_history;
            }
        }
        classroom_gap_by_horizon[row.years_ahead] += row.projected_classroom_gap;
        teacher_gap_by_horizon[row.years_ahead] += row.projected_teacher_gap;
    }

    if (short_history > 0) {
        result.warnings.push_back(std::to_string(short_history) +
                                  " schools have a single observed year; growth taken as 0");
    }

    result.input_rows = ctx.facts->yearly_metric_count();
    result.rows_written = rows.size();
    ctx.tables->enrolment_forecasts.replace_year(*base_year, std::move(rows));
    result.years_processed = 1;

    result.summary["base_year"] = *base_year;
    result.summary["estimator"] = estimator_->name();
    result.summary["mean_growth_rate"] = format_double(schools > 0 ? growth_sum / static_cast<double>(schools) : 0.0);
    for (int k = 1; k <= ForecastModel::HORIZON; ++k) {
        result.summary["projected_classroom_gap_t" + std::to_string(k)] = std::to_string(classroom_gap_by_horizon[k]);
        result.summary["projected_teacher_gap_t" + std::to_string(k)] = std::to_string(teacher_gap_by_horizon[k]);
    }
}

// ============================================================================
// Proposal validator
// ============================================================================

StageInfo ProposalValidationStage::get_info() const {
    return StageInfo("Proposal Validator", "1.0.0", StageType::PROPOSAL, "proposal_validations");
}

void ProposalValidationStage::check_prerequisites(const PipelineContext& ctx,
                                                  const std::vector<std::string>& years) const {
    if (!ctx.proposals) {
        return;
    }
    const std::set<std::string> requested(years.begin(), years.end());
    for (const auto& p : ctx.proposals->proposals()) {
        if (requested.count(p.academic_year) > 0) {
            require_year(ctx.tables->classroom_gaps.has_year(p.academic_year), "classroom_gaps", p.academic_year);
            require_year(ctx.tables->teacher_gaps.has_year(p.academic_year), "teacher_gaps", p.academic_year);
        }
    }
}

void ProposalValidationStage::compute(PipelineContext& ctx, const std::vector<std::string>& years,
                                      StageResult& result) {
    if (!ctx.proposals || ctx.proposals->empty()) {
        result.warnings.push_back("No proposals supplied");
        return;
    }

    std::set<int64_t> already_validated;
    for (const auto& row : ctx.tables->proposal_validations.all_rows()) {
        already_validated.insert(row.proposal_id);
    }

    // Requested years, plus years the facts never cover: those can only be SCHOOL_NOT_FOUND
    const std::set<std::string> requested(years.begin(), years.end());
    const auto fact_years = ctx.facts->academic_years();
    const std::set<std::string> known_years(fact_years.begin(), fact_years.end());

    std::vector<Proposal> pending;
    size_t kept = 0;
    for (const auto& p : ctx.proposals->proposals()) {
        const bool in_scope = requested.count(p.academic_year) > 0 || known_years.count(p.academic_year) == 0;
        if (!in_scope) {
            continue;
        }
        if (already_validated.count(p.proposal_id) > 0) {
            ++kept;
            continue;
        }
        pending.push_back(p);
    }
    result.input_rows = pending.size();

    std::map<std::string, std::vector<ProposalValidationRow>> by_year;
    for (auto& row : validate_proposals(pending, *ctx.tables)) {
        by_year[row.academic_year].push_back(std::move(row));
    }

    std::map<ProposalDecision, size_t> decision_counts;
    size_t not_found = 0;
    double confidence_sum = 0.0;
    size_t validated = 0;

    for (auto& entry : by_year) {
        for (const auto& row : entry.second) {
            decision_counts[row.decision]++;
            confidence_sum += row.confidence;
            if (row.reason_code == "SCHOOL_NOT_FOUND") ++not_found;
        }
        validated += entry.second.size();
        ctx.tables->proposal_validations.append(entry.first, entry.second);
        result.years_processed++;
    }
    result.rows_written = validated;

    if (not_found > 0) {
        result.warnings.push_back(std::to_string(not_found) +
                                  " proposals reference a school-year with no resolved gaps; rejected as SCHOOL_NOT_FOUND");
    }

    for (ProposalDecision decision : {ProposalDecision::Accepted, ProposalDecision::Flagged,
                                      ProposalDecision::Rejected}) {
        result.summary["count_" + to_string(decision)] = std::to_string(decision_counts[decision]);
    }
    result.summary["previously_validated"] = std::to_string(kept);
    result.summary["mean_confidence"] =
        format_double(validated > 0 ? confidence_sum / static_cast<double>(validated) : 0.0, 3);
}

} // namespace schoolgov
