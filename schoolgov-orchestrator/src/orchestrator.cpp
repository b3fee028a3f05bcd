/**
 * @file orchestrator.cpp
 * @brief Implementation of Orchestrator with retry and fallback handling
 */

#include "orchestrator.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace schoolgov {

Orchestrator::Orchestrator(const orchestrator::PipelineConfig& config, Logger* logger)
    : config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    orchestrator::validate_pipeline_config(config_);
}

void Orchestrator::select_stages(const std::vector<std::string>& stage_ids) {
    for (const auto& id : stage_ids) {
        if (!orchestrator::find_stage(config_, id)) {
            throw orchestrator::PipelineConfigError("Unknown stage id: " + id);
        }
    }
    selected_ = std::set<std::string>(stage_ids.begin(), stage_ids.end());
}

PipelineResult Orchestrator::execute() {
    auto start_time = std::chrono::steady_clock::now();

    try {
        load_inputs();
    } catch (const std::exception& e) {
        PipelineResult result;
        result.success = false;
        result.errors.push_back(std::string("Failed to load inputs: ") + e.what());
        ExecutionContext ctx("input", "csv");
        ctx.phase = "load";
        logger_->log_error(ctx, result.errors.back());
        logger_->log_pipeline_complete(false, 0, 0, 0.0);
        return result;
    }

    PipelineResult result = run_stages(*facts_, *tables_, proposals_.get());

    if (result.success || result.partial_result) {
        write_outputs(*tables_, result);
    }

    auto end_time = std::chrono::steady_clock::now();
    result.total_execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    size_t failed = 0;
    for (const auto& pair : result.stage_results) {
        if (!pair.second.success) ++failed;
    }
    logger_->log_pipeline_complete(result.success, result.stages_run.size(), failed,
                                   result.total_execution_time_ms);
    return result;
}

PipelineResult Orchestrator::run(const FactTables& facts, DerivedTables& tables, const ProposalSet* proposals) {
    PipelineResult result = run_stages(facts, tables, proposals);

    size_t failed = 0;
    for (const auto& pair : result.stage_results) {
        if (!pair.second.success) ++failed;
    }
    logger_->log_pipeline_complete(result.success, result.stages_run.size(), failed,
                                   result.total_execution_time_ms);
    return result;
}

void Orchestrator::write_outputs(const DerivedTables& tables, PipelineResult& result) {
    const std::string extension = config_.output.type == "parquet" ? ".parquet" : ".json";

    for (const auto& table : io::export_tables(tables)) {
        const std::string path = (fs::path(config_.output.path) / (table.name + extension)).string();
        try {
            write_table_with_retry(table, path);
            result.files_written.push_back(path);
        } catch (const PipelineError& e) {
            result.success = false;
            result.errors.push_back("Failed to write table " + table.name + ": " + e.what());
        }
    }
}

// Private helper methods

void Orchestrator::load_inputs() {
    FactSourcePaths paths;
    paths.schools = config_.data_sources.at("schools").path;
    paths.yearly_metrics = config_.data_sources.at("yearly_metrics").path;
    paths.infrastructure = config_.data_sources.at("infrastructure").path;
    paths.teacher_metrics = config_.data_sources.at("teacher_metrics").path;

    facts_ = std::make_unique<FactTables>(FactTables::load(paths));
    tables_ = std::make_unique<DerivedTables>();
    proposals_.reset();

    auto it = config_.data_sources.find("proposals");
    if (it != config_.data_sources.end() && !it->second.path.empty()) {
        proposals_ = std::make_unique<ProposalSet>(ProposalSet::load_from_csv(it->second.path));
    }

    logger_->log_facts_loaded(*facts_, proposals_ ? proposals_->size() : 0);
}

PipelineResult Orchestrator::run_stages(const FactTables& facts, DerivedTables& tables, const ProposalSet* proposals) {
    PipelineResult result;
    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::string> execution_order = orchestrator::compute_execution_order(config_);
    result.years = resolve_years(facts, result);

    std::map<std::string, std::unique_ptr<IPipelineStage>> stages;
    try {
        stages = initialize_stages(execution_order);
    } catch (const ConfigurationError& e) {
        result.success = false;
        result.errors.push_back(e.what());
        return result;
    }

    result.stage_years = plan_stage_years(execution_order, stages, facts, result.years);

    PipelineContext ctx(&facts, &tables, proposals);
    std::set<std::string> failed_or_skipped;

    for (const auto& stage_id : execution_order) {
        if (!is_selected(stage_id)) {
            continue;
        }
        const orchestrator::StageNode* node = orchestrator::find_stage(config_, stage_id);

        // Under a continuing fallback, stages downstream of a failure are skipped
        std::string blocked_by;
        for (const auto& dep : node->depends_on) {
            if (failed_or_skipped.count(dep) > 0) {
                blocked_by = dep;
                break;
            }
        }
        if (!blocked_by.empty()) {
            failed_or_skipped.insert(stage_id);
            result.stages_skipped.push_back(stage_id);
            result.warnings.push_back("Stage " + stage_id + " skipped: dependency " + blocked_by + " did not complete");
            logger_->log_stage_skipped(ExecutionContext(node->id, node->type), blocked_by);
            continue;
        }

        IPipelineStage& stage = *stages.at(stage_id);
        ExecutionContext log_ctx(node->id, node->type);
        log_ctx.phase = "run";

        auto stage_start = std::chrono::steady_clock::now();
        StageResult stage_result;

        try {
            stage_result = execute_with_retry(*node, stage, ctx, result.stage_years.at(stage_id));
        } catch (const StageOrderingError& e) {
            // Never retried, whatever the fallback strategy
            stage_result.success = false;
            stage_result.error_message = e.what();
            result.stage_results[stage_id] = stage_result;
            logger_->log_error(log_ctx, e.what());
            result.success = false;
            result.failed_stage_id = stage_id;
            result.errors.push_back(e.what());
            break;
        }

        auto stage_end = std::chrono::steady_clock::now();

        PerformanceMetrics metrics;
        metrics.execution_time_ms = std::chrono::duration<double, std::milli>(stage_end - stage_start).count();
        metrics.compute_time_ms = stage_result.execution_time_ms;
        metrics.input_rows = stage_result.input_rows;
        metrics.rows_written = stage_result.rows_written;
        logger_->log_stage_complete(log_ctx, stage_result, metrics);

        result.stage_results[stage_id] = stage_result;
        result.stages_run.push_back(stage_id);

        for (const auto& warning : stage_result.warnings) {
            logger_->log_warning(log_ctx, warning);
            result.warnings.push_back(stage_id + ": " + warning);
        }

        if (!stage_result.success) {
            log_stage_failure(*node, stage_result);
            failed_or_skipped.insert(stage_id);

            if (should_continue_after_error(stage_id)) {
                result.partial_result = true;
                result.warnings.push_back("Stage " + stage_id + " failed but continuing: " +
                                          stage_result.error_message);
            } else {
                result.success = false;
                result.failed_stage_id = stage_id;
                result.errors.push_back("Critical stage failure: " + stage_id + " - " +
                                        stage_result.error_message);
                break;
            }
        }
    }

    if (result.partial_result) {
        result.success = false;
    }

    for (auto& pair : stages) {
        pair.second->dispose();
    }

    auto end_time = std::chrono::steady_clock::now();
    result.total_execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    return result;
}

std::vector<std::string> Orchestrator::resolve_years(const FactTables& facts, PipelineResult& result) const {
    if (config_.years.empty()) {
        return facts.academic_years();
    }

    const auto fact_years = facts.academic_years();
    const std::set<std::string> known(fact_years.begin(), fact_years.end());
    std::set<std::string> years(config_.years.begin(), config_.years.end());
    for (const auto& year : years) {
        if (known.count(year) == 0) {
            result.warnings.push_back("Academic year " + year + " has no enrolment facts");
        }
    }
    return std::vector<std::string>(years.begin(), years.end());
}

// Every selected stage covers the run's years. An upstream stage also covers
// whatever years its selected dependents read, e.g. the risk history behind
// the persistent and chronic flags.
std::map<std::string, std::vector<std::string>> Orchestrator::plan_stage_years(
    const std::vector<std::string>& order,
    const std::map<std::string, std::unique_ptr<IPipelineStage>>& stages,
    const FactTables& facts,
    const std::vector<std::string>& years
) const {
    std::map<std::string, std::set<std::string>> needed;

    // Reverse topological order: dependents are planned before their inputs
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        if (!is_selected(*it)) {
            continue;
        }
        std::set<std::string>& own = needed[*it];
        own.insert(years.begin(), years.end());

        const std::vector<std::string> run_years(own.begin(), own.end());
        const auto inputs = stages.at(*it)->input_years(facts, run_years);
        for (const auto& dep : orchestrator::find_stage(config_, *it)->depends_on) {
            if (is_selected(dep)) {
                needed[dep].insert(inputs.begin(), inputs.end());
            }
        }
    }

    std::map<std::string, std::vector<std::string>> planned;
    for (const auto& [stage_id, stage_years] : needed) {
        planned[stage_id].assign(stage_years.begin(), stage_years.end());
        if (stage_years.size() > years.size()) {
            const orchestrator::StageNode* node = orchestrator::find_stage(config_, stage_id);
            logger_->info("Stage covers extra years for downstream inputs",
                          {{"event", "stage_years_widened"},
                           {"stage_id", stage_id},
                           {"stage_type", node->type},
                           {"year_count", std::to_string(stage_years.size())},
                           {"first_year", *stage_years.begin()},
                           {"last_year", *stage_years.rbegin()}});
        }
    }
    return planned;
}

std::map<std::string, std::unique_ptr<IPipelineStage>> Orchestrator::initialize_stages(
    const std::vector<std::string>& order
) {
    std::map<std::string, std::unique_ptr<IPipelineStage>> stages;

    for (const auto& stage_id : order) {
        if (!is_selected(stage_id)) {
            continue;
        }
        const orchestrator::StageNode* node = orchestrator::find_stage(config_, stage_id);

        ExecutionContext log_ctx(node->id, node->type);
        log_ctx.phase = "init";

        try {
            auto stage = stage_factory_.create_stage(node->type);
            stage->initialize(node->config);
            logger_->log_stage_init(log_ctx, stage->get_info(), node->config);
            stages[stage_id] = std::move(stage);
        } catch (const ConfigurationError& e) {
            logger_->log_error(log_ctx, e.what());
            throw ConfigurationError("stage " + stage_id + ": " + e.what());
        }
    }

    return stages;
}

StageResult Orchestrator::execute_with_retry(
    const orchestrator::StageNode& node,
    IPipelineStage& stage,
    PipelineContext& ctx,
    const std::vector<std::string>& years,
    size_t attempt
) {
    ExecutionContext log_ctx(node.id, node.type);
    log_ctx.attempt = attempt;
    log_ctx.phase = "run";
    logger_->log_stage_start(log_ctx, years);

    StageResult result;
    try {
        result = stage.run(ctx, years);
    } catch (const StageOrderingError&) {
        throw;
    } catch (const std::exception& e) {
        result.success = false;
        result.error_message = e.what();
    }

    const auto& settings = config_.orchestrator;
    if (!result.success && settings.enable_retry &&
        attempt < static_cast<size_t>(settings.max_retry_attempts)) {

        int delay_ms = backoff_delay_ms(attempt);
        logger_->log_retry(log_ctx, result.error_message, delay_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));

        return execute_with_retry(node, stage, ctx, years, attempt + 1);
    }

    return result;
}

void Orchestrator::write_table_with_retry(const io::TableData& table, const std::string& path, size_t attempt) {
    ExecutionContext log_ctx(table.name, config_.output.type);
    log_ctx.attempt = attempt;
    log_ctx.phase = "write";

    try {
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        if (ec) {
            throw TransientIOError("cannot create output directory for " + path + ": " + ec.message());
        }

        try {
            if (config_.output.type == "parquet") {
                ParquetWriter::write_table(table, path);
            } else {
                io::write_table_json(path, table);
            }
        } catch (const std::runtime_error& e) {
            throw TransientIOError(e.what());
        }

        logger_->log_table_written(log_ctx, path, table.rows.size());

    } catch (const TransientIOError& e) {
        const auto& settings = config_.orchestrator;
        if (settings.enable_retry && attempt < static_cast<size_t>(settings.max_retry_attempts)) {
            int delay_ms = backoff_delay_ms(attempt);
            logger_->log_retry(log_ctx, e.what(), delay_ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            write_table_with_retry(table, path, attempt + 1);
            return;
        }
        logger_->log_error(log_ctx, e.what());
        throw;
    }
}

int Orchestrator::backoff_delay_ms(size_t attempt) const {
    return config_.orchestrator.retry_delay_ms * (1 << attempt);  // d, 2d, 4d, ...
}

bool Orchestrator::is_selected(const std::string& stage_id) const {
    return selected_.empty() || selected_.count(stage_id) > 0;
}

bool Orchestrator::is_optional_stage(const std::string& stage_id) const {
    const orchestrator::StageNode* node = orchestrator::find_stage(config_, stage_id);
    if (!node) {
        return false;
    }
    auto optional_it = node->config.find("optional");
    if (optional_it != node->config.end()) {
        return optional_it->second == "true" || optional_it->second == "1";
    }
    return false;
}

bool Orchestrator::should_continue_after_error(const std::string& stage_id) const {
    switch (config_.orchestrator.fallback_strategy) {
        case orchestrator::FallbackStrategy::FAIL_FAST:
            return false;

        case orchestrator::FallbackStrategy::SKIP_OPTIONAL:
            return is_optional_stage(stage_id);

        case orchestrator::FallbackStrategy::BEST_EFFORT:
            return true;
    }
    return false;
}

void Orchestrator::log_stage_failure(const orchestrator::StageNode& node, const StageResult& result) {
    ExecutionContext ctx(node.id, node.type);
    ctx.phase = "run";

    std::ostringstream error_details;
    error_details << result.error_message;
    if (result.execution_time_ms > 0) {
        error_details << " [execution_time: " << result.execution_time_ms << "ms"
                      << ", years_processed: " << result.years_processed
                      << ", rows_written: " << result.rows_written << "]";
    }

    logger_->log_error(ctx, error_details.str());
}

} // namespace schoolgov
