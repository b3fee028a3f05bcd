/**
 * @file logger.cpp
 * @brief Structured logger: event builders and the JSON / plain-text sinks
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace schoolgov {

namespace {

constexpr size_t MAX_CONFIG_FIELDS = 10;
constexpr size_t MAX_WARNING_FIELDS = 5;

std::string fixed(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
            file_stream_.reset();
        }
    }
}

// ============================================================================
// Events
// ============================================================================

LogFields Logger::stage_fields(const std::string& event, const ExecutionContext& ctx) {
    LogFields fields;
    fields["event"] = event;
    fields["stage_id"] = ctx.stage_id;
    fields["stage_type"] = ctx.stage_type;
    fields["attempt"] = std::to_string(ctx.attempt);
    fields["phase"] = ctx.phase;
    return fields;
}

void Logger::log_stage_init(const ExecutionContext& ctx, const StageInfo& info, const LogFields& config) {
    LogFields fields = stage_fields("stage_init", ctx);
    fields["stage_name"] = info.name;
    fields["stage_version"] = info.version;
    fields["output_table"] = info.output_table;

    size_t copied = 0;
    for (auto it = config.begin(); it != config.end() && copied < MAX_CONFIG_FIELDS; ++it, ++copied) {
        fields["config." + it->first] = it->second;
    }
    if (config.size() > MAX_CONFIG_FIELDS) {
        fields["config_truncated"] = "true";
        fields["config_total_count"] = std::to_string(config.size());
    }

    log(LogLevel::INFO, "Stage initialized", fields);
}

void Logger::log_stage_start(const ExecutionContext& ctx, const std::vector<std::string>& years) {
    LogFields fields = stage_fields("stage_start", ctx);
    fields["year_count"] = std::to_string(years.size());
    if (!years.empty()) {
        fields["first_year"] = years.front();
        fields["last_year"] = years.back();
    }

    log(LogLevel::INFO, "Starting stage", fields);
}

void Logger::log_stage_complete(const ExecutionContext& ctx, const StageResult& result,
                                const PerformanceMetrics& metrics) {
    LogFields fields = stage_fields("stage_complete", ctx);
    fields["success"] = result.success ? "true" : "false";
    fields["execution_time_ms"] = fixed(metrics.execution_time_ms);
    fields["compute_time_ms"] = fixed(metrics.compute_time_ms);
    fields["input_rows"] = std::to_string(metrics.input_rows);
    fields["rows_written"] = std::to_string(result.rows_written);
    fields["years_processed"] = std::to_string(result.years_processed);
    fields["rows_per_sec"] = fixed(
        metrics.compute_time_ms > 0 ? result.rows_written * 1000.0 / metrics.compute_time_ms : 0.0);

    for (const auto& entry : result.summary) {
        fields["summary." + entry.first] = entry.second;
    }

    if (!result.warnings.empty()) {
        fields["warning_count"] = std::to_string(result.warnings.size());
        const size_t shown = std::min(result.warnings.size(), MAX_WARNING_FIELDS);
        for (size_t i = 0; i < shown; ++i) {
            fields["warning_" + std::to_string(i)] = result.warnings[i];
        }
    }

    if (!result.success) {
        fields["error"] = result.error_message;
    }

    log(result.success ? LogLevel::INFO : LogLevel::ERROR, "Stage completed", fields);
}

void Logger::log_stage_skipped(const ExecutionContext& ctx, const std::string& blocked_by) {
    LogFields fields = stage_fields("stage_skipped", ctx);
    fields["blocked_by"] = blocked_by;

    log(LogLevel::WARN, "Stage skipped", fields);
}

void Logger::log_retry(const ExecutionContext& ctx, const std::string& error_message, int delay_ms) {
    LogFields fields = stage_fields("stage_retry", ctx);
    fields["error_message"] = error_message;
    fields["delay_ms"] = std::to_string(delay_ms);

    log(LogLevel::WARN, "Retrying stage", fields);
}

void Logger::log_error(const ExecutionContext& ctx, const std::string& error_message) {
    LogFields fields = stage_fields("error", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Stage error", fields);
}

void Logger::log_warning(const ExecutionContext& ctx, const std::string& warning_message) {
    LogFields fields = stage_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_facts_loaded(const FactTables& facts, size_t proposals) {
    LogFields fields;
    fields["event"] = "facts_loaded";
    fields["schools"] = std::to_string(facts.school_count());
    fields["yearly_metrics"] = std::to_string(facts.yearly_metric_count());
    fields["infrastructure"] = std::to_string(facts.infrastructure_count());
    fields["teacher_metrics"] = std::to_string(facts.teacher_metric_count());
    fields["proposals"] = std::to_string(proposals);

    const auto years = facts.academic_years();
    fields["year_count"] = std::to_string(years.size());
    if (!years.empty()) {
        fields["first_year"] = years.front();
        fields["last_year"] = years.back();
    }

    log(LogLevel::INFO, "Facts loaded", fields);
}

void Logger::log_table_written(const ExecutionContext& ctx, const std::string& path, size_t rows) {
    LogFields fields = stage_fields("table_written", ctx);
    fields["path"] = path;
    fields["rows"] = std::to_string(rows);

    log(LogLevel::DEBUG, "Table written", fields);
}

void Logger::log_pipeline_complete(bool success, size_t stages_run, size_t stages_failed, double total_time_ms) {
    LogFields fields;
    fields["event"] = "pipeline_complete";
    fields["success"] = success ? "true" : "false";
    fields["stages_run"] = std::to_string(stages_run);
    fields["stages_failed"] = std::to_string(stages_failed);
    fields["total_time_ms"] = fixed(total_time_ms);

    log(success ? LogLevel::INFO : LogLevel::ERROR, "Pipeline completed", fields);
}

void Logger::info(const std::string& message, const LogFields& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::debug(const std::string& message, const LogFields& fields) {
    log(LogLevel::DEBUG, message, fields);
}

// ============================================================================
// Sinks
// ============================================================================

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const LogFields& fields) {
    if (level < config_.min_level) {
        return;
    }

    const std::string line = format_line(level, message, fields);

    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string Logger::format_line(LogLevel level, const std::string& message, const LogFields& fields) const {
    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = timestamp();
        line["level"] = level_to_string(level);
        line["message"] = message;
        // Invalid UTF-8 in a CSV-derived message must not lose the event
        return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;
    oss << timestamp() << " [" << level_to_string(level) << "] " << message;
    if (!fields.empty()) {
        oss << " {";
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            if (it != fields.begin()) oss << ", ";
            oss << it->first << "=" << it->second;
        }
        oss << "}";
    }
    return oss.str();
}

// UTC, ISO 8601 with milliseconds
std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &seconds);
#else
    gmtime_r(&seconds, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace schoolgov
