/**
 * @file logger.hpp
 * @brief Structured event log for pipeline runs
 *
 * One line per event, either a JSON object or "timestamp [LEVEL] message {k=v, ...}".
 * Every stage event carries the stage id, stage type, attempt and phase so
 * a run can be reconstructed from the log alone.
 */

#ifndef SCHOOLGOV_LOGGER_HPP
#define SCHOOLGOV_LOGGER_HPP

#include "stage_interface.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace schoolgov {

enum class LogLevel {
    DEBUG,   ///< Per-table writes, per-year progress
    INFO,    ///< Stage start/end, facts loaded, pipeline summary
    WARN,    ///< Masked data conditions, retries, skipped stages
    ERROR    ///< Stage and pipeline failures
};

std::string level_to_string(LogLevel level);

// Unknown names map to INFO
LogLevel string_to_level(const std::string& level_str);

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Where a log event happened
 */
struct ExecutionContext {
    std::string stage_id;            ///< Stage id in the pipeline, or a table name for writes
    std::string stage_type;          ///< Stage type, or the sink type for writes
    size_t attempt;                  ///< 0 = first try
    std::string phase;               ///< init, run, write or load

    ExecutionContext() : attempt(0) {}

    ExecutionContext(const std::string& id, const std::string& type)
        : stage_id(id), stage_type(type), attempt(0) {}
};

/**
 * @brief Timing and volume of one stage
 */
struct PerformanceMetrics {
    double execution_time_ms;        ///< Including retries
    double compute_time_ms;          ///< Successful attempt only
    size_t input_rows;
    size_t rows_written;

    PerformanceMetrics()
        : execution_time_ms(0.0), compute_time_ms(0.0), input_rows(0), rows_written(0) {}
};

struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;             ///< stderr
    bool enable_file;
    std::string log_file_path;       ///< Opened in append mode
    bool enable_json;

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("schoolgov.log"),
          enable_json(true) {}
};

/**
 * @brief Process-wide structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   Logger::get_instance().configure(config);
 *
 *   ExecutionContext ctx("risk", "risk_scorer");
 *   Logger::get_instance().log_stage_start(ctx, {"2022-23", "2023-24"});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    // Replaces the sinks; a file that cannot be opened is reported on stderr
    void configure(const LoggerConfig& config);

    /**
     * @brief stage_init: stage metadata and up to ten configuration entries
     */
    void log_stage_init(const ExecutionContext& ctx, const StageInfo& info, const LogFields& config);

    /**
     * @brief stage_start: the academic years about to be recomputed
     */
    void log_stage_start(const ExecutionContext& ctx, const std::vector<std::string>& years);

    /**
     * @brief stage_complete: timing, row counts, warnings and the stage summary
     *
     * Logged at ERROR when the result failed.
     */
    void log_stage_complete(const ExecutionContext& ctx, const StageResult& result, const PerformanceMetrics& metrics);

    // stage_skipped: a dependency failed or was itself skipped
    void log_stage_skipped(const ExecutionContext& ctx, const std::string& blocked_by);

    void log_retry(const ExecutionContext& ctx, const std::string& error_message, int delay_ms);

    void log_error(const ExecutionContext& ctx, const std::string& error_message);

    void log_warning(const ExecutionContext& ctx, const std::string& warning_message);

    /**
     * @brief facts_loaded: row counts of the fact tables and proposals
     */
    void log_facts_loaded(const FactTables& facts, size_t proposals);

    // table_written, at DEBUG
    void log_table_written(const ExecutionContext& ctx, const std::string& path, size_t rows);

    void log_pipeline_complete(bool success, size_t stages_run, size_t stages_failed, double total_time_ms);

    void info(const std::string& message, const LogFields& fields = {});
    void debug(const std::string& message, const LogFields& fields = {});

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const LogFields& fields);
    std::string format_line(LogLevel level, const std::string& message, const LogFields& fields) const;
    static LogFields stage_fields(const std::string& event, const ExecutionContext& ctx);
    static std::string timestamp();
};

} // namespace schoolgov

#endif // SCHOOLGOV_LOGGER_HPP
