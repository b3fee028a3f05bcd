/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace schoolgov;
using json = nlohmann::json;

namespace {

std::string log_path() {
    return (std::filesystem::temp_directory_path() / "schoolgov_test_logger.log").string();
}

// Routes the singleton to a fresh file with console output off
Logger& file_logger(bool enable_json = true, LogLevel min_level = LogLevel::DEBUG) {
    std::filesystem::remove(log_path());

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = log_path();
    config.enable_json = enable_json;

    Logger& logger = Logger::get_instance();
    logger.configure(config);
    return logger;
}

std::vector<std::string> read_lines() {
    Logger::get_instance().flush();
    std::ifstream in(log_path());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<json> read_events() {
    std::vector<json> events;
    for (const auto& line : read_lines()) {
        events.push_back(json::parse(line));
    }
    return events;
}

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(log_path());
}

} // anonymous namespace

TEST_CASE("Logger configuration", "[logger]") {
    SECTION("Defaults") {
        LoggerConfig config;
        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console);
        REQUIRE_FALSE(config.enable_file);
        REQUIRE(config.enable_json);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Level filtering") {
        Logger& logger = file_logger(true, LogLevel::WARN);
        logger.debug("hidden");
        logger.info("hidden too");
        logger.log_warning(ExecutionContext("risk", "risk_scorer"), "shown");

        auto events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["level"] == "WARN");
        REQUIRE(events[0]["warning"] == "shown");
    }

    quiet_logger();
}

TEST_CASE("Stage lifecycle events", "[logger]") {
    Logger& logger = file_logger();
    ExecutionContext ctx("budget", "budget_allocator");
    StageInfo info("Budget Allocator", "1.0.0", "budget_allocator", "budget_simulation");

    SECTION("stage_init carries the stage configuration") {
        logger.log_stage_init(ctx, info, {{"classroom_budget", "250000000"}, {"teacher_posts", "40"}});

        auto events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["event"] == "stage_init");
        REQUIRE(events[0]["stage_name"] == "Budget Allocator");
        REQUIRE(events[0]["output_table"] == "budget_simulation");
        REQUIRE(events[0]["config.teacher_posts"] == "40");
        REQUIRE_FALSE(events[0].contains("config_truncated"));
        REQUIRE(events[0].contains("timestamp"));
    }

    SECTION("Large configurations are truncated") {
        std::map<std::string, std::string> config;
        for (int i = 0; i < 12; ++i) {
            config["key" + std::to_string(i)] = std::to_string(i);
        }
        logger.log_stage_init(ctx, info, config);

        auto event = read_events().at(0);
        REQUIRE(event["config_truncated"] == "true");
        REQUIRE(event["config_total_count"] == "12");
    }

    SECTION("stage_start names the year range") {
        ctx.attempt = 1;
        ctx.phase = "run";
        logger.log_stage_start(ctx, {"2021-22", "2022-23", "2023-24"});

        auto event = read_events().at(0);
        REQUIRE(event["event"] == "stage_start");
        REQUIRE(event["attempt"] == "1");
        REQUIRE(event["year_count"] == "3");
        REQUIRE(event["first_year"] == "2021-22");
        REQUIRE(event["last_year"] == "2023-24");
    }

    SECTION("stage_complete carries summary and warnings") {
        StageResult result;
        result.rows_written = 120;
        result.years_processed = 2;
        result.summary["classroom_cap"] = "500";
        result.warnings.push_back("3 scored school-years in 2023-24 have no teacher gap row and were not allocated");

        PerformanceMetrics metrics;
        metrics.compute_time_ms = 4.0;
        logger.log_stage_complete(ctx, result, metrics);

        auto event = read_events().at(0);
        REQUIRE(event["event"] == "stage_complete");
        REQUIRE(event["level"] == "INFO");
        REQUIRE(event["success"] == "true");
        REQUIRE(event["rows_written"] == "120");
        REQUIRE(event["summary.classroom_cap"] == "500");
        REQUIRE(event["warning_count"] == "1");
        REQUIRE_FALSE(event.contains("error"));
    }

    SECTION("Failed stage_complete is an error") {
        StageResult result;
        result.success = false;
        result.error_message = "cost_per_classroom must be positive";
        logger.log_stage_complete(ctx, result, PerformanceMetrics());

        auto event = read_events().at(0);
        REQUIRE(event["level"] == "ERROR");
        REQUIRE(event["error"] == "cost_per_classroom must be positive");
    }

    SECTION("Retries and pipeline summary") {
        logger.log_retry(ctx, "I/O failure: disk full", 200);
        logger.log_pipeline_complete(false, 8, 1, 52.5);

        auto events = read_events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0]["event"] == "stage_retry");
        REQUIRE(events[0]["delay_ms"] == "200");
        REQUIRE(events[0]["error_message"] == "I/O failure: disk full");
        REQUIRE(events[1]["event"] == "pipeline_complete");
        REQUIRE(events[1]["level"] == "ERROR");
        REQUIRE(events[1]["stages_run"] == "8");
        REQUIRE(events[1]["stages_failed"] == "1");
    }

    SECTION("Skipped stages and written tables") {
        logger.log_stage_skipped(ExecutionContext("trend", "risk_trend"), "risk");
        ExecutionContext write_ctx("risk_scores", "json");
        write_ctx.phase = "write";
        logger.log_table_written(write_ctx, "out/risk_scores.json", 1200);

        auto events = read_events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0]["event"] == "stage_skipped");
        REQUIRE(events[0]["level"] == "WARN");
        REQUIRE(events[0]["blocked_by"] == "risk");
        REQUIRE(events[1]["event"] == "table_written");
        REQUIRE(events[1]["level"] == "DEBUG");
        REQUIRE(events[1]["rows"] == "1200");
    }

    quiet_logger();
}

TEST_CASE("Facts loaded event", "[logger]") {
    FactTables facts;
    School s;
    s.school_id = 1;
    s.district = "North";
    facts.add_school(s);
    facts.add_yearly_metric({1, "2022-23", 400});
    facts.add_yearly_metric({1, "2023-24", 420});

    Logger& logger = file_logger();
    logger.log_facts_loaded(facts, 3);

    auto event = read_events().at(0);
    REQUIRE(event["event"] == "facts_loaded");
    REQUIRE(event["schools"] == "1");
    REQUIRE(event["yearly_metrics"] == "2");
    REQUIRE(event["infrastructure"] == "0");
    REQUIRE(event["proposals"] == "3");
    REQUIRE(event["first_year"] == "2022-23");
    REQUIRE(event["last_year"] == "2023-24");

    quiet_logger();
}

TEST_CASE("Log output formats", "[logger]") {
    SECTION("Special characters stay valid JSON") {
        Logger& logger = file_logger();
        logger.log_error(ExecutionContext("proposals", "proposal_validator"),
                         "bad \"row\"\n\tat line 3\\4");

        auto event = read_events().at(0);
        REQUIRE(event["error_message"] == "bad \"row\"\n\tat line 3\\4");
        REQUIRE(event["phase"] == "");
    }

    SECTION("Plain text") {
        Logger& logger = file_logger(false);
        logger.info("Facts loaded", {{"schools", "3"}, {"event", "facts_loaded"}});

        auto lines = read_lines();
        REQUIRE(lines.size() == 1);
        REQUIRE_THAT(lines[0], Catch::Matchers::ContainsSubstring("[INFO] Facts loaded {event=facts_loaded, schools=3}"));
    }

    quiet_logger();
}
