#include <cmath>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "academic_year.hpp"
#include "budget_allocator.hpp"
#include "config_parser.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "pipeline_stages.hpp"

namespace fs = std::filesystem;
using namespace schoolgov;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string data_dir;
    std::string years;                  // comma-separated
    std::vector<std::string> stages;    // stage ids
    std::string proposals_path;
    std::string output_path;
    std::string format;                 // json | parquet
    bool help = false;
    // Budget dry run
    bool simulate_budget = false;
    double total_budget = 500000000.0;
    double cost_per_unit = 500000.0;
    int64_t max_teachers = 10000;
    std::string year;
    // Logging overrides
    std::string log_level;
    bool log_json = false;
    std::string log_file;
};

void print_usage(const char* program_name) {
    std::cerr << "schoolgov pipeline v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON pipeline configuration\n";
    std::cerr << "  --data-dir <dir>            Directory with schools.csv, yearly_metrics.csv,\n";
    std::cerr << "                              infrastructure.csv, teacher_metrics.csv\n";
    std::cerr << "                              (runs the built-in nine-stage pipeline)\n";
    std::cerr << "  --proposals <path>          Proposal submissions CSV\n\n";
    std::cerr << "Selection options:\n";
    std::cerr << "  --years <list>              Academic years, e.g. 2021-22,2022-23 (default: all)\n";
    std::cerr << "  --stage <id>                Run only this stage; repeatable\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <dir>              Output directory for derived tables (default: output)\n";
    std::cerr << "  --format <json|parquet>     Output format (default: json)\n\n";
    std::cerr << "Budget dry run:\n";
    std::cerr << "  --simulate-budget           Allocate against the budget below and print a report;\n";
    std::cerr << "                              committed tables are not written\n";
    std::cerr << "  --total-budget <amount>     Total classroom budget (default: 500000000)\n";
    std::cerr << "  --cost-per-unit <amount>    Cost per classroom (default: 500000)\n";
    std::cerr << "  --max-teachers <count>      Teacher-post cap (default: 10000)\n";
    std::cerr << "  --year <year>               Academic year (default: latest)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR\n";
    std::cerr << "  --log-json                  Emit JSON log lines\n";
    std::cerr << "  --log-file <path>           Also append logs to this file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Full recompute over CSV facts:\n";
    std::cerr << "     " << program_name << " --data-dir data --output out\n\n";
    std::cerr << "  2. Rescore one year from a pipeline file:\n";
    std::cerr << "     " << program_name << " --config pipeline.json --years 2023-24 \\\n";
    std::cerr << "         --stage classroom_gaps --stage teacher_gaps --stage risk\n\n";
    std::cerr << "  3. Budget what-if:\n";
    std::cerr << "     " << program_name << " --data-dir data --simulate-budget \\\n";
    std::cerr << "         --total-budget 100000000 --cost-per-unit 400000 --max-teachers 2500\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--data-dir" && i + 1 < argc) {
                args.data_dir = argv[++i];
            } else if (arg == "--years" && i + 1 < argc) {
                args.years = argv[++i];
            } else if (arg == "--stage" && i + 1 < argc) {
                args.stages.push_back(argv[++i]);
            } else if (arg == "--proposals" && i + 1 < argc) {
                args.proposals_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                args.format = argv[++i];
            } else if (arg == "--simulate-budget") {
                args.simulate_budget = true;
            } else if (arg == "--total-budget" && i + 1 < argc) {
                args.total_budget = std::stod(argv[++i]);
            } else if (arg == "--cost-per-unit" && i + 1 < argc) {
                args.cost_per_unit = std::stod(argv[++i]);
            } else if (arg == "--max-teachers" && i + 1 < argc) {
                args.max_teachers = std::stoll(argv[++i]);
            } else if (arg == "--year" && i + 1 < argc) {
                args.year = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-json") {
                args.log_json = true;
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid number for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty() && args.data_dir.empty()) {
        std::cerr << "Error: Must provide either --config or --data-dir\n";
        valid = false;
    } else if (!args.config_path.empty() && !args.data_dir.empty()) {
        std::cerr << "Warning: Both --config and --data-dir provided. Using config file.\n";
    }

    if (!args.config_path.empty() && !fs::exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }
    if (args.config_path.empty() && !args.data_dir.empty() && !fs::is_directory(args.data_dir)) {
        std::cerr << "Error: Data directory not found: " << args.data_dir << "\n";
        valid = false;
    }
    if (!args.proposals_path.empty() && !fs::exists(args.proposals_path)) {
        std::cerr << "Error: Proposals file not found: " << args.proposals_path << "\n";
        valid = false;
    }

    if (!args.format.empty() && args.format != "json" && args.format != "parquet") {
        std::cerr << "Error: --format must be json or parquet\n";
        valid = false;
    }
    if (args.format == "parquet" && !ParquetWriter::available()) {
        std::cerr << "Error: Parquet output requested but this build has no Apache Arrow support\n";
        valid = false;
    }

    if (!args.years.empty()) {
        try {
            parse_academic_year_list(args.years);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: --years: " << e.what() << "\n";
            valid = false;
        }
    }
    if (!args.year.empty() && !is_academic_year(args.year)) {
        std::cerr << "Error: --year must look like 2023-24, got " << args.year << "\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.simulate_budget) {
        if (!(args.total_budget >= 0) || !std::isfinite(args.total_budget)) {
            std::cerr << "Error: --total-budget must be a finite non-negative amount\n";
            valid = false;
        }
        if (!(args.cost_per_unit > 0) || !std::isfinite(args.cost_per_unit)) {
            std::cerr << "Error: --cost-per-unit must be a finite positive amount\n";
            valid = false;
        }
        if (args.max_teachers < 0) {
            std::cerr << "Error: --max-teachers must be non-negative\n";
            valid = false;
        }
    }

    return valid;
}

orchestrator::PipelineConfig build_config(const CLIArgs& args) {
    orchestrator::PipelineConfig config;
    if (!args.config_path.empty()) {
        config = orchestrator::parse_pipeline_config_from_file(args.config_path);
    } else {
        config = orchestrator::default_pipeline_config(args.data_dir, "output");
    }

    if (!args.proposals_path.empty()) {
        config.data_sources["proposals"] = orchestrator::DataSource("proposals", "csv", args.proposals_path);
    }
    if (!args.output_path.empty()) {
        config.output.path = args.output_path;
    }
    if (!args.format.empty()) {
        config.output.type = args.format;
    }
    if (!args.years.empty()) {
        config.years = parse_academic_year_list(args.years);
    }

    if (!args.log_level.empty()) {
        config.logging.level = args.log_level;
    }
    if (args.log_json) {
        config.logging.json = true;
    } else if (args.config_path.empty()) {
        config.logging.json = false;  // plain text on a terminal unless asked
    }
    if (!args.log_file.empty()) {
        config.logging.file = args.log_file;
    }

    orchestrator::validate_pipeline_config(config);
    return config;
}

void configure_logger(const orchestrator::LoggingSettings& settings) {
    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(settings.level);
    logger_config.enable_json = settings.json;
    if (!settings.file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = settings.file;
    }
    Logger::get_instance().configure(logger_config);
}

// Ids of the stages a budget dry run needs: both gap resolvers and the risk scorer
std::vector<std::string> dry_run_stage_ids(const orchestrator::PipelineConfig& config) {
    std::vector<std::string> ids;
    for (const auto& stage : config.stages) {
        if (stage.type == StageType::CLASSROOM_GAP || stage.type == StageType::TEACHER_GAP ||
            stage.type == StageType::RISK) {
            ids.push_back(stage.id);
        }
    }
    return ids;
}

int run_budget_dry_run(const CLIArgs& args, orchestrator::PipelineConfig config) {
    FactSourcePaths paths;
    paths.schools = config.data_sources.at("schools").path;
    paths.yearly_metrics = config.data_sources.at("yearly_metrics").path;
    paths.infrastructure = config.data_sources.at("infrastructure").path;
    paths.teacher_metrics = config.data_sources.at("teacher_metrics").path;
    FactTables facts = FactTables::load(paths);

    std::string year = args.year;
    if (year.empty()) {
        auto latest = facts.latest_year();
        if (!latest) {
            std::cerr << "Error: No enrolment facts to allocate against\n";
            return 1;
        }
        year = *latest;
    }
    config.years = {year};

    const std::vector<std::string> stage_ids = dry_run_stage_ids(config);
    if (stage_ids.size() != 3) {
        std::cerr << "Error: Budget dry run needs classroom_gap_resolver, teacher_gap_resolver "
                     "and risk_scorer stages in the pipeline\n";
        return 1;
    }

    Orchestrator orchestrator(config);
    orchestrator.select_stages(stage_ids);

    DerivedTables tables;
    PipelineResult result = orchestrator.run(facts, tables);
    if (!result.success) {
        for (const auto& error : result.errors) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    BudgetSimulationReport report = simulate_budget(facts, tables, year, args.total_budget,
                                                    args.cost_per_unit, args.max_teachers);

    if (args.output_path.empty()) {
        io::write_budget_report_json(std::cout, report);
        std::cout << "\n";
    } else {
        fs::create_directories(args.output_path);
        const std::string path = (fs::path(args.output_path) / "budget_dry_run.json").string();
        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open output file: " << path << "\n";
            return 1;
        }
        io::write_budget_report_json(file, report);
        std::cerr << "Dry-run report written to: " << path << "\n";
    }

    Logger::get_instance().info("Budget dry run", {
        {"event", "budget_dry_run"},
        {"academic_year", year},
        {"classroom_cap", std::to_string(report.classroom_cap)},
        {"classrooms_allocated", std::to_string(report.classrooms_allocated)},
        {"teachers_allocated", std::to_string(report.teachers_allocated)},
        {"funded", std::to_string(report.funded)},
        {"unfunded", std::to_string(report.unfunded)}
    });

    std::cerr << "Funded: " << report.funded
              << ", partially funded: " << report.partially_funded
              << ", unfunded: " << report.unfunded
              << " (utilisation " << report.budget_utilisation_pct << "%)\n";
    return 0;
}

int run_pipeline(const CLIArgs& args, const orchestrator::PipelineConfig& config) {
    std::cerr << "Configuration:\n";
    std::cerr << "  Stages:      " << config.stages.size() << "\n";
    std::cerr << "  Years:       " << (config.years.empty() ? std::string("all") : args.years) << "\n";
    std::cerr << "  Output:      " << config.output.path << " (" << config.output.type << ")\n";
    std::cerr << "  Fallback:    " << orchestrator::to_string(config.orchestrator.fallback_strategy) << "\n\n";

    Orchestrator orchestrator(config);
    if (!args.stages.empty()) {
        orchestrator.select_stages(args.stages);
    }

    PipelineResult result = orchestrator.execute();

    std::cerr << "\nStages run: " << result.stages_run.size();
    if (!result.stages_skipped.empty()) {
        std::cerr << ", skipped: " << result.stages_skipped.size();
    }
    std::cerr << "\nTables written: " << result.files_written.size() << "\n";
    std::cerr << "Total time: " << result.total_execution_time_ms << " ms\n";

    for (const auto& warning : result.warnings) {
        std::cerr << "  warning: " << warning << "\n";
    }

    if (!result.success) {
        if (!result.failed_stage_id.empty()) {
            std::cerr << "Pipeline failed at stage: " << result.failed_stage_id << "\n";
        }
        for (const auto& error : result.errors) {
            std::cerr << "  error: " << error << "\n";
        }
        return result.partial_result ? 2 : 1;
    }

    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    try {
        orchestrator::PipelineConfig config = build_config(args);
        configure_logger(config.logging);

        if (args.simulate_budget) {
            return run_budget_dry_run(args, config);
        }
        return run_pipeline(args, config);

    } catch (const orchestrator::ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const orchestrator::PipelineConfigError& e) {
        std::cerr << "Error: Invalid pipeline configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
