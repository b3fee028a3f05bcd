#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/pipeline_config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace schoolgov::orchestrator;
using Catch::Matchers::ContainsSubstring;

namespace {

PipelineConfig minimal_config() {
    PipelineConfig config;
    for (const auto& id : required_data_sources()) {
        config.data_sources[id] = DataSource(id, "csv", "data/" + id + ".csv");
    }
    config.stages.emplace_back("classroom_gaps", "classroom_gap_resolver");
    config.output = OutputConfig("json", "output");
    return config;
}

size_t position(const std::vector<std::string>& order, const std::string& id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

} // anonymous namespace

TEST_CASE("PipelineConfig validation", "[pipeline_config]") {
    SECTION("Minimal pipeline passes") {
        REQUIRE_NOTHROW(validate_pipeline_config(minimal_config()));
    }

    SECTION("Empty pipeline fails") {
        PipelineConfig config = minimal_config();
        config.stages.clear();
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);
    }

    SECTION("Duplicate stage ids fail") {
        PipelineConfig config = minimal_config();
        config.stages.emplace_back("classroom_gaps", "teacher_gap_resolver");
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("Duplicate stage ID"));
    }

    SECTION("Empty stage id or type fails") {
        PipelineConfig config = minimal_config();
        config.stages.emplace_back("", "risk_scorer");
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);

        config = minimal_config();
        config.stages.emplace_back("risk", "");
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("Stage type cannot be empty"));
    }

    SECTION("Missing fact source fails") {
        PipelineConfig config = minimal_config();
        config.data_sources.erase("teacher_metrics");
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("teacher_metrics"));
    }

    SECTION("Empty source path fails") {
        PipelineConfig config = minimal_config();
        config.data_sources["schools"].path = "";
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);
    }

    SECTION("Only CSV sources are accepted") {
        PipelineConfig config = minimal_config();
        config.data_sources["schools"].type = "parquet";
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("Unsupported data source type"));
    }

    SECTION("Output type and path") {
        PipelineConfig config = minimal_config();
        config.output.type = "csv";
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);

        config.output.type = "parquet";
        REQUIRE_NOTHROW(validate_pipeline_config(config));

        config.output.path = "";
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);
    }

    SECTION("Malformed year fails") {
        PipelineConfig config = minimal_config();
        config.years = {"2023-24", "2024"};
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("Invalid academic year"));
    }

    SECTION("Negative retry settings fail") {
        PipelineConfig config = minimal_config();
        config.orchestrator.max_retry_attempts = -1;
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);

        config = minimal_config();
        config.orchestrator.retry_delay_ms = -5;
        REQUIRE_THROWS_AS(validate_pipeline_config(config), PipelineConfigError);
    }
}

TEST_CASE("Execution order", "[pipeline_config]") {
    SECTION("Dependencies run first") {
        PipelineConfig config = minimal_config();
        config.stages.clear();
        config.stages.emplace_back("risk", "risk_scorer", std::vector<std::string>{"classroom_gaps", "teacher_gaps"});
        config.stages.emplace_back("teacher_gaps", "teacher_gap_resolver");
        config.stages.emplace_back("classroom_gaps", "classroom_gap_resolver");

        auto order = compute_execution_order(config);
        REQUIRE(order == std::vector<std::string>{"teacher_gaps", "classroom_gaps", "risk"});
    }

    SECTION("Ready stages keep declaration order") {
        auto config = default_pipeline_config("data", "output");
        auto order = compute_execution_order(config);

        REQUIRE(order.size() == 9);
        REQUIRE(order[0] == "classroom_gaps");
        REQUIRE(order[1] == "teacher_gaps");
        REQUIRE(position(order, "risk") < position(order, "priority"));
        REQUIRE(position(order, "risk") < position(order, "budget"));
        REQUIRE(order.back() == "proposals");
    }

    SECTION("Unknown dependency fails") {
        PipelineConfig config = minimal_config();
        config.stages.emplace_back("risk", "risk_scorer", std::vector<std::string>{"gaps"});
        REQUIRE_THROWS_WITH(compute_execution_order(config), ContainsSubstring("unknown stage: gaps"));
        REQUIRE_THROWS_WITH(validate_pipeline_config(config), ContainsSubstring("Failed to compute execution order"));
    }

    SECTION("Self dependency fails") {
        PipelineConfig config = minimal_config();
        config.stages[0].depends_on = {"classroom_gaps"};
        REQUIRE_THROWS_WITH(compute_execution_order(config), ContainsSubstring("depends on itself"));
    }

    SECTION("Cycle fails") {
        PipelineConfig config = minimal_config();
        config.stages.emplace_back("a", "risk_scorer", std::vector<std::string>{"b"});
        config.stages.emplace_back("b", "prioritisation", std::vector<std::string>{"a"});
        REQUIRE_THROWS_WITH(compute_execution_order(config), ContainsSubstring("Circular dependency"));
    }

    SECTION("Repeated dependency is counted once") {
        PipelineConfig config = minimal_config();
        config.stages.emplace_back("risk", "risk_scorer",
                                   std::vector<std::string>{"classroom_gaps", "classroom_gaps"});
        REQUIRE(compute_execution_order(config).size() == 2);
    }
}

TEST_CASE("Fallback strategies", "[pipeline_config]") {
    REQUIRE(parse_fallback_strategy("fail_fast") == FallbackStrategy::FAIL_FAST);
    REQUIRE(parse_fallback_strategy("skip_optional") == FallbackStrategy::SKIP_OPTIONAL);
    REQUIRE(parse_fallback_strategy("best_effort") == FallbackStrategy::BEST_EFFORT);
    REQUIRE_THROWS_AS(parse_fallback_strategy("retry_forever"), PipelineConfigError);
    REQUIRE(to_string(FallbackStrategy::SKIP_OPTIONAL) == "skip_optional");

    OrchestratorSettings defaults;
    REQUIRE(defaults.fallback_strategy == FallbackStrategy::FAIL_FAST);
    REQUIRE(defaults.enable_retry);
    REQUIRE(defaults.max_retry_attempts == 2);
}

TEST_CASE("Default pipeline", "[pipeline_config]") {
    auto dir = std::filesystem::temp_directory_path() / "schoolgov_default_pipeline";
    std::filesystem::create_directories(dir);
    std::filesystem::remove(dir / "proposals.csv");

    auto config = default_pipeline_config(dir.string(), "out", "parquet");
    REQUIRE_NOTHROW(validate_pipeline_config(config));
    REQUIRE(config.output.type == "parquet");
    REQUIRE(config.data_sources.count("proposals") == 0);
    REQUIRE(config.data_sources.at("schools").path == (dir / "schools.csv").string());

    const StageNode* proposals = find_stage(config, "proposals");
    REQUIRE(proposals != nullptr);
    REQUIRE(proposals->config.at("optional") == "true");
    REQUIRE(find_stage(config, "missing") == nullptr);

    SECTION("Proposals file is picked up when present") {
        std::ofstream(dir / "proposals.csv") << "school_id,academic_year,requested_classrooms,requested_teachers\n";
        auto with_proposals = default_pipeline_config(dir.string(), "out");
        REQUIRE(with_proposals.data_sources.count("proposals") == 1);
    }

    std::filesystem::remove_all(dir);
}
