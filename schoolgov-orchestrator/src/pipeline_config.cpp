#include "pipeline_config.hpp"
#include "academic_year.hpp"
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace schoolgov {
namespace orchestrator {

FallbackStrategy parse_fallback_strategy(const std::string& value) {
    if (value == "fail_fast") return FallbackStrategy::FAIL_FAST;
    if (value == "skip_optional") return FallbackStrategy::SKIP_OPTIONAL;
    if (value == "best_effort") return FallbackStrategy::BEST_EFFORT;
    throw PipelineConfigError("Unknown fallback strategy: " + value +
                              " (expected fail_fast, skip_optional or best_effort)");
}

std::string to_string(FallbackStrategy strategy) {
    switch (strategy) {
        case FallbackStrategy::FAIL_FAST: return "fail_fast";
        case FallbackStrategy::SKIP_OPTIONAL: return "skip_optional";
        case FallbackStrategy::BEST_EFFORT: return "best_effort";
    }
    return "fail_fast";
}

const std::vector<std::string>& required_data_sources() {
    static const std::vector<std::string> ids = {
        "schools", "yearly_metrics", "infrastructure", "teacher_metrics"
    };
    return ids;
}

void validate_pipeline_config(const PipelineConfig& config) {
    if (config.stages.empty()) {
        throw PipelineConfigError("Pipeline must contain at least one stage");
    }

    std::set<std::string> stage_ids;
    for (const auto& stage : config.stages) {
        if (stage.id.empty()) {
            throw PipelineConfigError("Stage ID cannot be empty");
        }
        if (!stage_ids.insert(stage.id).second) {
            throw PipelineConfigError("Duplicate stage ID: " + stage.id);
        }
        if (stage.type.empty()) {
            throw PipelineConfigError("Stage type cannot be empty for stage: " + stage.id);
        }
    }

    // Unknown dependencies and cycles
    try {
        compute_execution_order(config);
    } catch (const PipelineConfigError& e) {
        throw PipelineConfigError(std::string("Failed to compute execution order: ") + e.what());
    }

    for (const std::string& id : required_data_sources()) {
        auto it = config.data_sources.find(id);
        if (it == config.data_sources.end()) {
            throw PipelineConfigError("Missing required data source: " + id);
        }
        if (it->second.path.empty()) {
            throw PipelineConfigError("Data source path cannot be empty: " + id);
        }
    }
    for (const auto& pair : config.data_sources) {
        if (!pair.second.type.empty() && pair.second.type != "csv") {
            throw PipelineConfigError("Unsupported data source type '" + pair.second.type +
                                      "' for: " + pair.first);
        }
    }

    if (config.output.type.empty()) {
        throw PipelineConfigError("Output type cannot be empty");
    }
    if (config.output.type != "json" && config.output.type != "parquet") {
        throw PipelineConfigError("Unsupported output type: " + config.output.type);
    }
    if (config.output.path.empty()) {
        throw PipelineConfigError("Output path cannot be empty");
    }

    for (const auto& year : config.years) {
        if (!is_academic_year(year)) {
            throw PipelineConfigError("Invalid academic year: " + year);
        }
    }

    if (config.orchestrator.max_retry_attempts < 0) {
        throw PipelineConfigError("max_retry_attempts cannot be negative");
    }
    if (config.orchestrator.retry_delay_ms < 0) {
        throw PipelineConfigError("retry_delay_ms cannot be negative");
    }
}

std::vector<std::string> compute_execution_order(const PipelineConfig& config) {
    std::map<std::string, int> in_degree;
    for (const auto& stage : config.stages) {
        in_degree[stage.id] = 0;
    }

    for (const auto& stage : config.stages) {
        std::set<std::string> distinct(stage.depends_on.begin(), stage.depends_on.end());
        for (const auto& dep : distinct) {
            if (in_degree.find(dep) == in_degree.end()) {
                throw PipelineConfigError("Stage '" + stage.id + "' depends on unknown stage: " + dep);
            }
            if (dep == stage.id) {
                throw PipelineConfigError("Stage '" + stage.id + "' depends on itself");
            }
        }
        in_degree[stage.id] = static_cast<int>(distinct.size());
    }

    // Kahn's algorithm; the first ready stage in declaration order goes next
    std::vector<std::string> execution_order;
    std::set<std::string> placed;

    while (execution_order.size() < config.stages.size()) {
        const StageNode* next = nullptr;
        for (const auto& stage : config.stages) {
            if (placed.count(stage.id) == 0 && in_degree[stage.id] == 0) {
                next = &stage;
                break;
            }
        }

        if (!next) {
            std::string remaining;
            for (const auto& stage : config.stages) {
                if (placed.count(stage.id) == 0) {
                    if (!remaining.empty()) remaining += ", ";
                    remaining += stage.id;
                }
            }
            throw PipelineConfigError("Circular dependency detected among stages: " + remaining);
        }

        placed.insert(next->id);
        execution_order.push_back(next->id);

        for (const auto& stage : config.stages) {
            std::set<std::string> distinct(stage.depends_on.begin(), stage.depends_on.end());
            if (distinct.count(next->id) > 0) {
                in_degree[stage.id]--;
            }
        }
    }

    return execution_order;
}

const StageNode* find_stage(const PipelineConfig& config, const std::string& stage_id) {
    for (const auto& stage : config.stages) {
        if (stage.id == stage_id) {
            return &stage;
        }
    }
    return nullptr;
}

PipelineConfig default_pipeline_config(const std::string& data_dir,
                                       const std::string& output_dir,
                                       const std::string& output_type) {
    PipelineConfig config;
    config.description = "School governance derived metrics";

    const fs::path dir(data_dir);
    for (const std::string& id : required_data_sources()) {
        config.data_sources[id] = DataSource(id, "csv", (dir / (id + ".csv")).string());
    }
    const fs::path proposals = dir / "proposals.csv";
    if (fs::exists(proposals)) {
        config.data_sources["proposals"] = DataSource("proposals", "csv", proposals.string());
    }

    config.stages.emplace_back("classroom_gaps", "classroom_gap_resolver");
    config.stages.emplace_back("teacher_gaps", "teacher_gap_resolver");
    config.stages.emplace_back("risk", "risk_scorer",
                               std::vector<std::string>{"classroom_gaps", "teacher_gaps"});
    config.stages.emplace_back("priority", "prioritisation", std::vector<std::string>{"risk"});
    config.stages.emplace_back("trend", "risk_trend", std::vector<std::string>{"risk"});
    config.stages.emplace_back("district", "district_aggregator",
                               std::vector<std::string>{"risk", "classroom_gaps", "teacher_gaps"});
    config.stages.emplace_back("budget", "budget_allocator",
                               std::vector<std::string>{"risk", "teacher_gaps"});
    config.stages.emplace_back("forecast", "forecaster",
                               std::vector<std::string>{"classroom_gaps", "teacher_gaps"});

    StageNode proposal_stage("proposals", "proposal_validator",
                             std::vector<std::string>{"classroom_gaps", "teacher_gaps"});
    proposal_stage.config["optional"] = "true";
    config.stages.push_back(proposal_stage);

    config.output = OutputConfig(output_type, output_dir);
    return config;
}

} // namespace orchestrator
} // namespace schoolgov
