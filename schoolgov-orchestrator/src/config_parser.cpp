#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace schoolgov {
namespace orchestrator {

namespace {

// Stage parameters are kept as strings; numbers and booleans keep their JSON text
std::string config_value_to_string(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string expanded_string(const json& value) {
    return expand_environment_variables(value.get<std::string>());
}

const json& required_field(const json& object, const std::string& key) {
    if (!object.contains(key)) {
        throw ConfigParseError("Missing required field: " + key);
    }
    return object.at(key);
}

StageNode parse_stage(const json& entry) {
    if (!entry.contains("id")) {
        throw ConfigParseError("Stage missing required field: id");
    }
    StageNode node;
    node.id = entry.at("id").get<std::string>();

    if (!entry.contains("type")) {
        throw ConfigParseError("Stage '" + node.id + "' missing required field: type");
    }
    node.type = entry.at("type").get<std::string>();

    if (entry.contains("config")) {
        for (const auto& item : entry.at("config").items()) {
            node.config[item.key()] = expand_environment_variables(config_value_to_string(item.value()));
        }
    }
    if (entry.contains("depends_on")) {
        node.depends_on = entry.at("depends_on").get<std::vector<std::string>>();
    }
    return node;
}

std::vector<StageNode> parse_stages(const json& entries) {
    std::vector<StageNode> stages;
    for (const auto& entry : entries) {
        stages.push_back(parse_stage(entry));
    }
    return stages;
}

// Sources default to CSV
std::map<std::string, DataSource> parse_data_sources(const json& entries) {
    std::map<std::string, DataSource> sources;
    for (const auto& item : entries.items()) {
        const json& entry = item.value();
        DataSource source(item.key(), entry.value("type", std::string("csv")), "");
        if (entry.contains("path")) {
            source.path = expanded_string(entry.at("path"));
        }
        sources[source.id] = source;
    }
    return sources;
}

OutputConfig parse_output(const json& entry) {
    OutputConfig output;
    output.type = entry.value("type", std::string());
    if (entry.contains("path")) {
        output.path = expanded_string(entry.at("path"));
    }
    return output;
}

OrchestratorSettings parse_orchestrator_settings(const json& entry) {
    OrchestratorSettings settings;
    if (entry.contains("fallback_strategy")) {
        settings.fallback_strategy = parse_fallback_strategy(entry.at("fallback_strategy").get<std::string>());
    }
    settings.enable_retry = entry.value("enable_retry", settings.enable_retry);
    settings.max_retry_attempts = entry.value("max_retry_attempts", settings.max_retry_attempts);
    settings.retry_delay_ms = entry.value("retry_delay_ms", settings.retry_delay_ms);
    return settings;
}

LoggingSettings parse_logging_settings(const json& entry) {
    LoggingSettings logging;
    logging.level = entry.value("level", logging.level);
    logging.json = entry.value("json", logging.json);
    if (entry.contains("file")) {
        logging.file = expanded_string(entry.at("file"));
    }
    return logging;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++;
        }

        // A lone '$' is kept as written
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

PipelineConfig parse_pipeline_config_from_string(const std::string& json_string) {
    PipelineConfig config;

    try {
        const json document = json::parse(json_string);
        if (!document.is_object()) {
            throw ConfigParseError("Pipeline configuration must be a JSON object");
        }

        config.description = document.value("description", std::string());

        config.stages = parse_stages(required_field(document, "stages"));
        config.data_sources = parse_data_sources(required_field(document, "data_sources"));

        if (document.contains("output")) {
            config.output = parse_output(document.at("output"));
        }
        if (document.contains("orchestrator")) {
            config.orchestrator = parse_orchestrator_settings(document.at("orchestrator"));
        }
        if (document.contains("logging")) {
            config.logging = parse_logging_settings(document.at("logging"));
        }
        if (document.contains("years")) {
            config.years = document.at("years").get<std::vector<std::string>>();
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_pipeline_config(config);

    return config;
}

PipelineConfig parse_pipeline_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    PipelineConfig config = parse_pipeline_config_from_string(buffer.str());

    for (auto& pair : config.data_sources) {
        if (!pair.second.path.empty()) {
            pair.second.path = resolve_relative_path(pair.second.path, file_path);
        }
    }
    if (!config.output.path.empty()) {
        config.output.path = resolve_relative_path(config.output.path, file_path);
    }
    if (!config.logging.file.empty()) {
        config.logging.file = resolve_relative_path(config.logging.file, file_path);
    }

    return config;
}

} // namespace orchestrator
} // namespace schoolgov
