#include "config_parser.hpp"
#include "backend_factory.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace quorum {

namespace {

// Non-string values are kept as their JSON text so "0.5" and 0.5 mean the same
std::string value_as_string(const json& value) {
    return value.is_string() ? expand_environment_variables(value.get<std::string>()) : value.dump();
}

size_t read_count(const json& object, const char* key, size_t default_value, const std::string& owner) {
    if (!object.contains(key)) {
        return default_value;
    }
    long long value = object[key].get<long long>();
    if (value < 0) {
        throw ConfigurationError(owner + " " + key + " must be non-negative, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

BackendConfig parse_backend(const json& backend_json, double default_timeout) {
    BackendConfig config;

    if (!backend_json.is_object()) {
        throw ConfigParseError("Backend entry must be an object");
    }
    if (!backend_json.contains("id")) {
        throw ConfigParseError("Backend missing required field: id");
    }
    config.backend_id = backend_json["id"].get<std::string>();

    if (!backend_json.contains("kind")) {
        throw ConfigParseError("Backend '" + config.backend_id + "' missing required field: kind");
    }
    config.backend_kind = backend_json["kind"].get<std::string>();

    config.weight = backend_json.value("weight", 1.0);
    config.timeout = backend_json.value("timeout", default_timeout);
    config.max_retries = read_count(backend_json, "max_retries", 2, "Backend '" + config.backend_id + "'");
    config.enabled = backend_json.value("enabled", true);

    if (backend_json.contains("params")) {
        for (auto it = backend_json["params"].begin(); it != backend_json["params"].end(); ++it) {
            config.params[it.key()] = value_as_string(it.value());
        }
    }

    return config;
}

void parse_orchestrator_section(const json& section, OrchestratorConfig& config) {
    config.failure_threshold = read_count(section, "failure_threshold", config.failure_threshold, "orchestrator");
    config.cooldown_seconds = section.value("cooldown_seconds", config.cooldown_seconds);
    config.executor.retry_errors = section.value("retry_errors", config.executor.retry_errors);
    config.executor.retry_delay_ms = read_count(section, "retry_delay_ms", config.executor.retry_delay_ms, "orchestrator");
    config.isolation.memory_limit_mb = read_count(section, "memory_limit_mb", config.isolation.memory_limit_mb, "orchestrator");
    config.isolation.cpu_limit_percent = read_count(section, "cpu_limit_percent", config.isolation.cpu_limit_percent, "orchestrator");

    if (config.failure_threshold == 0) {
        throw ConfigurationError("orchestrator failure_threshold must be at least 1");
    }
    if (config.cooldown_seconds < 0.0) {
        throw ConfigurationError("orchestrator cooldown_seconds cannot be negative");
    }
    if (config.isolation.cpu_limit_percent > 100) {
        throw ConfigurationError("orchestrator cpu_limit_percent cannot exceed 100");
    }
}

void parse_logging_section(const json& section, LoggerConfig& config) {
    if (section.contains("level")) {
        config.min_level = string_to_level(section["level"].get<std::string>());
    }
    config.enable_json = section.value("json", config.enable_json);
    config.enable_console = section.value("console", config.enable_console);
    if (section.contains("file")) {
        config.enable_file = true;
        config.log_file_path = expand_environment_variables(section["file"].get<std::string>());
    }
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        size_t cursor = pos + 1;

        bool braces = cursor < result.size() && result[cursor] == '{';
        if (braces) {
            cursor++;
        }

        size_t name_start = cursor;
        while (cursor < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[cursor])) || result[cursor] == '_')) {
            cursor++;
        }
        std::string var_name = result.substr(name_start, cursor - name_start);

        if (braces) {
            if (cursor >= result.size() || result[cursor] != '}') {
                pos = start + 1;   // Unterminated "${": leave as is
                continue;
            }
            cursor++;
        }

        if (var_name.empty()) {
            pos = start + 1;       // Lone '$'
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, cursor - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::vector<BackendConfig> default_backend_configs(double timeout) {
    std::vector<BackendConfig> configs;

    BackendConfig analytical("mock_model_1", BackendKindName::REFERENCE);
    analytical.timeout = timeout;
    analytical.params["response_pattern"] = "analytical";
    configs.push_back(analytical);

    BackendConfig creative("mock_model_2", BackendKindName::REFERENCE);
    creative.timeout = timeout;
    creative.params["response_pattern"] = "creative";
    configs.push_back(creative);

    BackendConfig conservative("mock_model_3", BackendKindName::REFERENCE);
    conservative.weight = 0.8;
    conservative.timeout = timeout;
    conservative.params["response_pattern"] = "conservative";
    configs.push_back(conservative);

    return configs;
}

void validate_backend_configs(const std::vector<BackendConfig>& backends) {
    std::set<std::string> seen;
    BackendFactory factory;

    for (const auto& backend : backends) {
        validate_backend_config(backend);
        if (!factory.is_supported(backend.backend_kind)) {
            throw ConfigurationError("Backend '" + backend.backend_id +
                                     "' has unknown kind: " + backend.backend_kind);
        }
        if (!seen.insert(backend.backend_id).second) {
            throw ConfigurationError("Duplicate backend ID: " + backend.backend_id);
        }
    }
}

QuorumSettings parse_settings_from_string(const std::string& json_string) {
    QuorumSettings settings;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be an object");
        }

        if (j.contains("orchestrator")) {
            parse_orchestrator_section(j["orchestrator"], settings.orchestrator);
        }

        if (j.contains("logging")) {
            parse_logging_section(j["logging"], settings.logging);
        }

        double default_timeout = j.value("default_timeout", 30.0);
        if (!(default_timeout > 0.0)) {
            throw ConfigurationError("default_timeout must be positive");
        }

        if (j.contains("backends")) {
            if (!j["backends"].is_array()) {
                throw ConfigParseError("Field 'backends' must be an array");
            }
            for (const auto& backend_json : j["backends"]) {
                settings.backends.push_back(parse_backend(backend_json, default_timeout));
            }
        }

        if (settings.backends.empty()) {
            settings.backends = default_backend_configs(default_timeout);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_backend_configs(settings.backends);

    return settings;
}

QuorumSettings parse_settings_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_settings_from_string(buffer.str());
}

std::unique_ptr<Orchestrator> build_orchestrator(const QuorumSettings& settings, Logger* logger) {
    auto orchestrator = std::make_unique<Orchestrator>(settings.orchestrator, logger);
    for (const auto& backend : settings.backends) {
        orchestrator->register_backend(backend);
    }
    return orchestrator;
}

} // namespace quorum
