#ifndef QUORUM_CONFIG_PARSER_HPP
#define QUORUM_CONFIG_PARSER_HPP

#include "backend_interface.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum {

/**
 * @brief Exception thrown when a config file cannot be read or is not valid JSON
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything needed to build an Orchestrator and configure logging
 */
struct QuorumSettings {
    OrchestratorConfig orchestrator;
    LoggerConfig logging;
    std::vector<BackendConfig> backends;   // In file order (= dispatch order)
};

/**
 * @brief Parses settings from a JSON string
 *
 * Layout:
 * @code
 * {
 *   "orchestrator": {"failure_threshold": 5, "cooldown_seconds": 60,
 *                    "retry_errors": false, "retry_delay_ms": 100,
 *                    "memory_limit_mb": 500, "cpu_limit_percent": 70},
 *   "logging": {"level": "INFO", "json": true, "console": true, "file": "quorum.log"},
 *   "default_timeout": 30,
 *   "backends": [
 *     {"id": "analyst", "kind": "reference", "weight": 1.0, "timeout": 30,
 *      "max_retries": 2, "enabled": true, "params": {"response_pattern": "analytical"}}
 *   ]
 * }
 * @endcode
 *
 * Backends need "id" and "kind"; everything else is optional. An empty or
 * missing "backends" array yields default_backend_configs().
 *
 * @param json_string JSON configuration as string
 * @return Parsed and validated settings
 * @throws ConfigParseError if JSON is invalid or a required field is missing
 * @throws ConfigurationError if a value is out of range or an ID is duplicated
 */
QuorumSettings parse_settings_from_string(const std::string& json_string);

/**
 * @brief Parses settings from a JSON file
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ConfigurationError if the configuration is invalid
 */
QuorumSettings parse_settings_from_file(const std::string& file_path);

/**
 * @brief Three reference backends with analytical, creative and conservative patterns
 *
 * @param timeout Deadline assigned to each backend
 */
std::vector<BackendConfig> default_backend_configs(double timeout = 30.0);

/**
 * @brief Validates a backend list: each entry and ID uniqueness
 *
 * @throws ConfigurationError on the first violation
 */
void validate_backend_configs(const std::vector<BackendConfig>& backends);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Builds an orchestrator and registers every configured backend
 *
 * @throws ConfigurationError if a backend cannot be registered
 */
std::unique_ptr<Orchestrator> build_orchestrator(const QuorumSettings& settings, Logger* logger = nullptr);

} // namespace quorum

#endif // QUORUM_CONFIG_PARSER_HPP
