#pragma once

#include "core/service_config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when the configuration file is unreadable or invalid
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Loads config.yml into a ServiceConfig.
 *
 * This is the only place that knows about the YAML layout. Historical
 * watch_paths entries are accepted both as plain strings and as mappings
 * with path/recursive/enabled/file_patterns keys; both become WatchedPath.
 */
class ConfigLoader
{
public:
    static constexpr const char *DEFAULT_CONFIG_PATH = "/etc/videoconverter/config.yml";

    /**
     * @brief Load and validate a configuration file
     * @param file_path Path to config.yml
     * @return Validated configuration
     * @throws ConfigError on parse or validation failure
     */
    static ServiceConfig loadFile(const std::string &file_path);

    /**
     * @brief Parse and validate configuration from YAML text
     * @throws ConfigError on parse or validation failure
     */
    static ServiceConfig loadString(const std::string &yaml_text);

    /**
     * @brief Apply CONFIG_PATH-sibling environment overrides (LOG_PATH, LOCK_PATH)
     */
    static void applyEnvironment(ServiceConfig &config);

    /**
     * @brief Resolve the configuration path: explicit argument, then CONFIG_PATH, then the default
     */
    static std::string resolveConfigPath(const std::string &explicit_path);

    /**
     * @brief Check a configuration for consistency
     * @return List of problems, empty when valid
     */
    static std::vector<std::string> validate(const ServiceConfig &config);

private:
    static ServiceConfig fromNode(const YAML::Node &root);
    static std::vector<WatchedPath> normalizeWatchPaths(const YAML::Node &directories);
};
