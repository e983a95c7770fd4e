// Copyright 2025 The YAMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <agentd/model/params.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace agentd {

/**
 * @brief Effective daemon configuration.
 *
 * Defaults apply first, then the config file, then environment overrides, then
 * command-line flags (applied by the caller).
 */
struct ServerConfig {
    std::filesystem::path configFilePath;
    std::optional<std::size_t> workerThreads;
    std::size_t eventBufferSize = 64;
    bool pushEnabled = true;
    std::chrono::milliseconds pushTimeout{5000};
    std::string logLevel = "info";
    std::filesystem::path logFile;
    AgentCard agentCard;
};

/**
 * @brief Static utility class for configuration resolution and parsing.
 *
 * All methods are static and thread-safe.
 *
 * ## Responsibilities
 * - Resolve default config file paths (XDG, HOME, env overrides)
 * - Parse simple TOML files into flat key-value maps
 * - Environment variable helpers (truthy checks, bounded integers)
 * - Assemble a ServerConfig from the above
 */
class ConfigResolver {
public:
    ConfigResolver() = delete; // Static-only class

    /**
     * @brief Check if an environment variable value is "truthy".
     *
     * Returns true for any value except: empty, "0", "false", "off", "no" (case-insensitive).
     */
    static bool envTruthy(const char* value);

    /**
     * @brief Resolve the default config file path.
     *
     * Search order:
     * 1. AGENTD_CONFIG_PATH environment variable
     * 2. $XDG_CONFIG_HOME/agentd/config.toml
     * 3. $HOME/.config/agentd/config.toml
     *
     * @return Path to config file if found, empty path otherwise
     */
    static std::filesystem::path resolveDefaultConfigPath();

    /**
     * @brief Parse a simple TOML file into a flat key-value map.
     *
     * Supports [section] headers (flattened as "section.key"), key = "value" assignments
     * and # comments. Does NOT support nested tables, arrays or multi-line strings.
     */
    static std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path);

    /**
     * @brief Read a non-negative integer from an environment variable.
     *
     * @return The value clamped to at least minValue, or nullopt if unset or malformed
     */
    static std::optional<long> readEnvInt(const char* envName, long minValue);

    /**
     * @brief Build the effective configuration.
     *
     * @param explicitPath Config file to read instead of the default search order
     */
    static ServerConfig resolve(const std::filesystem::path& explicitPath = {});
};

} // namespace agentd
