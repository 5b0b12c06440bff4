// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <manager/ManagerConfig.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace toolhost
{

/// @brief Top-level application configuration.
struct AppConfig
{
    std::string logLevel = "info";

    /// @brief Root directory the builtin fallback tools operate in. Empty means the current directory.
    std::string workspace;

    ManagerConfig mcp;

    auto operator==(const AppConfig&) const -> bool = default;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Parses the "mcp" section.
///
/// Missing fields keep their defaults. Malformed values (wrong types, unknown fallback
/// modes, servers without a name) are reported as ConfigError; range checks are left to
/// ConfigValidator.
[[nodiscard]] auto parseManagerConfig(const nlohmann::json& section) -> Result<ManagerConfig>;

/// @brief Serializes a ManagerConfig into its "mcp" section form.
[[nodiscard]] auto managerConfigToJson(const ManagerConfig& config) -> nlohmann::json;

/// @brief Returns the default config directory path ($XDG_CONFIG_HOME/toolhost or ~/.config/toolhost).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace toolhost
