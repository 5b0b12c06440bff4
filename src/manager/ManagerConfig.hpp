// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/RetryPolicy.hpp>
#include <mcp/StdioTransport.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolhost
{

/// @brief When local substitutes replace a provider's tools.
enum class FallbackMode
{
    Disabled, ///< Never substitute.
    Graceful, ///< Substitute only while the provider is down.
    Always,   ///< Substitute unconditionally.
};

[[nodiscard]] auto fallbackModeName(FallbackMode mode) -> std::string_view;
[[nodiscard]] auto fallbackModeFromString(std::string_view name) -> std::optional<FallbackMode>;

/// @brief Static description of one provider process.
struct ServerDescriptor
{
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string workingDirectory;
    bool enabled = true;
    bool autoStart = false;
    std::vector<std::string> tools;     ///< Declared tool names, informational.
    std::vector<std::string> resources; ///< Declared resource names, informational.

    auto operator==(const ServerDescriptor&) const -> bool = default;
};

/// @brief Global parameters of the ConnectionManager plus its server list.
struct ManagerConfig
{
    bool enabled = true;
    std::vector<ServerDescriptor> servers;
    int maxRetries = 3;
    std::chrono::milliseconds retryDelay { 5000 };
    std::chrono::milliseconds connectionTimeout { 10000 };
    std::chrono::milliseconds healthCheckInterval { 30000 };
    bool autoRestart = true;
    FallbackMode fallbackMode = FallbackMode::Graceful;
    bool showSetupGuide = true;
    std::chrono::milliseconds requestTimeout { 10000 };
    std::chrono::milliseconds toolCallTimeout { 30000 };
    std::chrono::milliseconds pingTimeout { 5000 };
    std::chrono::milliseconds restartDelay { 1000 };

    auto operator==(const ManagerConfig&) const -> bool = default;

    /// @brief Returns the descriptor named @p name, or nullptr.
    [[nodiscard]] auto findServer(std::string_view name) const -> const ServerDescriptor*;
};

/// @brief Derives the per-client options from the global parameters.
[[nodiscard]] auto clientOptionsFor(const ManagerConfig& config) -> ClientOptions;

/// @brief Derives the process spawn configuration from a descriptor.
[[nodiscard]] auto processConfigFor(const ServerDescriptor& server) -> StdioTransportConfig;

/// @brief Returns true if switching from @p current to @p next needs a full stop/start cycle.
///
/// That is the case when any global parameter other than the health-check interval or
/// the setup-guide flag changes, or when the set of server names changes.
[[nodiscard]] auto needsFullRestart(const ManagerConfig& current, const ManagerConfig& next) -> bool;

} // namespace toolhost
