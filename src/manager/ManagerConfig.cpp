// SPDX-License-Identifier: Apache-2.0
#include "ManagerConfig.hpp"

#include <algorithm>
#include <set>

namespace toolhost
{

auto fallbackModeName(FallbackMode mode) -> std::string_view
{
    switch (mode)
    {
        case FallbackMode::Disabled: return "disabled";
        case FallbackMode::Graceful: return "graceful";
        case FallbackMode::Always: return "always";
    }
    return "graceful";
}

auto fallbackModeFromString(std::string_view name) -> std::optional<FallbackMode>
{
    if (name == "disabled")
        return FallbackMode::Disabled;
    if (name == "graceful")
        return FallbackMode::Graceful;
    if (name == "always")
        return FallbackMode::Always;
    return std::nullopt;
}

auto ManagerConfig::findServer(std::string_view name) const -> const ServerDescriptor*
{
    auto const it = std::ranges::find(servers, name, &ServerDescriptor::name);
    return it != servers.end() ? &*it : nullptr;
}

auto clientOptionsFor(const ManagerConfig& config) -> ClientOptions
{
    auto options = ClientOptions {};
    options.maxRetries = config.maxRetries;
    options.baseRetryDelay = config.retryDelay;
    options.connectionTimeout = config.connectionTimeout;
    options.requestTimeout = config.requestTimeout;
    options.toolCallTimeout = config.toolCallTimeout;
    options.pingTimeout = config.pingTimeout;
    return options;
}

auto processConfigFor(const ServerDescriptor& server) -> StdioTransportConfig
{
    return StdioTransportConfig {
        .command = server.command,
        .args = server.args,
        .env = server.env,
        .workingDirectory = server.workingDirectory,
    };
}

auto needsFullRestart(const ManagerConfig& current, const ManagerConfig& next) -> bool
{
    if (current.enabled != next.enabled || current.maxRetries != next.maxRetries
        || current.retryDelay != next.retryDelay || current.connectionTimeout != next.connectionTimeout
        || current.autoRestart != next.autoRestart || current.fallbackMode != next.fallbackMode
        || current.requestTimeout != next.requestTimeout || current.toolCallTimeout != next.toolCallTimeout
        || current.pingTimeout != next.pingTimeout || current.restartDelay != next.restartDelay)
        return true;

    auto const names = [](const ManagerConfig& config) {
        auto result = std::set<std::string> {};
        for (const auto& server: config.servers)
            result.insert(server.name);
        return result;
    };

    return names(current) != names(next);
}

} // namespace toolhost
