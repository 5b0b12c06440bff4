// SPDX-License-Identifier: Apache-2.0
#include "FallbackRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace toolhost
{

namespace
{
    auto keyFor(std::string_view server, std::string_view tool) -> std::pair<std::string, std::string>
    {
        return { std::string(server), std::string(tool) };
    }
} // namespace

FallbackRegistry::FallbackRegistry(ToolBridge& bridge, FallbackMode mode): _bridge(bridge), _mode(mode)
{
}

void FallbackRegistry::setMode(FallbackMode mode)
{
    auto lock = std::lock_guard(_mutex);
    _mode = mode;
}

auto FallbackRegistry::mode() const -> FallbackMode
{
    auto lock = std::lock_guard(_mutex);
    return _mode;
}

auto FallbackRegistry::shouldUseFallback(std::string_view /*server*/, bool available) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    switch (_mode)
    {
        case FallbackMode::Disabled: return false;
        case FallbackMode::Always: return true;
        case FallbackMode::Graceful: return !available;
    }
    return false;
}

auto FallbackRegistry::addBinding(FallbackBinding binding) -> VoidResult
{
    if (binding.serverName.empty() || binding.toolName.empty())
        return makeError(ErrorCode::InvalidArgument, "Fallback binding needs a server and a tool name");
    if (!binding.implementation)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Fallback {}/{} has no implementation", binding.serverName, binding.toolName));
    if (binding.limitations.empty())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Fallback {}/{} must declare its limitations",
                                     binding.serverName,
                                     binding.toolName));

    auto lock = std::lock_guard(_mutex);
    auto key = keyFor(binding.serverName, binding.toolName);
    if (_bindings.contains(key))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Fallback {}/{} is already bound", binding.serverName, binding.toolName));

    _bindings.emplace(std::move(key), std::move(binding));
    return {};
}

auto FallbackRegistry::hasBinding(std::string_view server, std::string_view tool) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _bindings.contains(keyFor(server, tool));
}

auto FallbackRegistry::hasBindings(std::string_view server) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return std::ranges::any_of(_bindings, [&](const auto& entry) { return entry.first.first == server; });
}

auto FallbackRegistry::registerFallbackTools(std::string_view server) -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    auto registered = std::size_t { 0 };

    for (const auto& [key, binding]: _bindings)
    {
        if (key.first != server)
            continue;

        auto const name = fallbackToolName(binding.serverName, binding.toolName);
        if (_bridge.hasTool(name))
            continue;

        auto tool = RegisteredTool {
            .name = name,
            .description = std::format("{} (fallback)", binding.description),
            .inputShape = binding.inputShape,
            .handler = [this, serverName = binding.serverName, toolName = binding.toolName](
                           const nlohmann::json& arguments) { return invoke(serverName, toolName, arguments); },
            .origin = ToolOrigin::Fallback,
            .serverName = binding.serverName,
            .toolName = binding.toolName,
        };

        if (auto result = _bridge.registerTool(std::move(tool)); !result)
        {
            log::warning("Failed to register fallback '{}': {}", name, result.error());
            continue;
        }
        ++registered;
    }

    if (std::ranges::any_of(_bindings, [&](const auto& entry) { return entry.first.first == server; }))
        _activeServers.emplace(server);

    if (registered > 0)
        log::info("Activated {} fallback tools for '{}'", registered, server);
    return registered;
}

auto FallbackRegistry::unregisterFallbackTools(std::string_view server) -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    auto removed = std::size_t { 0 };

    for (const auto& [key, binding]: _bindings)
    {
        if (key.first == server && _bridge.unregisterTool(fallbackToolName(key.first, key.second)))
            ++removed;
    }

    if (auto const it = _activeServers.find(server); it != _activeServers.end())
        _activeServers.erase(it);

    if (removed > 0)
        log::info("Deactivated {} fallback tools for '{}'", removed, server);
    return removed;
}

auto FallbackRegistry::isActive(std::string_view server) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _activeServers.contains(server);
}

auto FallbackRegistry::invoke(std::string_view server, std::string_view tool, const nlohmann::json& arguments) const
    -> ToolResult
{
    auto implementation = FallbackImplementation {};
    auto limitations = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _bindings.find(keyFor(server, tool));
        if (it == _bindings.end())
            return makeToolError(fallbackToolName(server, tool),
                                 "FALLBACK_ERROR",
                                 std::format("No fallback for {}/{}", server, tool));
        implementation = it->second.implementation;
        limitations = it->second.limitations;
    }

    auto const name = fallbackToolName(server, tool);
    auto output = implementation(arguments);

    auto result = ToolResult {};
    if (output)
    {
        result.toolName = name;
        result.text = std::move(*output);
        result.content = nlohmann::json::array({ { { "type", "text" }, { "text", result.text } } });
    }
    else
    {
        log::warning("Fallback {} failed: {}", name, output.error());
        result = makeToolError(name, "FALLBACK_ERROR", output.error().message);
    }

    result.degraded = true;
    result.limitations = std::move(limitations);
    result.notices.push_back(
        std::format("Served by a local fallback for '{}/{}' with limited functionality", server, tool));
    return result;
}

auto FallbackRegistry::status(std::string_view server) const -> FallbackStatus
{
    auto lock = std::lock_guard(_mutex);
    auto status = FallbackStatus { .serverName = std::string(server) };

    for (const auto& [key, binding]: _bindings)
    {
        if (key.first != server)
            continue;
        status.hasFallback = true;
        ++status.toolCount;
        for (const auto& limitation: binding.limitations)
        {
            if (std::ranges::find(status.limitations, limitation) == status.limitations.end())
                status.limitations.push_back(limitation);
        }
    }

    status.active = _activeServers.contains(server);
    return status;
}

auto FallbackRegistry::allStatuses() const -> std::vector<FallbackStatus>
{
    auto servers = std::set<std::string> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [key, binding]: _bindings)
            servers.insert(key.first);
    }

    auto statuses = std::vector<FallbackStatus> {};
    for (const auto& server: servers)
        statuses.push_back(status(server));
    return statuses;
}

auto FallbackRegistry::activeToolCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return static_cast<std::size_t>(std::ranges::count_if(_bindings, [this](const auto& entry) {
        return _activeServers.contains(entry.first.first);
    }));
}

} // namespace toolhost
