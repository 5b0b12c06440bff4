// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <format>

namespace toolhost
{

auto ToolRegistry::registerTool(RegisteredTool tool) -> VoidResult
{
    if (tool.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Tool name must not be empty");
    if (!tool.handler)
        return makeError(ErrorCode::InvalidArgument, std::format("Tool '{}' has no handler", tool.name));

    auto lock = std::lock_guard(_mutex);
    if (_tools.contains(tool.name))
        return makeError(ErrorCode::InvalidArgument, std::format("Tool '{}' is already registered", tool.name));

    log::debug("Tool registered: {}", tool.name);
    auto name = tool.name;
    _tools.emplace(std::move(name), std::move(tool));
    return {};
}

auto ToolRegistry::unregisterTool(std::string_view name) -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _tools.find(name);
    if (it == _tools.end())
        return false;
    _tools.erase(it);
    log::debug("Tool unregistered: {}", name);
    return true;
}

auto ToolRegistry::hasTool(std::string_view name) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _tools.contains(name);
}

auto ToolRegistry::toolNames() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_tools.size());
    for (const auto& [name, tool]: _tools)
        names.push_back(name);
    return names;
}

auto ToolRegistry::toolNamesWithPrefix(std::string_view prefix) const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    for (const auto& [name, tool]: _tools)
    {
        if (name.starts_with(prefix))
            names.push_back(name);
    }
    return names;
}

auto ToolRegistry::toolInfo(std::string_view name) const -> std::optional<ToolInfo>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _tools.find(name);
    if (it == _tools.end())
        return std::nullopt;

    auto const& tool = it->second;
    return ToolInfo {
        .name = tool.name,
        .description = tool.description,
        .inputShape = tool.inputShape,
        .origin = tool.origin,
        .serverName = tool.serverName,
        .toolName = tool.toolName,
    };
}

auto ToolRegistry::invoke(std::string_view name, const nlohmann::json& arguments) -> ToolResult
{
    auto handler = ToolHandler {};
    auto shape = InputShape {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _tools.find(name);
        if (it == _tools.end())
            return makeToolError(std::string(name), "TOOL_NOT_FOUND", std::format("Unknown tool: {}", name));
        handler = it->second.handler;
        shape = it->second.inputShape;
    }

    if (!shapeAccepts(shape, arguments))
        return makeToolError(std::string(name),
                             "INVALID_ARGUMENTS",
                             std::format("Arguments of '{}' do not match {}", name, describeShape(shape)));

    return handler(arguments);
}

auto ToolRegistry::toolsSpec() const -> nlohmann::json
{
    auto lock = std::lock_guard(_mutex);
    auto spec = nlohmann::json::array();
    for (const auto& [name, tool]: _tools)
    {
        spec.push_back(nlohmann::json {
            { "name", tool.name },
            { "description", tool.description },
            { "inputSchema", shapeToJsonSchema(tool.inputShape) },
        });
    }
    return spec;
}

} // namespace toolhost
