// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/InputShape.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolhost
{

/// @brief Prefix of proxies forwarding to a provider process.
constexpr auto RealToolPrefix = std::string_view { "mcp_" };

/// @brief Prefix of proxies served by a local substitute.
constexpr auto FallbackToolPrefix = std::string_view { "fallback_" };

/// @brief Returns "mcp_<server>_<tool>".
[[nodiscard]] auto realToolName(std::string_view server, std::string_view tool) -> std::string;

/// @brief Returns "fallback_<server>_<tool>".
[[nodiscard]] auto fallbackToolName(std::string_view server, std::string_view tool) -> std::string;

/// @brief Who serves a registered tool.
enum class ToolOrigin
{
    Real,
    Fallback,
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

/// @brief A tool as seen by the host dispatcher.
struct RegisteredTool
{
    std::string name; ///< Namespaced name.
    std::string description;
    InputShape inputShape;
    ToolHandler handler;
    ToolOrigin origin = ToolOrigin::Real;
    std::string serverName;
    std::string toolName; ///< Un-namespaced tool name.
};

/// @brief Metadata of a registered tool, without its handler.
struct ToolInfo
{
    std::string name;
    std::string description;
    InputShape inputShape;
    ToolOrigin origin = ToolOrigin::Real;
    std::string serverName;
    std::string toolName;
};

/// @brief The host's tool dispatcher.
///
/// Implementations must be safe to call from several threads.
class ToolBridge
{
  public:
    virtual ~ToolBridge() = default;

    /// @brief Registers @p tool under its namespaced name.
    /// @return InvalidArgument if the name is already registered or the handler is empty.
    [[nodiscard]] virtual auto registerTool(RegisteredTool tool) -> VoidResult = 0;

    /// @brief Removes a tool.
    /// @return true if the tool was registered.
    virtual auto unregisterTool(std::string_view name) -> bool = 0;

    [[nodiscard]] virtual auto hasTool(std::string_view name) const -> bool = 0;
    [[nodiscard]] virtual auto toolNames() const -> std::vector<std::string> = 0;
    [[nodiscard]] virtual auto toolInfo(std::string_view name) const -> std::optional<ToolInfo> = 0;

    /// @brief Invokes a tool. Unknown tools yield an error result with code "TOOL_NOT_FOUND".
    [[nodiscard]] virtual auto invoke(std::string_view name, const nlohmann::json& arguments) -> ToolResult = 0;
};

} // namespace toolhost
