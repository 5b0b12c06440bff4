// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <manager/ToolBridge.hpp>

#include <map>
#include <mutex>

namespace toolhost
{

/// @brief In-memory ToolBridge guarded by a mutex.
///
/// Handlers run without the registry lock held, so a handler may register or
/// unregister tools.
class ToolRegistry: public ToolBridge
{
  public:
    [[nodiscard]] auto registerTool(RegisteredTool tool) -> VoidResult override;
    auto unregisterTool(std::string_view name) -> bool override;
    [[nodiscard]] auto hasTool(std::string_view name) const -> bool override;
    [[nodiscard]] auto toolNames() const -> std::vector<std::string> override;
    [[nodiscard]] auto toolInfo(std::string_view name) const -> std::optional<ToolInfo> override;
    [[nodiscard]] auto invoke(std::string_view name, const nlohmann::json& arguments) -> ToolResult override;

    /// @brief Returns the names starting with @p prefix.
    [[nodiscard]] auto toolNamesWithPrefix(std::string_view prefix) const -> std::vector<std::string>;

    /// @brief Returns the tools as a JSON array of {name, description, inputSchema}.
    [[nodiscard]] auto toolsSpec() const -> nlohmann::json;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, RegisteredTool, std::less<>> _tools;
};

} // namespace toolhost
