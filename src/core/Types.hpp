// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/InputShape.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace toolhost
{

/// @brief A tool advertised by a provider process.
struct ToolDefinition
{
    std::string name;
    std::string description;
    InputShape inputShape;
    std::string serverName; ///< Provider that advertised this tool.
};

/// @brief A resource advertised by a provider process.
struct ResourceDefinition
{
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
    std::string serverName;
};

/// @brief The typed result of invoking a tool, real or substitute.
///
/// Failures of the tool itself are reported here (isError, errorCode, errorMessage)
/// rather than as an Error, so callers can always inspect the outcome.
struct ToolResult
{
    std::string toolName;
    bool isError = false;
    std::string errorCode;
    std::string errorMessage;
    nlohmann::json content;                ///< Raw "content" array or substitute payload.
    std::string text;                      ///< Text items of content, joined by newlines.
    bool degraded = false;                 ///< Produced by a fallback substitute.
    std::vector<std::string> limitations;  ///< Known limitations of the substitute.
    std::vector<std::string> notices;
};

/// @brief Builds an error ToolResult.
[[nodiscard]] inline auto makeToolError(std::string toolName, std::string code, std::string message)
    -> ToolResult
{
    auto result = ToolResult {};
    result.toolName = std::move(toolName);
    result.isError = true;
    result.errorCode = std::move(code);
    result.errorMessage = std::move(message);
    return result;
}

} // namespace toolhost
