// SPDX-License-Identifier: Apache-2.0
#include "ToolBridge.hpp"

#include <format>

namespace toolhost
{

auto realToolName(std::string_view server, std::string_view tool) -> std::string
{
    return std::format("{}{}_{}", RealToolPrefix, server, tool);
}

auto fallbackToolName(std::string_view server, std::string_view tool) -> std::string
{
    return std::format("{}{}_{}", FallbackToolPrefix, server, tool);
}

} // namespace toolhost
