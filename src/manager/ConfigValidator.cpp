// SPDX-License-Identifier: Apache-2.0
#include "ConfigValidator.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <set>

#include <unistd.h>

namespace toolhost
{

namespace
{
    using Severity = ValidationIssue::Severity;

    struct Range
    {
        std::string_view path;
        int64_t value;
        int64_t min;
        int64_t max;
    };

    auto isExecutable(const std::filesystem::path& path) -> bool
    {
        auto ec = std::error_code {};
        return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
    }
} // namespace

auto ValidationResult::isValid() const -> bool
{
    return errorCount() == 0;
}

auto ValidationResult::errorCount() const -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count(issues, Severity::Error, &ValidationIssue::severity));
}

auto ValidationResult::warningCount() const -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count(issues, Severity::Warning, &ValidationIssue::severity));
}

auto ValidationResult::errorSummary() const -> std::string
{
    auto summary = std::string {};
    for (const auto& issue: issues)
    {
        if (issue.severity != Severity::Error)
            continue;
        if (!summary.empty())
            summary += "; ";
        summary += std::format("{}: {}", issue.path, issue.message);
    }
    return summary;
}

auto ConfigValidator::isCommandAvailable(std::string_view command) -> bool
{
    if (command.empty())
        return false;

    if (command.find('/') != std::string_view::npos)
        return isExecutable(std::filesystem::path(command));

    auto const* pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return false;

    auto const searchPath = std::string_view { pathEnv };
    auto start = std::size_t { 0 };
    while (start <= searchPath.size())
    {
        auto const end = std::min(searchPath.find(':', start), searchPath.size());
        auto const dir = searchPath.substr(start, end - start);
        if (isExecutable(std::filesystem::path(dir.empty() ? "." : dir) / command))
            return true;
        start = end + 1;
    }
    return false;
}

auto ConfigValidator::validate(const ManagerConfig& config) const -> ValidationResult
{
    auto result = ValidationResult {};
    auto const add = [&](std::string path, std::string message, Severity severity) {
        result.issues.push_back(
            ValidationIssue { .path = std::move(path), .message = std::move(message), .severity = severity });
    };

    auto const ranges = {
        Range { "maxRetries", config.maxRetries, 0, 10 },
        Range { "retryDelay", config.retryDelay.count(), 10, 30000 },
        Range { "connectionTimeout", config.connectionTimeout.count(), 100, 60000 },
        Range { "healthCheckInterval", config.healthCheckInterval.count(), 10, 300000 },
        Range { "requestTimeout", config.requestTimeout.count(), 100, 300000 },
        Range { "toolCallTimeout", config.toolCallTimeout.count(), 100, 600000 },
        Range { "pingTimeout", config.pingTimeout.count(), 10, 60000 },
        Range { "restartDelay", config.restartDelay.count(), 0, 60000 },
    };

    for (const auto& range: ranges)
    {
        if (range.value < range.min || range.value > range.max)
            add(std::string(range.path),
                std::format("Value {} is outside the allowed range {}..{}", range.value, range.min, range.max),
                Severity::Error);
    }

    auto names = std::set<std::string> {};
    for (auto index = std::size_t { 0 }; index < config.servers.size(); ++index)
    {
        auto const& server = config.servers[index];

        if (server.name.empty())
            add(std::format("servers[{}].name", index), "Server name must not be empty", Severity::Error);
        else if (!names.insert(server.name).second)
            add(std::format("servers[{}].name", index),
                std::format("Duplicate server name: {}", server.name),
                Severity::Error);

        if (server.command.empty())
            add(std::format("servers[{}].command", index), "Server command must not be empty", Severity::Error);
        else if (server.enabled && !isCommandAvailable(server.command))
            add(std::format("servers[{}].command", index),
                std::format("Command may not be available: {}", server.command),
                Severity::Warning);

        if (!server.workingDirectory.empty())
        {
            auto ec = std::error_code {};
            if (!std::filesystem::is_directory(server.workingDirectory, ec))
                add(std::format("servers[{}].workingDirectory", index),
                    std::format("Working directory does not exist: {}", server.workingDirectory),
                    Severity::Warning);
        }
    }

    // "mcp_<server>_<tool>" must identify one server.
    for (const auto& name: names)
    {
        for (auto it = names.upper_bound(name); it != names.end() && it->starts_with(name); ++it)
        {
            if (it->size() > name.size() && (*it)[name.size()] == '_')
                add("servers",
                    std::format("Server names '{}' and '{}' produce overlapping tool names", name, *it),
                    Severity::Error);
        }
    }

    if (config.enabled && std::ranges::none_of(config.servers, &ServerDescriptor::enabled))
        add("servers", "MCP is enabled but no servers are configured or enabled", Severity::Warning);

    return result;
}

auto ConfigValidator::report(const ManagerConfig& config) const -> ConfigReport
{
    auto const validation = validate(config);

    auto report = ConfigReport {};
    report.errors = validation.errorCount();
    report.warnings = validation.warningCount();

    if (!validation.isValid())
    {
        report.summary = "Configuration is invalid and cannot be loaded";
        report.recommendations.emplace_back("Fix configuration errors before using MCP features");
        return report;
    }

    report.totalServers = config.servers.size();
    report.enabledServers = static_cast<std::size_t>(std::ranges::count_if(config.servers, &ServerDescriptor::enabled));
    report.autoStartServers = static_cast<std::size_t>(
        std::ranges::count_if(config.servers, [](const auto& server) { return server.enabled && server.autoStart; }));

    if (!config.enabled)
        report.recommendations.emplace_back("Consider enabling MCP integration for enhanced functionality");
    else if (report.enabledServers == 0)
        report.recommendations.emplace_back("Enable at least one MCP server to use MCP features");

    if (config.maxRetries > 5)
        report.recommendations.emplace_back("High retry count may cause delays, consider reducing maxRetries");

    if (config.connectionTimeout < std::chrono::milliseconds(10000))
        report.recommendations.emplace_back("Low connection timeout may cause frequent failures");

    if (report.autoStartServers > 3)
        report.recommendations.emplace_back("Many auto-start servers may slow down startup");

    report.summary = std::format("MCP configuration: {} enabled servers, {} issues",
                                 report.enabledServers,
                                 validation.issues.size());
    return report;
}

} // namespace toolhost
