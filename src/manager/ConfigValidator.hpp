// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <manager/ManagerConfig.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace toolhost
{

/// @brief A single validation finding.
struct ValidationIssue
{
    enum class Severity
    {
        Error,
        Warning,
    };

    std::string path; ///< e.g. "servers[1].command" or "maxRetries".
    std::string message;
    Severity severity = Severity::Error;
};

struct ValidationResult
{
    std::vector<ValidationIssue> issues;

    /// @brief Returns true if no issue is an error.
    [[nodiscard]] auto isValid() const -> bool;
    [[nodiscard]] auto errorCount() const -> std::size_t;
    [[nodiscard]] auto warningCount() const -> std::size_t;

    /// @brief Joins the error messages with "; ".
    [[nodiscard]] auto errorSummary() const -> std::string;
};

/// @brief Summary of a configuration for display.
struct ConfigReport
{
    std::string summary;
    std::size_t totalServers = 0;
    std::size_t enabledServers = 0;
    std::size_t autoStartServers = 0;
    std::size_t errors = 0;
    std::size_t warnings = 0;
    std::vector<std::string> recommendations;
};

/// @brief Validates ManagerConfig values before the manager uses them.
class ConfigValidator
{
  public:
    /// @brief Checks structure, ranges and the environment (PATH, directories).
    [[nodiscard]] auto validate(const ManagerConfig& config) const -> ValidationResult;

    /// @brief Validates and summarizes the configuration with recommendations.
    [[nodiscard]] auto report(const ManagerConfig& config) const -> ConfigReport;

    /// @brief Returns true if @p command names an executable file, directly or via PATH.
    [[nodiscard]] static auto isCommandAvailable(std::string_view command) -> bool;
};

} // namespace toolhost
