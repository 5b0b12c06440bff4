// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <manager/FallbackRegistry.hpp>

#include <filesystem>

namespace toolhost
{

/// @brief Adds the substitutes shipped with the host to @p registry.
///
/// - filesystem/read_file and filesystem/list_directory, restricted to @p workspace.
/// - git/git_branch and git/git_status, reading the repository that contains @p workspace.
///
/// @return The first error from FallbackRegistry::addBinding, if any.
[[nodiscard]] auto registerBuiltinFallbacks(FallbackRegistry& registry, const std::filesystem::path& workspace)
    -> VoidResult;

/// @brief Resolves @p requested against @p workspace and checks that it stays inside it.
/// @return The normalized absolute path, or InvalidArgument if it escapes the workspace.
[[nodiscard]] auto resolveInWorkspace(const std::filesystem::path& workspace, std::string_view requested)
    -> Result<std::filesystem::path>;

/// @brief Finds the git directory of the repository containing @p start.
/// @return The ".git" directory, or IoError if @p start is not inside a repository.
[[nodiscard]] auto findGitDirectory(const std::filesystem::path& start) -> Result<std::filesystem::path>;

} // namespace toolhost
