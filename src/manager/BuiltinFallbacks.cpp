// SPDX-License-Identifier: Apache-2.0
#include "BuiltinFallbacks.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <map>
#include <sstream>

namespace toolhost
{

namespace
{
    namespace fs = std::filesystem;

    constexpr auto MaxReadBytes = std::uintmax_t { 1024 * 1024 };

    auto readTextFile(const fs::path& path) -> Result<std::string>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open file: {}", path.string()));

        auto buffer = std::stringstream {};
        buffer << file.rdbuf();
        return buffer.str();
    }

    auto trim(std::string text) -> std::string
    {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
            text.pop_back();
        return text;
    }

    auto stringArgument(const nlohmann::json& arguments, std::initializer_list<std::string_view> keys)
        -> std::string
    {
        for (auto const key: keys)
        {
            if (auto value = json::getStringOr(arguments, key, ""); !value.empty())
                return value;
        }
        return {};
    }

    /// @brief Maps branch names to commit ids from loose refs and packed-refs.
    auto readLocalBranches(const fs::path& gitDir) -> std::map<std::string, std::string>
    {
        auto branches = std::map<std::string, std::string> {};

        if (auto packed = readTextFile(gitDir / "packed-refs"))
        {
            auto stream = std::istringstream(*packed);
            auto line = std::string {};
            while (std::getline(stream, line))
            {
                if (line.empty() || line.front() == '#' || line.front() == '^')
                    continue;
                auto const space = line.find(' ');
                if (space == std::string::npos)
                    continue;
                auto const ref = std::string_view(line).substr(space + 1);
                if (ref.starts_with("refs/heads/"))
                    branches[std::string(ref.substr(11))] = line.substr(0, space);
            }
        }

        auto const headsDir = gitDir / "refs" / "heads";
        auto ec = std::error_code {};
        if (fs::is_directory(headsDir, ec))
        {
            for (auto it = fs::recursive_directory_iterator(headsDir, ec); !ec && it != fs::recursive_directory_iterator();
                 it.increment(ec))
            {
                if (!it->is_regular_file(ec))
                    continue;
                if (auto commit = readTextFile(it->path()))
                    branches[fs::relative(it->path(), headsDir, ec).generic_string()] = trim(std::move(*commit));
            }
        }

        return branches;
    }

    struct HeadState
    {
        std::string branch; ///< Empty when detached.
        std::string commit;
    };

    auto readHead(const fs::path& gitDir) -> Result<HeadState>
    {
        auto head = readTextFile(gitDir / "HEAD");
        if (!head)
            return std::unexpected(head.error());

        auto const content = trim(std::move(*head));
        auto state = HeadState {};

        if (content.starts_with("ref: refs/heads/"))
        {
            state.branch = content.substr(16);
            auto const branches = readLocalBranches(gitDir);
            if (auto const it = branches.find(state.branch); it != branches.end())
                state.commit = it->second;
        }
        else
        {
            state.commit = content;
        }
        return state;
    }

    auto readFile(const fs::path& workspace, const nlohmann::json& arguments) -> Result<std::string>
    {
        auto const requested = stringArgument(arguments, { "path", "file" });
        if (requested.empty())
            return makeError(ErrorCode::InvalidArgument, "File path is required");

        auto path = resolveInWorkspace(workspace, requested);
        if (!path)
            return std::unexpected(path.error());

        auto ec = std::error_code {};
        if (!fs::is_regular_file(*path, ec))
            return makeError(ErrorCode::IoError, std::format("Not a file: {}", path->string()));
        if (fs::file_size(*path, ec) > MaxReadBytes)
            return makeError(ErrorCode::IoError, std::format("File is larger than {} bytes", MaxReadBytes));

        auto content = readTextFile(*path);
        if (!content)
            return content;
        if (content->find('\0') != std::string::npos)
            return makeError(ErrorCode::IoError, std::format("Not a text file: {}", path->string()));
        return content;
    }

    auto listDirectory(const fs::path& workspace, const nlohmann::json& arguments) -> Result<std::string>
    {
        auto requested = stringArgument(arguments, { "path", "directory" });
        if (requested.empty())
            requested = ".";

        auto path = resolveInWorkspace(workspace, requested);
        if (!path)
            return std::unexpected(path.error());

        auto ec = std::error_code {};
        if (!fs::is_directory(*path, ec))
            return makeError(ErrorCode::IoError, std::format("Not a directory: {}", path->string()));

        auto directories = std::vector<std::string> {};
        auto files = std::vector<std::string> {};
        for (auto it = fs::directory_iterator(*path, ec); !ec && it != fs::directory_iterator(); it.increment(ec))
        {
            auto const name = it->path().filename().string();
            if (it->is_directory(ec))
                directories.push_back(name);
            else
                files.push_back(name);
        }
        if (ec)
            return makeError(ErrorCode::IoError, std::format("Cannot list {}: {}", path->string(), ec.message()));

        std::ranges::sort(directories);
        std::ranges::sort(files);

        auto output = std::string {};
        for (const auto& name: directories)
            output += std::format("[dir]  {}\n", name);
        for (const auto& name: files)
            output += std::format("[file] {}\n", name);
        output += std::format("{} directories, {} files", directories.size(), files.size());
        return output;
    }

    auto gitBranch(const fs::path& workspace) -> Result<std::string>
    {
        auto gitDir = findGitDirectory(workspace);
        if (!gitDir)
            return std::unexpected(gitDir.error());

        auto head = readHead(*gitDir);
        if (!head)
            return std::unexpected(head.error());

        auto const branches = readLocalBranches(*gitDir);
        auto output = std::string {};
        for (const auto& [name, commit]: branches)
            output += std::format("{} {} {}\n", name == head->branch ? '*' : ' ', name, commit.substr(0, 7));
        output += std::format("Current branch: {}", head->branch.empty() ? "(detached)" : head->branch);
        return output;
    }

    auto gitStatus(const fs::path& workspace) -> Result<std::string>
    {
        auto gitDir = findGitDirectory(workspace);
        if (!gitDir)
            return std::unexpected(gitDir.error());

        auto head = readHead(*gitDir);
        if (!head)
            return std::unexpected(head.error());

        auto ec = std::error_code {};
        auto output = std::format("On branch {}\nHEAD {}\n",
                                  head->branch.empty() ? "(detached)" : head->branch,
                                  head->commit.empty() ? "(no commits yet)" : head->commit);

        if (fs::exists(*gitDir / "MERGE_HEAD", ec))
            output += "Merge in progress\n";
        if (fs::exists(*gitDir / "rebase-merge", ec) || fs::exists(*gitDir / "rebase-apply", ec))
            output += "Rebase in progress\n";
        if (fs::exists(*gitDir / "CHERRY_PICK_HEAD", ec))
            output += "Cherry-pick in progress\n";

        output += std::format("Repository: {}", gitDir->parent_path().string());
        return output;
    }
} // namespace

auto resolveInWorkspace(const fs::path& workspace, std::string_view requested) -> Result<fs::path>
{
    if (workspace.empty())
        return makeError(ErrorCode::InvalidArgument, "No workspace configured");

    auto ec = std::error_code {};
    auto const root = fs::weakly_canonical(fs::absolute(workspace, ec), ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Invalid workspace: {}", workspace.string()));

    auto candidate = fs::path(requested);
    if (candidate.is_relative())
        candidate = root / candidate;

    auto const resolved = fs::weakly_canonical(candidate, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot resolve path: {}", requested));

    auto const relative = resolved.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..")
        return makeError(ErrorCode::InvalidArgument, std::format("Access restricted to workspace: {}", requested));

    return resolved;
}

auto findGitDirectory(const fs::path& start) -> Result<fs::path>
{
    auto ec = std::error_code {};
    auto current = fs::weakly_canonical(fs::absolute(start, ec), ec);

    while (!current.empty())
    {
        auto const candidate = current / ".git";
        if (fs::is_directory(candidate, ec))
            return candidate;

        // Worktrees and submodules use a ".git" file pointing to the real directory.
        if (fs::is_regular_file(candidate, ec))
        {
            if (auto content = readTextFile(candidate); content && content->starts_with("gitdir: "))
            {
                auto target = fs::path(trim(content->substr(8)));
                return target.is_relative() ? fs::weakly_canonical(current / target, ec) : target;
            }
        }

        if (current == current.root_path())
            break;
        current = current.parent_path();
    }

    return makeError(ErrorCode::IoError, std::format("No git repository found at {}", start.string()));
}

auto registerBuiltinFallbacks(FallbackRegistry& registry, const fs::path& workspace) -> VoidResult
{
    auto const pathShape = [](std::string_view property, bool required) {
        auto shape = ObjectShape {};
        shape.properties[std::string(property)] = std::make_shared<const InputShape>(InputShape { StringShape {} });
        if (required)
            shape.required.emplace_back(property);
        return InputShape { std::move(shape) };
    };

    auto bindings = std::vector<FallbackBinding> {
        FallbackBinding {
            .serverName = "filesystem",
            .toolName = "read_file",
            .description = "Read a text file from the workspace",
            .inputShape = pathShape("path", false),
            .implementation = [workspace](const nlohmann::json& arguments) { return readFile(workspace, arguments); },
            .limitations = { "Restricted to workspace files only", "Limited to text files" },
        },
        FallbackBinding {
            .serverName = "filesystem",
            .toolName = "list_directory",
            .description = "List the contents of a workspace directory",
            .inputShape = pathShape("path", false),
            .implementation =
                [workspace](const nlohmann::json& arguments) { return listDirectory(workspace, arguments); },
            .limitations = { "Restricted to workspace directories only" },
        },
        FallbackBinding {
            .serverName = "git",
            .toolName = "git_branch",
            .description = "List local git branches",
            .inputShape = InputShape { ObjectShape {} },
            .implementation = [workspace](const nlohmann::json&) { return gitBranch(workspace); },
            .limitations = { "Limited branch information", "Does not show remote branches" },
        },
        FallbackBinding {
            .serverName = "git",
            .toolName = "git_status",
            .description = "Show the current branch and repository state",
            .inputShape = InputShape { ObjectShape {} },
            .implementation = [workspace](const nlohmann::json&) { return gitStatus(workspace); },
            .limitations = { "Limited to current workspace", "Does not report working tree or staged changes" },
        },
    };

    for (auto& binding: bindings)
    {
        if (auto result = registry.addBinding(std::move(binding)); !result)
            return result;
    }
    return {};
}

} // namespace toolhost
