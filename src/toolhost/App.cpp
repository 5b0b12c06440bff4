// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <manager/BuiltinFallbacks.hpp>
#include <manager/ConnectionManager.hpp>
#include <manager/FallbackRegistry.hpp>
#include <manager/ToolRegistry.hpp>
#include <toolhost/ConfigWatcher.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <istream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

namespace toolhost
{

namespace
{

    auto splitWords(const std::string& line) -> std::vector<std::string>
    {
        auto words = std::vector<std::string> {};
        auto stream = std::istringstream(line);
        auto word = std::string {};
        while (stream >> word)
            words.push_back(std::move(word));
        return words;
    }

    /// @brief Returns what follows the first @p count whitespace-separated words of @p line.
    auto restAfterWords(std::string_view line, std::size_t count) -> std::string_view
    {
        auto pos = std::size_t { 0 };
        for (auto i = std::size_t { 0 }; i < count; ++i)
        {
            pos = line.find_first_not_of(" \t", pos);
            if (pos == std::string_view::npos)
                return {};
            pos = line.find_first_of(" \t", pos);
            if (pos == std::string_view::npos)
                return {};
        }
        return line.substr(pos);
    }

    auto formatAge(std::optional<std::chrono::system_clock::time_point> time) -> std::string
    {
        if (!time)
            return "-";
        auto const age = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - *time);
        return std::format("{}s ago", age.count());
    }

    void applyLogLevel(const std::string& name)
    {
        if (auto const level = log::levelFromString(name))
            log::setLevel(*level);
        else
            log::warning("Unknown log level '{}'", name);
    }

    constexpr auto HelpText = std::string_view {
        "Commands:\n"
        "  status                      Show server status and statistics\n"
        "  tools [--json]              List registered tools\n"
        "  start <server>              Start a server\n"
        "  stop <server>               Stop a server\n"
        "  restart <server>            Restart a server\n"
        "  call <server> <tool> [json] Invoke a tool\n"
        "  reload                      Reload the configuration file\n"
        "  quit                        Exit\n"
    };

} // namespace

struct App::Impl
{
    mutable std::mutex configMutex; ///< Guards config; held for a whole reload.
    AppConfig config;
    std::string configPath;
    ToolRegistry tools;
    FallbackRegistry fallbacks;
    ConnectionManager manager;
    std::unique_ptr<ConfigWatcher> watcher;
    int subscription = 0;

    Impl(AppConfig appConfig, std::string path):
        config(std::move(appConfig)),
        configPath(std::move(path)),
        fallbacks(tools, config.mcp.fallbackMode),
        manager(config.mcp, tools, fallbacks)
    {
    }

    [[nodiscard]] auto workspace() const -> std::filesystem::path
    {
        {
            auto lock = std::lock_guard(configMutex);
            if (!config.workspace.empty())
                return config.workspace;
        }
        auto ec = std::error_code {};
        auto current = std::filesystem::current_path(ec);
        return ec ? std::filesystem::path(".") : current;
    }

    auto reload(const AppConfig& next) -> VoidResult
    {
        auto lock = std::lock_guard(configMutex);
        if (next.logLevel != config.logLevel)
            applyLogLevel(next.logLevel);
        if (next.workspace != config.workspace)
            log::warning("Workspace changes take effect after a restart of toolhost");

        auto result = manager.applyConfiguration(next.mcp);
        if (!result)
            return result;

        config.logLevel = next.logLevel;
        config.mcp = next.mcp;
        return {};
    }

    void onManagerEvent(const ManagerEvent& event)
    {
        std::visit(
            [](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, ServerStarted>)
                    log::info("[{}] started", e.server);
                else if constexpr (std::is_same_v<T, ServerStopped>)
                    log::info("[{}] stopped", e.server);
                else if constexpr (std::is_same_v<T, ServerError>)
                    log::warning("[{}] {}", e.server, e.message);
                else if constexpr (std::is_same_v<T, ToolRegistered>)
                    log::debug("[{}] tool registered: {}", e.server, e.tool);
                else if constexpr (std::is_same_v<T, ToolUnregistered>)
                    log::debug("[{}] tool unregistered: {}", e.server, e.tool);
                else if constexpr (std::is_same_v<T, FallbackActivated>)
                    log::info("[{}] {} fallback tool(s) active", e.server, e.toolCount);
                else if constexpr (std::is_same_v<T, FallbackDeactivated>)
                    log::info("[{}] fallback tools removed", e.server);
                else if constexpr (std::is_same_v<T, SetupAdvisory>)
                    log::debug("Setup advisory issued");
            },
            event);
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App()
{
    if (_impl->watcher)
        _impl->watcher->stop();
    _impl->manager.unsubscribe(_impl->subscription);
    _impl->manager.stop();
}

auto App::initialize() -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->configMutex);
        applyLogLevel(_impl->config.logLevel);
    }

    auto const workspace = _impl->workspace();
    log::info("Workspace: {}", workspace.string());
    if (auto result = registerBuiltinFallbacks(_impl->fallbacks, workspace); !result)
        return result;

    _impl->subscription = _impl->manager.subscribe([this](const ManagerEvent& event) { _impl->onManagerEvent(event); });

    if (auto result = _impl->manager.start(); !result)
        return result;

    if (!_impl->configPath.empty())
    {
        _impl->watcher = std::make_unique<ConfigWatcher>(_impl->configPath, [this](const AppConfig& next) {
            if (auto result = _impl->reload(next); !result)
                log::error("Configuration change rejected: {}", result.error());
        });
        _impl->watcher->start();
    }

    return {};
}

void App::printStatus(std::ostream& output) const
{
    auto const& manager = _impl->manager;
    auto const stats = manager.statistics();

    output << std::format("MCP {} | fallback mode: {} | servers: {}/{} running | tools: {} real, {} fallback | "
                          "restarts: {}\n",
                          manager.config().enabled ? "enabled" : "disabled",
                          fallbackModeName(_impl->fallbacks.mode()),
                          stats.runningServers,
                          stats.totalServers,
                          stats.realTools,
                          stats.fallbackTools,
                          stats.restarts);

    for (const auto& [name, status]: manager.allServerStatuses())
    {
        auto const info = manager.connectionInfo(name);
        if (!info)
            continue;

        output << std::format("  {:<16} {:<12} pid={} tools={} heartbeat={}{}\n",
                              name,
                              serverStatusName(status),
                              info->processId ? std::to_string(*info->processId) : "-",
                              info->toolCount,
                              formatAge(info->lastHeartbeat),
                              info->fallbackActive ? " [fallback]" : "");
        if (!info->lastError.empty())
            output << std::format("  {:<16} last error: {}\n", "", info->lastError);
    }
}

auto App::execute(const std::string& line, std::ostream& output) -> bool
{
    auto const words = splitWords(line);
    if (words.empty())
        return true;

    auto const& command = words[0];

    if (command == "quit" || command == "exit")
        return false;

    if (command == "help")
    {
        output << HelpText;
        return true;
    }

    if (command == "status")
    {
        printStatus(output);
        return true;
    }

    if (command == "tools")
    {
        if (words.size() > 1 && words[1] == "--json")
        {
            output << _impl->tools.toolsSpec().dump(2) << '\n';
            return true;
        }

        auto const names = _impl->tools.toolNames();
        if (names.empty())
            output << "No tools available\n";
        for (const auto& name: names)
        {
            if (auto const info = _impl->tools.toolInfo(name))
                output << std::format("  {} ({}) {}\n", name, describeShape(info->inputShape), info->description);
        }
        return true;
    }

    if (command == "start" || command == "stop" || command == "restart")
    {
        if (words.size() != 2)
        {
            output << std::format("Usage: {} <server>\n", command);
            return true;
        }

        auto& manager = _impl->manager;
        auto const result = command == "start"  ? manager.startServer(words[1])
                            : command == "stop" ? manager.stopServer(words[1])
                                                : manager.restartServer(words[1]);
        if (result)
            output << std::format("{}: ok\n", command);
        else
            output << std::format("{} failed: {}\n", command, result.error());
        return true;
    }

    if (command == "call")
    {
        if (words.size() < 3)
        {
            output << "Usage: call <server> <tool> [json arguments]\n";
            return true;
        }

        auto arguments = nlohmann::json::object();
        if (auto const rest = restAfterWords(line, 3); rest.find_first_not_of(" \t") != std::string_view::npos)
        {
            auto parsed = json::parse(rest);
            if (!parsed)
            {
                output << std::format("Invalid arguments: {}\n", parsed.error());
                return true;
            }
            arguments = std::move(*parsed);
        }

        auto const result = _impl->manager.invokeTool(words[1], words[2], arguments);
        if (result.isError)
            output << std::format("Error [{}]: {}\n", result.errorCode, result.errorMessage);
        if (!result.text.empty())
            output << result.text << '\n';
        for (const auto& notice: result.notices)
            output << std::format("Note: {}\n", notice);
        return true;
    }

    if (command == "reload")
    {
        if (_impl->configPath.empty())
        {
            output << "No configuration file to reload\n";
            return true;
        }

        auto next = loadConfigFromFile(_impl->configPath);
        if (!next)
        {
            output << std::format("Reload failed: {}\n", next.error());
            return true;
        }
        if (auto result = _impl->reload(*next); !result)
            output << std::format("Reload failed: {}\n", result.error());
        else
            output << "Configuration reloaded\n";
        return true;
    }

    output << std::format("Unknown command: {} (type help)\n", command);
    return true;
}

auto App::run(std::istream& input, std::ostream& output) -> int
{
    output << "Type help for commands, quit to exit\n";

    auto line = std::string {};
    while (true)
    {
        output << "> " << std::flush;
        if (!std::getline(input, line))
            break;
        if (!execute(line, output))
            break;
    }

    return 0;
}

} // namespace toolhost
