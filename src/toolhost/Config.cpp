// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace toolhost
{

namespace
{

    auto getMillisecondsOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds { json::getInt64Or(obj, key, defaultValue.count()) };
    }

    auto parseServer(const nlohmann::json& serverJson, std::string name, std::size_t index)
        -> Result<ServerDescriptor>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("mcp.servers[{}] must be an object", index));

        if (name.empty())
            name = json::getStringOr(serverJson, "name", "");
        if (name.empty())
            return makeError(ErrorCode::ConfigError, std::format("mcp.servers[{}] has no name", index));

        return ServerDescriptor {
            .name = std::move(name),
            .description = json::getStringOr(serverJson, "description", ""),
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .workingDirectory = json::getStringOr(serverJson, "workingDirectory", ""),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .autoStart = json::getBoolOr(serverJson, "autoStart", false),
            .tools = json::getStringArray(serverJson, "tools"),
            .resources = json::getStringArray(serverJson, "resources"),
        };
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/toolhost";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/toolhost";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseManagerConfig(const nlohmann::json& section) -> Result<ManagerConfig>
{
    auto config = ManagerConfig {};
    if (section.is_null())
        return config;
    if (!section.is_object())
        return makeError(ErrorCode::ConfigError, "The \"mcp\" section must be an object");

    config.enabled = json::getBoolOr(section, "enabled", config.enabled);
    config.maxRetries = json::getIntOr(section, "maxRetries", config.maxRetries);
    config.retryDelay = getMillisecondsOr(section, "retryDelay", config.retryDelay);
    config.connectionTimeout = getMillisecondsOr(section, "connectionTimeout", config.connectionTimeout);
    config.healthCheckInterval = getMillisecondsOr(section, "healthCheckInterval", config.healthCheckInterval);
    config.autoRestart = json::getBoolOr(section, "autoRestart", config.autoRestart);
    config.showSetupGuide = json::getBoolOr(section, "showSetupGuide", config.showSetupGuide);
    config.requestTimeout = getMillisecondsOr(section, "requestTimeout", config.requestTimeout);
    config.toolCallTimeout = getMillisecondsOr(section, "toolCallTimeout", config.toolCallTimeout);
    config.pingTimeout = getMillisecondsOr(section, "pingTimeout", config.pingTimeout);
    config.restartDelay = getMillisecondsOr(section, "restartDelay", config.restartDelay);

    if (section.contains("fallbackMode"))
    {
        auto const modeName = json::getStringOr(section, "fallbackMode", "");
        auto const mode = fallbackModeFromString(modeName);
        if (!mode)
            return makeError(ErrorCode::ConfigError, std::format("Unknown fallback mode: '{}'", modeName));
        config.fallbackMode = *mode;
    }

    if (!section.contains("servers"))
        return config;

    // Servers are an array of descriptors, or an object keyed by server name.
    auto const& servers = section["servers"];
    if (servers.is_array())
    {
        for (std::size_t index = 0; index < servers.size(); ++index)
        {
            auto server = parseServer(servers[index], {}, index);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }
    else if (servers.is_object())
    {
        auto index = std::size_t { 0 };
        for (const auto& [name, serverJson]: servers.items())
        {
            auto server = parseServer(serverJson, name, index++);
            if (!server)
                return std::unexpected(server.error());
            config.servers.push_back(std::move(*server));
        }
    }
    else
    {
        return makeError(ErrorCode::ConfigError, "mcp.servers must be an array or an object");
    }

    return config;
}

auto managerConfigToJson(const ManagerConfig& config) -> nlohmann::json
{
    auto section = nlohmann::json::object();
    section["enabled"] = config.enabled;
    section["maxRetries"] = config.maxRetries;
    section["retryDelay"] = config.retryDelay.count();
    section["connectionTimeout"] = config.connectionTimeout.count();
    section["healthCheckInterval"] = config.healthCheckInterval.count();
    section["autoRestart"] = config.autoRestart;
    section["fallbackMode"] = std::string(fallbackModeName(config.fallbackMode));
    section["showSetupGuide"] = config.showSetupGuide;
    section["requestTimeout"] = config.requestTimeout.count();
    section["toolCallTimeout"] = config.toolCallTimeout.count();
    section["pingTimeout"] = config.pingTimeout.count();
    section["restartDelay"] = config.restartDelay.count();

    auto servers = nlohmann::json::array();
    for (const auto& descriptor: config.servers)
    {
        auto server = nlohmann::json::object();
        server["name"] = descriptor.name;
        if (!descriptor.description.empty())
            server["description"] = descriptor.description;
        server["command"] = descriptor.command;
        server["args"] = descriptor.args;
        server["env"] = descriptor.env;
        if (!descriptor.workingDirectory.empty())
            server["workingDirectory"] = descriptor.workingDirectory;
        server["enabled"] = descriptor.enabled;
        server["autoStart"] = descriptor.autoStart;
        server["tools"] = descriptor.tools;
        server["resources"] = descriptor.resources;
        servers.push_back(std::move(server));
    }
    section["servers"] = std::move(servers);
    return section;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("{}: top level must be an object", path));

    auto config = AppConfig {};
    config.logLevel = json::getStringOr(root, "logLevel", config.logLevel);
    config.workspace = json::getStringOr(root, "workspace", "");

    if (root.contains("mcp"))
    {
        auto mcp = parseManagerConfig(root["mcp"]);
        if (!mcp)
            return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, mcp.error().message));
        config.mcp = std::move(*mcp);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["logLevel"] = config.logLevel;
    if (!config.workspace.empty())
        root["workspace"] = config.workspace;
    root["mcp"] = managerConfigToJson(config.mcp);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace toolhost
