// SPDX-License-Identifier: Apache-2.0
#include <toolhost/Config.hpp>
#include <toolhost/ConfigWatcher.hpp>

#include "FakeProvider.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>

using namespace toolhost;
using namespace std::chrono_literals;

namespace
{

void writeFile(const std::filesystem::path& path, std::string_view content)
{
    auto file = std::ofstream(path);
    file << content;
}

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("toolhost/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.logLevel == "info");
    CHECK(config.workspace.empty());
    CHECK(config.mcp.enabled);
    CHECK(config.mcp.maxRetries == 3);
    CHECK(config.mcp.retryDelay == 5000ms);
    CHECK(config.mcp.connectionTimeout == 10000ms);
    CHECK(config.mcp.healthCheckInterval == 30000ms);
    CHECK(config.mcp.autoRestart);
    CHECK(config.mcp.fallbackMode == FallbackMode::Graceful);
    CHECK(config.mcp.showSetupGuide);
    CHECK(config.mcp.servers.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "toolhost_test_config.json";
    writeFile(tempPath, R"({
        "logLevel": "debug",
        "workspace": "/tmp/project",
        "mcp": {
            "enabled": true,
            "maxRetries": 5,
            "retryDelay": 250,
            "connectionTimeout": 2000,
            "healthCheckInterval": 1000,
            "autoRestart": false,
            "fallbackMode": "always",
            "showSetupGuide": false,
            "servers": [
                {
                    "name": "git",
                    "description": "Git tools",
                    "command": "uvx",
                    "args": ["mcp-server-git"],
                    "env": {"KEY": "value"},
                    "workingDirectory": "/tmp",
                    "enabled": true,
                    "autoStart": true,
                    "tools": ["git_status"],
                    "resources": []
                }
            ]
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Application settings")
    {
        CHECK(config.logLevel == "debug");
        CHECK(config.workspace == "/tmp/project");
    }

    SECTION("Manager settings")
    {
        CHECK(config.mcp.maxRetries == 5);
        CHECK(config.mcp.retryDelay == 250ms);
        CHECK(config.mcp.connectionTimeout == 2000ms);
        CHECK(config.mcp.healthCheckInterval == 1000ms);
        CHECK(!config.mcp.autoRestart);
        CHECK(config.mcp.fallbackMode == FallbackMode::Always);
        CHECK(!config.mcp.showSetupGuide);
        CHECK(config.mcp.toolCallTimeout == 30000ms);
    }

    SECTION("Server descriptors")
    {
        REQUIRE(config.mcp.servers.size() == 1);
        auto const& server = config.mcp.servers[0];
        CHECK(server.name == "git");
        CHECK(server.description == "Git tools");
        CHECK(server.command == "uvx");
        REQUIRE(server.args.size() == 1);
        CHECK(server.args[0] == "mcp-server-git");
        REQUIRE(server.env.contains("KEY"));
        CHECK(server.env.at("KEY") == "value");
        CHECK(server.workingDirectory == "/tmp");
        CHECK(server.autoStart);
        CHECK(server.tools == std::vector<std::string> { "git_status" });
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("parseManagerConfig accepts servers keyed by name", "[config]")
{
    auto const section = nlohmann::json::parse(R"({
        "servers": {
            "filesystem": { "command": "npx", "args": ["-y", "@modelcontextprotocol/server-filesystem"] }
        }
    })");

    auto result = parseManagerConfig(section);
    REQUIRE(result.has_value());
    REQUIRE(result->servers.size() == 1);
    CHECK(result->servers[0].name == "filesystem");
    CHECK(result->servers[0].enabled);
    CHECK(!result->servers[0].autoStart);
}

TEST_CASE("parseManagerConfig rejects malformed sections", "[config]")
{
    CHECK(!parseManagerConfig(nlohmann::json::array()).has_value());
    CHECK(!parseManagerConfig(nlohmann::json { { "fallbackMode", "sometimes" } }).has_value());
    CHECK(!parseManagerConfig(nlohmann::json { { "servers", 3 } }).has_value());
    CHECK(!parseManagerConfig(nlohmann::json::parse(R"({"servers":[{"command":"x"}]})")).has_value());

    auto const defaults = parseManagerConfig(nullptr);
    REQUIRE(defaults.has_value());
    CHECK(*defaults == ManagerConfig {});
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "toolhost_test_invalid.json";
    writeFile(tempPath, "{ this is not json");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a loadable configuration", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "toolhost_test_save";
    auto const tempPath = tempDir / "nested" / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.logLevel = "warning";
    config.workspace = "/srv/work";
    config.mcp.fallbackMode = FallbackMode::Disabled;
    config.mcp.restartDelay = 250ms;
    config.mcp.servers.push_back(ServerDescriptor {
        .name = "git",
        .command = "uvx",
        .args = { "mcp-server-git", "--repository", "." },
        .env = { { "GIT_DIR", ".git" } },
        .autoStart = true,
    });

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());
    REQUIRE(std::filesystem::exists(tempPath));

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(*loaded == config);

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("ConfigWatcher reports changed files", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "toolhost_test_watch.json";
    writeFile(tempPath, R"({"logLevel":"info"})");

    auto changes = std::atomic<int> { 0 };
    auto lastLevel = std::string {};
    auto watcher = ConfigWatcher(tempPath.string(), [&](const AppConfig& config) {
        lastLevel = config.logLevel;
        ++changes;
    });

    CHECK(!watcher.poll());

    writeFile(tempPath, R"({"logLevel":"debug"})");
    std::filesystem::last_write_time(tempPath, std::filesystem::last_write_time(tempPath) + 2s);
    CHECK(watcher.poll());
    CHECK(changes == 1);
    CHECK(lastLevel == "debug");
    CHECK(!watcher.poll());

    // Broken contents are skipped until the file becomes valid again.
    writeFile(tempPath, "{ broken");
    std::filesystem::last_write_time(tempPath, std::filesystem::last_write_time(tempPath) + 4s);
    CHECK(!watcher.poll());
    CHECK(changes == 1);

    std::filesystem::remove(tempPath);
}

TEST_CASE("ConfigWatcher polls on its own thread", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "toolhost_test_watch_thread.json";
    writeFile(tempPath, R"({"logLevel":"info"})");

    auto changes = std::atomic<int> { 0 };
    auto watcher = ConfigWatcher(tempPath.string(), [&](const AppConfig&) { ++changes; }, 20ms);
    watcher.start();

    writeFile(tempPath, R"({"logLevel":"trace"})");
    std::filesystem::last_write_time(tempPath, std::filesystem::last_write_time(tempPath) + 2s);

    CHECK(toolhost::test::waitUntil([&] { return changes == 1; }));
    watcher.stop();

    std::filesystem::remove(tempPath);
}
