// SPDX-License-Identifier: Apache-2.0
#include <toolhost/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace toolhost;

namespace
{

namespace fs = std::filesystem;

auto consoleConfig(const fs::path& workspace) -> AppConfig
{
    auto config = AppConfig {};
    config.logLevel = "error";
    config.workspace = workspace.string();
    config.mcp.showSetupGuide = false;
    config.mcp.maxRetries = 0;
    config.mcp.connectionTimeout = std::chrono::milliseconds(1000);
    config.mcp.servers.push_back(ServerDescriptor {
        .name = "filesystem",
        .command = "/nonexistent/filesystem-provider",
        .autoStart = false,
    });
    return config;
}

auto run(App& app, const std::string& line) -> std::string
{
    auto output = std::ostringstream {};
    app.execute(line, output);
    return output.str();
}

} // namespace

TEST_CASE("App console commands", "[app]")
{
    auto const workspace = fs::temp_directory_path() / "toolhost_test_app";
    fs::remove_all(workspace);
    fs::create_directories(workspace);
    std::ofstream(workspace / "note.txt") << "remember the milk";

    auto app = App(consoleConfig(workspace), "");
    REQUIRE(app.initialize().has_value());

    SECTION("status lists configured servers")
    {
        auto const output = run(app, "status");
        CHECK(output.find("fallback mode: graceful") != std::string::npos);
        CHECK(output.find("servers: 0/1 running") != std::string::npos);
        CHECK(output.find("filesystem") != std::string::npos);
        CHECK(output.find("[fallback]") != std::string::npos);
    }

    SECTION("tools lists the active substitutes")
    {
        auto const output = run(app, "tools");
        CHECK(output.find("fallback_filesystem_read_file") != std::string::npos);
        CHECK(output.find("fallback_filesystem_list_directory") != std::string::npos);
        CHECK(output.find("fallback_git_") == std::string::npos);
    }

    SECTION("tools --json prints the tool schemas")
    {
        auto const spec = nlohmann::json::parse(run(app, "tools --json"));
        REQUIRE(spec.is_array());
        REQUIRE(spec.size() == 2);
        CHECK(spec[0]["name"] == "fallback_filesystem_list_directory");
        CHECK(spec[1]["name"] == "fallback_filesystem_read_file");
        CHECK(spec[1]["inputSchema"]["type"] == "object");
    }

    SECTION("call reaches a substitute")
    {
        auto const output = run(app, R"(call filesystem read_file {"path": "note.txt"})");
        CHECK(output.find("remember the milk") != std::string::npos);
        CHECK(output.find("Note: Served by a local fallback") != std::string::npos);

        CHECK(run(app, "call filesystem read_file {oops").starts_with("Invalid arguments"));

        // Arguments start after the third word even when the tool name also appears earlier.
        auto const repeated = run(app, R"(call read_file read_file {"path": "note.txt"})");
        CHECK(repeated.find("Invalid arguments") == std::string::npos);
        CHECK(repeated.find("SERVER_NOT_FOUND") != std::string::npos);
        CHECK(run(app, "call weather forecast").find("SERVER_NOT_FOUND") != std::string::npos);
    }

    SECTION("lifecycle commands report failures")
    {
        CHECK(run(app, "stop weather").starts_with("stop failed"));
        CHECK(run(app, "start").starts_with("Usage: start <server>"));
        CHECK(run(app, "start filesystem").starts_with("start failed"));
        CHECK(run(app, "reload") == "No configuration file to reload\n");
        CHECK(run(app, "frobnicate").starts_with("Unknown command: frobnicate"));
    }

    SECTION("run stops at quit")
    {
        auto input = std::istringstream("help\nquit\nstatus\n");
        auto output = std::ostringstream {};
        CHECK(app.run(input, output) == 0);
        CHECK(output.str().find("call <server> <tool> [json]") != std::string::npos);
        CHECK(output.str().find("servers:") == std::string::npos);
    }

    fs::remove_all(workspace);
}

TEST_CASE("App serializes concurrent configuration reloads", "[app]")
{
    auto const workspace = fs::temp_directory_path() / "toolhost_test_app_reload";
    auto const configPath = workspace / "config.json";
    fs::remove_all(workspace);
    fs::create_directories(workspace);

    auto config = consoleConfig(workspace);
    REQUIRE(saveConfigToFile(configPath.string(), config).has_value());

    auto app = App(config, configPath.string());
    REQUIRE(app.initialize().has_value());

    auto failures = std::atomic<int> { 0 };
    auto readers = std::vector<std::jthread> {};
    for (auto i = 0; i < 4; ++i)
    {
        readers.emplace_back([&] {
            for (auto round = 0; round < 20; ++round)
            {
                if (run(app, "reload") != "Configuration reloaded\n")
                    ++failures;
            }
        });
    }

    // Rewrites race with the console reloads and with the file watcher.
    for (auto round = 0; round < 20; ++round)
    {
        config.logLevel = round % 2 ? "error" : "warning";
        config.mcp.healthCheckInterval = std::chrono::milliseconds(round % 2 ? 30000 : 20000);
        auto const temporary = workspace / "config.json.tmp";
        REQUIRE(saveConfigToFile(temporary.string(), config).has_value());
        fs::rename(temporary, configPath);
    }

    readers.clear();
    CHECK(failures == 0);
    CHECK(run(app, "status").find("servers: 0/1 running") != std::string::npos);

    fs::remove_all(workspace);
}
