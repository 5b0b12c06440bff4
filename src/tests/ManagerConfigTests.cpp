// SPDX-License-Identifier: Apache-2.0
#include <manager/ManagerConfig.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolhost;
using namespace std::chrono_literals;

namespace
{

auto baseConfig() -> ManagerConfig
{
    auto config = ManagerConfig {};
    config.servers = {
        ServerDescriptor { .name = "git", .command = "uvx", .args = { "mcp-server-git" }, .autoStart = true },
        ServerDescriptor { .name = "filesystem", .command = "npx" },
    };
    return config;
}

} // namespace

TEST_CASE("Fallback mode names round-trip", "[config]")
{
    for (auto const mode: { FallbackMode::Disabled, FallbackMode::Graceful, FallbackMode::Always })
        CHECK(fallbackModeFromString(fallbackModeName(mode)) == mode);
    CHECK(!fallbackModeFromString("sometimes").has_value());
}

TEST_CASE("ManagerConfig finds servers by name", "[config]")
{
    auto const config = baseConfig();
    REQUIRE(config.findServer("git") != nullptr);
    CHECK(config.findServer("git")->command == "uvx");
    CHECK(config.findServer("weather") == nullptr);
}

TEST_CASE("clientOptionsFor and processConfigFor derive per-server settings", "[config]")
{
    auto config = baseConfig();
    config.maxRetries = 1;
    config.retryDelay = 50ms;
    config.toolCallTimeout = 1234ms;

    auto const options = clientOptionsFor(config);
    CHECK(options.maxRetries == 1);
    CHECK(options.baseRetryDelay == 50ms);
    CHECK(options.toolCallTimeout == 1234ms);
    CHECK(options.requestTimeout == config.requestTimeout);

    auto const process = processConfigFor(config.servers[0]);
    CHECK(process.command == "uvx");
    CHECK(process.args == std::vector<std::string> { "mcp-server-git" });
}

TEST_CASE("needsFullRestart detects structural changes", "[config]")
{
    auto const current = baseConfig();

    SECTION("identical configuration")
    {
        CHECK(!needsFullRestart(current, current));
    }

    SECTION("health check interval and setup guide are applied in place")
    {
        auto next = current;
        next.healthCheckInterval = 1000ms;
        next.showSetupGuide = false;
        CHECK(!needsFullRestart(current, next));
    }

    SECTION("a changed descriptor is applied per server")
    {
        auto next = current;
        next.servers[1].args = { "-y" };
        next.servers[0].enabled = false;
        CHECK(!needsFullRestart(current, next));
    }

    SECTION("global parameters need a restart")
    {
        auto next = current;
        next.maxRetries = 1;
        CHECK(needsFullRestart(current, next));

        next = current;
        next.fallbackMode = FallbackMode::Always;
        CHECK(needsFullRestart(current, next));

        next = current;
        next.enabled = false;
        CHECK(needsFullRestart(current, next));
    }

    SECTION("a changed server set needs a restart")
    {
        auto next = current;
        next.servers.pop_back();
        CHECK(needsFullRestart(current, next));
    }
}
