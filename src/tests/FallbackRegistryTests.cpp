// SPDX-License-Identifier: Apache-2.0
#include <manager/FallbackRegistry.hpp>
#include <manager/ToolRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace toolhost;

namespace
{

auto echoBinding(std::string server = "files", std::string tool = "echo") -> FallbackBinding
{
    return FallbackBinding {
        .serverName = std::move(server),
        .toolName = std::move(tool),
        .description = "Echo",
        .inputShape = InputShape { ObjectShape {} },
        .implementation = [](const nlohmann::json& arguments) -> Result<std::string> {
            if (arguments.contains("fail"))
                return makeError(ErrorCode::IoError, "asked to fail");
            return std::format("fallback:{}", arguments.value("text", ""));
        },
        .limitations = { "Local echo only" },
    };
}

} // namespace

TEST_CASE("FallbackRegistry policy decisions", "[fallback]")
{
    auto bridge = ToolRegistry {};
    auto registry = FallbackRegistry(bridge);
    CHECK(registry.mode() == FallbackMode::Graceful);

    CHECK(registry.shouldUseFallback("files", false));
    CHECK(!registry.shouldUseFallback("files", true));

    registry.setMode(FallbackMode::Always);
    CHECK(registry.shouldUseFallback("files", false));
    CHECK(registry.shouldUseFallback("files", true));

    registry.setMode(FallbackMode::Disabled);
    CHECK(!registry.shouldUseFallback("files", false));
    CHECK(!registry.shouldUseFallback("files", true));
}

TEST_CASE("FallbackRegistry validates bindings", "[fallback]")
{
    auto bridge = ToolRegistry {};
    auto registry = FallbackRegistry(bridge);

    REQUIRE(registry.addBinding(echoBinding()).has_value());
    CHECK(registry.hasBinding("files", "echo"));
    CHECK(registry.hasBindings("files"));
    CHECK(!registry.hasBindings("git"));

    CHECK(!registry.addBinding(echoBinding()).has_value());
    CHECK(!registry.addBinding(echoBinding("", "echo")).has_value());

    auto noLimitations = echoBinding("files", "other");
    noLimitations.limitations.clear();
    CHECK(!registry.addBinding(std::move(noLimitations)).has_value());

    auto noImplementation = echoBinding("files", "third");
    noImplementation.implementation = nullptr;
    CHECK(!registry.addBinding(std::move(noImplementation)).has_value());
}

TEST_CASE("FallbackRegistry registers substitutes idempotently", "[fallback]")
{
    auto bridge = ToolRegistry {};
    auto registry = FallbackRegistry(bridge);
    REQUIRE(registry.addBinding(echoBinding()).has_value());
    REQUIRE(registry.addBinding(echoBinding("files", "shout")).has_value());

    CHECK(registry.registerFallbackTools("files") == 2);
    CHECK(registry.registerFallbackTools("files") == 0);
    CHECK(registry.isActive("files"));
    CHECK(registry.activeToolCount() == 2);
    CHECK(bridge.hasTool("fallback_files_echo"));

    auto const info = bridge.toolInfo("fallback_files_echo");
    REQUIRE(info.has_value());
    CHECK(info->origin == ToolOrigin::Fallback);
    CHECK(info->serverName == "files");

    auto const status = registry.status("files");
    CHECK(status.hasFallback);
    CHECK(status.active);
    CHECK(status.toolCount == 2);
    CHECK(status.limitations == std::vector<std::string> { "Local echo only" });

    CHECK(registry.unregisterFallbackTools("files") == 2);
    CHECK(registry.unregisterFallbackTools("files") == 0);
    CHECK(!registry.isActive("files"));
    CHECK(bridge.toolNames().empty());
}

TEST_CASE("FallbackRegistry results are degraded and annotated", "[fallback]")
{
    auto bridge = ToolRegistry {};
    auto registry = FallbackRegistry(bridge);
    REQUIRE(registry.addBinding(echoBinding()).has_value());
    registry.registerFallbackTools("files");

    auto const result = bridge.invoke("fallback_files_echo", nlohmann::json { { "text", "hi" } });
    CHECK(!result.isError);
    CHECK(result.degraded);
    CHECK(result.text == "fallback:hi");
    CHECK(result.limitations == std::vector<std::string> { "Local echo only" });
    REQUIRE(!result.notices.empty());

    auto const failed = registry.invoke("files", "echo", nlohmann::json { { "fail", true } });
    CHECK(failed.isError);
    CHECK(failed.errorCode == "FALLBACK_ERROR");
    CHECK(failed.degraded);

    auto const unknown = registry.invoke("files", "missing", nlohmann::json::object());
    CHECK(unknown.isError);
    CHECK(unknown.errorCode == "FALLBACK_ERROR");
}

TEST_CASE("FallbackRegistry reports servers without substitutes", "[fallback]")
{
    auto bridge = ToolRegistry {};
    auto registry = FallbackRegistry(bridge);

    CHECK(registry.registerFallbackTools("weather") == 0);
    CHECK(!registry.isActive("weather"));

    auto const status = registry.status("weather");
    CHECK(!status.hasFallback);
    CHECK(status.toolCount == 0);
    CHECK(registry.allStatuses().empty());
}
