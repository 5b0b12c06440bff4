// SPDX-License-Identifier: Apache-2.0
#include <manager/ToolRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolhost;

namespace
{

auto makeTool(std::string name, InputShape shape = InputShape { AnyShape {} }) -> RegisteredTool
{
    return RegisteredTool {
        .name = name,
        .description = "test tool",
        .inputShape = std::move(shape),
        .handler =
            [name](const nlohmann::json& arguments) {
                auto result = ToolResult {};
                result.toolName = name;
                result.text = arguments.dump();
                return result;
            },
        .origin = ToolOrigin::Real,
        .serverName = "test",
        .toolName = "tool",
    };
}

} // namespace

TEST_CASE("Namespaced tool names", "[registry]")
{
    CHECK(realToolName("git", "git_status") == "mcp_git_git_status");
    CHECK(fallbackToolName("filesystem", "read_file") == "fallback_filesystem_read_file");
}

TEST_CASE("ToolRegistry registers, invokes and unregisters tools", "[registry]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("mcp_test_tool")).has_value());

    CHECK(registry.hasTool("mcp_test_tool"));
    CHECK(registry.toolNames() == std::vector<std::string> { "mcp_test_tool" });

    auto const info = registry.toolInfo("mcp_test_tool");
    REQUIRE(info.has_value());
    CHECK(info->origin == ToolOrigin::Real);
    CHECK(info->serverName == "test");

    auto const result = registry.invoke("mcp_test_tool", nlohmann::json { { "a", 1 } });
    CHECK(!result.isError);
    CHECK(result.text == R"({"a":1})");

    CHECK(registry.unregisterTool("mcp_test_tool"));
    CHECK(!registry.unregisterTool("mcp_test_tool"));
    CHECK(!registry.hasTool("mcp_test_tool"));
}

TEST_CASE("ToolRegistry rejects invalid registrations", "[registry]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("dup")).has_value());

    auto duplicate = registry.registerTool(makeTool("dup"));
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::InvalidArgument);

    auto unnamed = registry.registerTool(makeTool(""));
    CHECK(!unnamed.has_value());

    auto noHandler = makeTool("no_handler");
    noHandler.handler = nullptr;
    CHECK(!registry.registerTool(std::move(noHandler)).has_value());
}

TEST_CASE("ToolRegistry reports unknown tools and mismatching arguments", "[registry]")
{
    auto registry = ToolRegistry {};

    auto const missing = registry.invoke("nope", nlohmann::json::object());
    CHECK(missing.isError);
    CHECK(missing.errorCode == "TOOL_NOT_FOUND");

    auto shape = ObjectShape {};
    shape.properties["path"] = std::make_shared<const InputShape>(InputShape { StringShape {} });
    shape.required = { "path" };
    REQUIRE(registry.registerTool(makeTool("typed", InputShape { std::move(shape) })).has_value());

    auto const invalid = registry.invoke("typed", nlohmann::json { { "path", 1 } });
    CHECK(invalid.isError);
    CHECK(invalid.errorCode == "INVALID_ARGUMENTS");

    CHECK(!registry.invoke("typed", nlohmann::json { { "path", "x" } }).isError);
}

TEST_CASE("ToolRegistry handlers may modify the registry", "[registry]")
{
    auto registry = ToolRegistry {};
    auto tool = makeTool("self_removing");
    tool.handler = [&registry](const nlohmann::json&) {
        registry.unregisterTool("self_removing");
        return ToolResult {};
    };
    REQUIRE(registry.registerTool(std::move(tool)).has_value());

    (void) registry.invoke("self_removing", nlohmann::json::object());
    CHECK(!registry.hasTool("self_removing"));
}

TEST_CASE("ToolRegistry exports its tools spec", "[registry]")
{
    auto registry = ToolRegistry {};
    REQUIRE(registry.registerTool(makeTool("mcp_a_x")).has_value());
    REQUIRE(registry.registerTool(makeTool("fallback_a_x")).has_value());

    CHECK(registry.toolNamesWithPrefix(RealToolPrefix) == std::vector<std::string> { "mcp_a_x" });

    auto const spec = registry.toolsSpec();
    REQUIRE(spec.size() == 2);
    CHECK(spec[0]["name"] == "fallback_a_x");
    CHECK(spec[0].contains("inputSchema"));
}
