// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolhost/App.hpp>
#include <toolhost/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolhost: manages MCP tool-provider processes with local fallbacks" };

    auto configPath = std::string {};
    auto workspace = std::string {};
    auto verbose = false;
    auto statusOnce = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-w,--workspace", workspace, "Workspace directory for the fallback tools");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--status-once", statusOnce, "Start the servers, print their status and exit");

    CLI11_PARSE(app, argc, argv);

    if (configPath.empty() && std::filesystem::exists(toolhost::defaultConfigPath()))
        configPath = toolhost::defaultConfigPath();

    auto configResult = configPath.empty() ? toolhost::loadConfig() : toolhost::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolhost::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!workspace.empty())
        config.workspace = workspace;
    if (verbose)
        config.logLevel = "debug";

    auto application = toolhost::App(std::move(config), configPath);
    auto initResult = application.initialize();
    if (!initResult)
    {
        toolhost::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    if (statusOnce)
    {
        application.printStatus(std::cout);
        return 0;
    }

    return application.run(std::cin, std::cout);
}
