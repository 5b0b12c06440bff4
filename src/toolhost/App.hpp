// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolhost/Config.hpp>

#include <iosfwd>
#include <memory>
#include <string>

namespace toolhost
{

/// @brief Wires the tool registry, the fallback registry and the connection manager together
/// and drives them from a line-oriented console.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param configPath File the configuration was loaded from; enables reload and watching. May be empty.
    App(AppConfig config, std::string configPath);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Registers the builtin fallbacks and starts the connection manager.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the console loop until "quit" or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input, std::ostream& output) -> int;

    /// @brief Executes one console command.
    /// @return false if the command asks to quit.
    auto execute(const std::string& line, std::ostream& output) -> bool;

    /// @brief Writes the server status table.
    void printStatus(std::ostream& output) const;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolhost
