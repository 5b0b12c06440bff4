// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolhost
{

/// @brief Configuration for spawning a provider process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overrides on top of the inherited environment.
    std::string workingDirectory;           ///< Empty to inherit the host's.
};

/// @brief Transport that talks newline-delimited JSON to a child process over stdio pipes.
///
/// The child's stdout and stderr are consumed by two reader threads. When stdout reaches
/// end-of-file the child is reaped and TransportHandlers::onClosed reports its exit status.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] auto open(TransportHandlers handlers) -> VoidResult override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;

    /// @brief Sends SIGTERM, then SIGKILL after @p grace, and joins the reader threads.
    ///
    /// Must not be called from within a handler.
    void close(std::chrono::milliseconds grace) override;

    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto processId() const -> std::optional<int> override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolhost
