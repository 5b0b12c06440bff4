// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace toolhost
{

/// @brief How a provider process ended.
struct ExitInfo
{
    std::optional<int> exitCode; ///< Set if the process exited normally.
    std::optional<int> signal;   ///< Set if the process was killed by a signal.
    std::string detail;          ///< Stream error description, if the closure was not an exit.

    /// @brief Returns true for a normal exit with status 0.
    [[nodiscard]] auto isCleanExit() const -> bool { return exitCode == 0 && !signal.has_value(); }
};

/// @brief Callbacks through which a transport delivers inbound traffic.
///
/// Callbacks run on the transport's reader thread. onClosed is called exactly once,
/// after the last onLine, unless close() was requested first.
struct TransportHandlers
{
    std::function<void(std::string_view line)> onLine;
    std::function<void(std::string_view line)> onStderr;
    std::function<void(const ExitInfo& exit)> onClosed;
};

/// @brief Abstract interface for a message channel to one provider process.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Opens the channel (spawns the process) and starts delivering traffic.
    /// @param handlers Receivers for inbound lines and closure.
    /// @return Success or an error.
    [[nodiscard]] virtual auto open(TransportHandlers handlers) -> VoidResult = 0;

    /// @brief Sends a JSON message as one line.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Closes the channel, terminating the process.
    ///
    /// Requests cooperative termination first and forces it once @p grace has elapsed.
    /// No handler is invoked after close() returns.
    /// @param grace Time allowed for cooperative termination.
    virtual void close(std::chrono::milliseconds grace) = 0;

    /// @brief Returns true if the transport is open.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Returns the provider's process id, if there is one.
    [[nodiscard]] virtual auto processId() const -> std::optional<int> { return std::nullopt; }
};

} // namespace toolhost
