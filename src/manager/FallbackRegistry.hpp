// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/InputShape.hpp>
#include <core/Types.hpp>
#include <manager/ManagerConfig.hpp>
#include <manager/ToolBridge.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolhost
{

/// @brief A local substitute producing text output, or an error.
using FallbackImplementation = std::function<Result<std::string>(const nlohmann::json& arguments)>;

/// @brief Binds a local substitute to one (server, tool) pair.
struct FallbackBinding
{
    std::string serverName;
    std::string toolName;
    std::string description;
    InputShape inputShape;
    FallbackImplementation implementation;
    std::vector<std::string> limitations; ///< Must not be empty.
};

/// @brief Fallback availability of one server.
struct FallbackStatus
{
    std::string serverName;
    bool hasFallback = false;
    std::size_t toolCount = 0;
    std::vector<std::string> limitations;
    bool active = false; ///< Substitutes are currently registered.
};

/// @brief Maps (server, tool) pairs to local substitutes and registers them per policy.
///
/// Substitutes are registered in the ToolBridge as "fallback_<server>_<tool>". Every
/// result they produce is marked degraded and carries the binding's limitations.
class FallbackRegistry
{
  public:
    explicit FallbackRegistry(ToolBridge& bridge, FallbackMode mode = FallbackMode::Graceful);

    FallbackRegistry(const FallbackRegistry&) = delete;
    FallbackRegistry& operator=(const FallbackRegistry&) = delete;

    void setMode(FallbackMode mode);
    [[nodiscard]] auto mode() const -> FallbackMode;

    /// @brief Decides whether @p server's tools should be substituted.
    /// @param server The server name.
    /// @param available Whether the server is currently running.
    [[nodiscard]] auto shouldUseFallback(std::string_view server, bool available) const -> bool;

    /// @brief Adds a binding.
    /// @return InvalidArgument for duplicates, empty names, missing implementations or empty limitations.
    [[nodiscard]] auto addBinding(FallbackBinding binding) -> VoidResult;

    [[nodiscard]] auto hasBinding(std::string_view server, std::string_view tool) const -> bool;
    [[nodiscard]] auto hasBindings(std::string_view server) const -> bool;

    /// @brief Registers every substitute for @p server. Idempotent.
    /// @return The number of substitutes newly registered.
    auto registerFallbackTools(std::string_view server) -> std::size_t;

    /// @brief Removes every substitute for @p server.
    /// @return The number of substitutes removed.
    auto unregisterFallbackTools(std::string_view server) -> std::size_t;

    [[nodiscard]] auto isActive(std::string_view server) const -> bool;

    /// @brief Runs the substitute for (@p server, @p tool) directly.
    [[nodiscard]] auto invoke(std::string_view server, std::string_view tool, const nlohmann::json& arguments) const
        -> ToolResult;

    [[nodiscard]] auto status(std::string_view server) const -> FallbackStatus;
    [[nodiscard]] auto allStatuses() const -> std::vector<FallbackStatus>;

    /// @brief Returns the number of substitutes currently registered.
    [[nodiscard]] auto activeToolCount() const -> std::size_t;

  private:
    using Key = std::pair<std::string, std::string>;

    ToolBridge& _bridge;
    mutable std::mutex _mutex;
    FallbackMode _mode;
    std::map<Key, FallbackBinding, std::less<>> _bindings;
    std::set<std::string, std::less<>> _activeServers;
};

} // namespace toolhost
