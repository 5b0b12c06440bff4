// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <manager/ConfigValidator.hpp>
#include <manager/FallbackRegistry.hpp>
#include <manager/ManagerConfig.hpp>
#include <manager/ToolBridge.hpp>
#include <mcp/ServerProcessClient.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace toolhost
{

/// @brief Runtime status of a configured server.
enum class ServerStatus
{
    Stopped,
    Starting,
    Running,
    Error,
    Disconnected,
};

[[nodiscard]] auto serverStatusName(ServerStatus status) -> std::string_view;

/// @brief Snapshot of one server connection.
struct ConnectionInfo
{
    std::string name;
    ServerStatus status = ServerStatus::Stopped;
    std::optional<int> processId;
    std::string lastError;
    std::optional<std::chrono::system_clock::time_point> startTime;
    std::optional<std::chrono::system_clock::time_point> lastHeartbeat;
    std::size_t toolCount = 0;
    ServerInfo serverInfo;
    bool fallbackActive = false;
};

/// @brief Aggregate counters for status displays.
struct ManagerStatistics
{
    std::size_t totalServers = 0;
    std::size_t runningServers = 0;
    std::size_t realTools = 0;
    std::size_t fallbackTools = 0;
    int restarts = 0;
    std::map<std::string, FallbackStatus> fallbackStatus;
};

struct ServerStarted
{
    std::string server;
};

struct ServerStopped
{
    std::string server;
};

struct ServerError
{
    std::string server;
    std::string message;
};

struct ToolRegistered
{
    std::string server;
    std::string tool; ///< Namespaced name.
};

struct ToolUnregistered
{
    std::string server;
    std::string tool;
};

struct FallbackActivated
{
    std::string server;
    std::size_t toolCount = 0;
};

struct FallbackDeactivated
{
    std::string server;
};

/// @brief Issued once when no server could be started.
struct SetupAdvisory
{
    std::string message;
};

using ManagerEvent = std::variant<ServerStarted,
                                  ServerStopped,
                                  ServerError,
                                  ToolRegistered,
                                  ToolUnregistered,
                                  FallbackActivated,
                                  FallbackDeactivated,
                                  SetupAdvisory>;

using ManagerEventCallback = std::function<void(const ManagerEvent& event)>;

/// @brief Creates the client for a server.
using ClientFactory =
    std::function<std::unique_ptr<ServerProcessClient>(const ServerDescriptor& server, const ClientOptions& options)>;

/// @brief Orchestrates the configured provider processes.
///
/// Tools of a running server are registered in the ToolBridge as "mcp_<server>_<tool>"
/// and forwarded to its client. When a server is not running, its substitutes from the
/// FallbackRegistry are registered instead, as the fallback mode dictates.
class ConnectionManager
{
  public:
    /// @param config Initial configuration. If it fails validation the manager uses an
    ///               empty, disabled configuration and start() reports ConfigError.
    /// @param bridge The dispatcher proxies are registered in.
    /// @param fallbacks Substitutes for unavailable servers.
    /// @param clientFactory Optional; defaults to a stdio ServerProcessClient.
    ConnectionManager(ManagerConfig config,
                      ToolBridge& bridge,
                      FallbackRegistry& fallbacks,
                      ClientFactory clientFactory = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// @brief Starts every enabled auto-start server and the health-check loop.
    ///
    /// Individual server failures do not fail start().
    /// @return ConfigError if the initial configuration was invalid.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops health checks, waits for background tasks and stops every server.
    void stop();

    /// @brief Starts one server. No-op if it is already running or starting.
    /// @return InvalidArgument for unknown or disabled servers, or the connection error.
    [[nodiscard]] auto startServer(std::string_view name) -> VoidResult;

    /// @brief Stops one server and activates its substitutes per policy.
    [[nodiscard]] auto stopServer(std::string_view name) -> VoidResult;

    /// @brief Stops and starts a server after the restart delay.
    ///
    /// A restart requested while another restart of the same server is in flight is a no-op.
    [[nodiscard]] auto restartServer(std::string_view name) -> VoidResult;

    /// @brief Restarts a server on a background task.
    /// @return false if a restart of that server is already in flight.
    auto requestRestart(std::string_view name) -> bool;

    /// @brief Applies a changed configuration.
    ///
    /// Structural changes cause a full stop/start cycle; other changes are applied per server.
    /// @return ConfigError if @p config is invalid; the current configuration is kept.
    [[nodiscard]] auto applyConfiguration(ManagerConfig config) -> VoidResult;

    /// @brief Pings every running server once, restarting unresponsive ones if autoRestart is set.
    void runHealthCheck();

    [[nodiscard]] auto config() const -> ManagerConfig;
    [[nodiscard]] auto isStarted() const -> bool;

    /// @return std::nullopt for servers that are not configured.
    [[nodiscard]] auto serverStatus(std::string_view name) const -> std::optional<ServerStatus>;
    [[nodiscard]] auto allServerStatuses() const -> std::map<std::string, ServerStatus>;
    [[nodiscard]] auto connectionInfo(std::string_view name) const -> std::optional<ConnectionInfo>;
    [[nodiscard]] auto statistics() const -> ManagerStatistics;

    /// @brief Invokes @p tool of @p server through its real proxy or its substitute.
    [[nodiscard]] auto invokeTool(std::string_view server, std::string_view tool, const nlohmann::json& arguments)
        -> ToolResult;

    /// @brief Returns the tools of every running server.
    [[nodiscard]] auto listAllTools() const -> std::vector<ToolDefinition>;

    /// @brief Queries the resources of every running server.
    [[nodiscard]] auto listAllResources() -> std::vector<ResourceDefinition>;

    [[nodiscard]] auto setupAdvisoryIssued() const -> bool;

    auto subscribe(ManagerEventCallback callback) -> int;
    void unsubscribe(int subscription);

  private:
    struct Connection
    {
        ServerDescriptor descriptor;
        ServerStatus status = ServerStatus::Starting;
        std::shared_ptr<ServerProcessClient> client;
        int subscription = 0;
        std::string lastError;
        std::optional<std::chrono::system_clock::time_point> startTime;
        std::optional<std::chrono::system_clock::time_point> lastHeartbeat;
        std::vector<ToolDefinition> tools;
    };

    [[nodiscard]] auto startLocked() -> VoidResult;
    void stopLocked();
    [[nodiscard]] auto performRestart(const std::string& name) -> VoidResult;

    void handleClientEvent(const std::string& name, const ServerProcessClient* client, const ClientEvent& event);
    void activateServer(const std::string& name, const ServerProcessClient* client);
    void deactivateServer(const std::string& name,
                          const ServerProcessClient* client,
                          ServerStatus status,
                          const std::string& message);
    void refreshTools(const std::string& name);

    auto unregisterRealTools(std::string_view name) -> std::size_t;
    void activateFallback(const std::string& name, bool available);
    void deactivateFallback(const std::string& name);
    void maybeIssueAdvisory();

    [[nodiscard]] auto makeProxy(const std::string& server,
                                 const ToolDefinition& tool,
                                 const std::shared_ptr<ServerProcessClient>& client) const -> RegisteredTool;
    [[nodiscard]] auto isCurrentClient(const std::string& name, const ServerProcessClient* client) const -> bool;

    void startHealthLoop();
    void stopHealthLoop();
    void runBackground(std::function<void()> task);
    void waitForBackgroundTasks();
    void emit(const ManagerEvent& event);

    ToolBridge& _bridge;
    FallbackRegistry& _fallbacks;
    ClientFactory _clientFactory;
    ConfigValidator _validator;

    std::mutex _lifecycleMutex; ///< Serializes start, stop and applyConfiguration.

    mutable std::mutex _mutex;
    std::condition_variable_any _wakeup;
    ManagerConfig _config;
    std::optional<std::string> _configError;
    std::map<std::string, Connection, std::less<>> _connections;
    std::set<std::string, std::less<>> _restarting;
    bool _started = false;
    bool _advisoryIssued = false;
    int _restartCount = 0;

    std::mutex _tasksMutex;
    std::vector<std::future<void>> _tasks;

    std::mutex _subscribersMutex;
    std::map<int, ManagerEventCallback> _subscribers;
    int _nextSubscription = 1;

    std::jthread _healthThread;
};

} // namespace toolhost
