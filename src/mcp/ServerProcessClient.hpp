// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/PendingRequests.hpp>
#include <mcp/RetryPolicy.hpp>
#include <mcp/StdioTransport.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace toolhost
{

/// @brief Connection state of a ServerProcessClient.
enum class ClientState
{
    Disconnected,
    Connecting,
    Connected,
    Error,
};

[[nodiscard]] auto clientStateName(ClientState state) -> std::string_view;

/// @brief Why a connected client lost its provider.
enum class DisconnectReason
{
    ExplicitStop, ///< disconnect() was called.
    CleanExit,    ///< The provider exited with status 0 on its own.
    Crash,        ///< Non-zero exit, killed by a signal, or a stream error.
};

[[nodiscard]] auto disconnectReasonName(DisconnectReason reason) -> std::string_view;

/// @brief Identification reported by the provider during the handshake.
struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocolVersion;
};

struct ClientConnected
{
};

struct ClientDisconnected
{
    DisconnectReason reason = DisconnectReason::ExplicitStop;
    ExitInfo exit;
};

struct ClientError
{
    std::string message;
};

/// @brief Terminal failure: every connection attempt failed.
struct ClientConnectionFailed
{
    std::string message;
};

/// @brief A notification sent by the provider.
struct ClientNotification
{
    nlohmann::json message;
};

using ClientEvent =
    std::variant<ClientConnected, ClientDisconnected, ClientError, ClientConnectionFailed, ClientNotification>;

using ClientEventCallback = std::function<void(const ClientEvent& event)>;

/// @brief Creates the transport for one connection attempt.
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

/// @brief Owns one provider process and its protocol session.
///
/// Connection attempts are retried with exponential backoff. When a connected provider
/// goes away without disconnect() having been called, exactly one background reconnect
/// sequence is started. Requests fail fast with NotConnected unless the client is connected.
///
/// Event callbacks are invoked on internal threads and must not call connect() or
/// disconnect() on the same client, nor destroy it.
class ServerProcessClient
{
  public:
    /// @param serverName Name used in logs and tool definitions.
    /// @param processConfig How to spawn the provider.
    /// @param options Retry and timeout parameters.
    /// @param transportFactory Optional factory; defaults to a StdioTransport for @p processConfig.
    ServerProcessClient(std::string serverName,
                        StdioTransportConfig processConfig,
                        ClientOptions options,
                        TransportFactory transportFactory = {});
    ~ServerProcessClient();

    ServerProcessClient(const ServerProcessClient&) = delete;
    ServerProcessClient& operator=(const ServerProcessClient&) = delete;

    /// @brief Connects, retrying per ClientOptions. Returns immediately if already connected.
    /// @return Success, or ConnectionError once all retries are exhausted.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Cancels any reconnect, rejects pending requests and terminates the provider.
    void disconnect();

    [[nodiscard]] auto listTools() -> Result<std::vector<ToolDefinition>>;
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>;
    [[nodiscard]] auto listResources() -> Result<std::vector<ResourceDefinition>>;

    /// @brief Reads a resource.
    /// @return The "contents" array reported by the provider.
    [[nodiscard]] auto getResource(std::string_view uri) -> Result<nlohmann::json>;

    /// @brief Liveness probe bounded by ClientOptions::pingTimeout.
    /// @return false on any failure.
    [[nodiscard]] auto ping() -> bool;

    /// @brief Registers an event observer.
    /// @return A handle for unsubscribe().
    auto subscribe(ClientEventCallback callback) -> int;
    void unsubscribe(int subscription);

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto options() const -> const ClientOptions& { return _options; }
    [[nodiscard]] auto state() const -> ClientState;
    [[nodiscard]] auto isConnected() const -> bool { return state() == ClientState::Connected; }
    [[nodiscard]] auto retryCount() const -> int;
    [[nodiscard]] auto spawnCount() const -> int { return _spawnCount; }
    [[nodiscard]] auto reconnectCount() const -> int;
    [[nodiscard]] auto pendingRequestCount() const -> std::size_t { return _pending.size(); }
    [[nodiscard]] auto processId() const -> std::optional<int>;
    [[nodiscard]] auto serverInfo() const -> ServerInfo;

  private:
    [[nodiscard]] auto runConnectLoop(bool backoffFirst) -> VoidResult;
    [[nodiscard]] auto attemptConnection() -> VoidResult;
    [[nodiscard]] auto handshake(const std::shared_ptr<Transport>& transport) -> Result<ServerInfo>;
    [[nodiscard]] auto connectedTransport() -> Result<std::shared_ptr<Transport>>;
    [[nodiscard]] auto sendRequest(const std::shared_ptr<Transport>& transport,
                                   std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    void handleLine(uint64_t generation, const std::weak_ptr<Transport>& transport, std::string_view line);
    void handleClosed(uint64_t generation, const ExitInfo& exit);
    void scheduleReconnect();
    void reconnectWorker(const std::stop_token& stopToken);
    void closeRetiredTransport();
    void emit(const ClientEvent& event);

    std::string _name;
    StdioTransportConfig _processConfig;
    ClientOptions _options;
    TransportFactory _transportFactory;

    mutable std::mutex _mutex;
    std::condition_variable_any _wakeup;
    ClientState _state = ClientState::Disconnected;
    std::shared_ptr<Transport> _transport;
    std::shared_ptr<Transport> _retiredTransport;
    uint64_t _generation = 0;
    bool _explicitStop = false;
    bool _reconnectRequested = false;
    int _retryCount = 0;
    int _reconnectCount = 0;
    ServerInfo _serverInfo;
    std::mt19937 _rng { std::random_device {}() };

    std::mutex _connectMutex; ///< Serializes connection loops.

    std::atomic<int> _spawnCount = 0;
    std::atomic<int64_t> _nextId = 1;
    PendingRequests _pending;

    std::mutex _subscribersMutex;
    std::map<int, ClientEventCallback> _subscribers;
    int _nextSubscription = 1;

    std::jthread _reconnectThread; ///< Last member: joined before the state it uses is destroyed.
};

} // namespace toolhost
