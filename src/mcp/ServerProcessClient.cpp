// SPDX-License-Identifier: Apache-2.0
#include "ServerProcessClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <algorithm>
#include <format>

namespace toolhost
{

namespace
{
    constexpr auto ProtocolVersion = std::string_view { "2024-11-05" };
    constexpr auto ClientName = std::string_view { "toolhost" };
    constexpr auto ClientVersion = std::string_view { "0.1.0" };

    auto joinTextContent(const nlohmann::json& content) -> std::string
    {
        auto text = std::string {};
        if (!content.is_array())
            return text;

        for (const auto& item: content)
        {
            if (json::getStringOr(item, "type", "") == "text")
            {
                if (!text.empty())
                    text += "\n";
                text += json::getStringOr(item, "text", "");
            }
        }
        return text;
    }

    auto describeExit(const ExitInfo& exit) -> std::string
    {
        if (exit.exitCode)
            return std::format("exit code {}", *exit.exitCode);
        if (exit.signal)
            return std::format("signal {}", *exit.signal);
        return exit.detail.empty() ? std::string("stream closed") : exit.detail;
    }
} // namespace

auto clientStateName(ClientState state) -> std::string_view
{
    switch (state)
    {
        case ClientState::Disconnected: return "disconnected";
        case ClientState::Connecting: return "connecting";
        case ClientState::Connected: return "connected";
        case ClientState::Error: return "error";
    }
    return "unknown";
}

auto disconnectReasonName(DisconnectReason reason) -> std::string_view
{
    switch (reason)
    {
        case DisconnectReason::ExplicitStop: return "explicit stop";
        case DisconnectReason::CleanExit: return "clean exit";
        case DisconnectReason::Crash: return "crash";
    }
    return "unknown";
}

ServerProcessClient::ServerProcessClient(std::string serverName,
                                         StdioTransportConfig processConfig,
                                         ClientOptions options,
                                         TransportFactory transportFactory):
    _name(std::move(serverName)),
    _processConfig(std::move(processConfig)),
    _options(options),
    _transportFactory(std::move(transportFactory))
{
    if (!_transportFactory)
    {
        _transportFactory = [config = _processConfig]() -> std::unique_ptr<Transport> {
            return std::make_unique<StdioTransport>(config);
        };
    }

    _reconnectThread = std::jthread([this](const std::stop_token& stopToken) { reconnectWorker(stopToken); });
}

ServerProcessClient::~ServerProcessClient()
{
    disconnect();
    _reconnectThread.request_stop();
    if (_reconnectThread.joinable())
        _reconnectThread.join();
    closeRetiredTransport();
}

auto ServerProcessClient::connect() -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_state == ClientState::Connected)
            return {};
        _explicitStop = false;
        _retryCount = 0;
    }
    return runConnectLoop(false);
}

auto ServerProcessClient::runConnectLoop(bool backoffFirst) -> VoidResult
{
    auto connectLock = std::lock_guard(_connectMutex);
    auto backoff = backoffFirst;
    auto lastError = std::string {};
    auto const cancelled = [this] {
        return makeError(ErrorCode::ConnectionClosed, std::format("Connection to '{}' was cancelled", _name));
    };

    while (true)
    {
        if (backoff)
        {
            auto lock = std::unique_lock(_mutex);
            if (_explicitStop)
                return cancelled();

            if (_retryCount >= _options.maxRetries)
            {
                _state = ClientState::Error;
                lock.unlock();

                auto message = std::format("Failed to connect to server '{}' after {} attempts: {}",
                                           _name,
                                           _options.maxRetries + 1,
                                           lastError);
                log::error("{}", message);
                emit(ClientConnectionFailed { .message = message });
                return makeError(ErrorCode::ConnectionError, std::move(message));
            }

            auto const delay = computeRetryDelay(_options, _retryCount, _rng);
            ++_retryCount;
            _state = ClientState::Connecting;
            log::info("Retrying connection to '{}' in {} ms (attempt {}/{})",
                      _name,
                      delay.count(),
                      _retryCount,
                      _options.maxRetries);

            if (_wakeup.wait_for(lock, delay, [this] { return _explicitStop; }))
                return cancelled();
        }
        backoff = true;

        {
            auto lock = std::lock_guard(_mutex);
            if (_explicitStop)
                return cancelled();
            if (_state == ClientState::Connected)
                return {};
            _state = ClientState::Connecting;
        }

        auto result = attemptConnection();
        if (result)
            return {};

        if (result.error().code == ErrorCode::ConnectionClosed)
        {
            auto lock = std::lock_guard(_mutex);
            if (_explicitStop)
                return cancelled();
        }

        lastError = result.error().message;
        log::warning("Connection attempt to '{}' failed: {}", _name, lastError);
        emit(ClientError { .message = lastError });
    }
}

auto ServerProcessClient::attemptConnection() -> VoidResult
{
    auto generation = uint64_t { 0 };
    {
        auto lock = std::lock_guard(_mutex);
        generation = ++_generation;
    }

    auto transport = std::shared_ptr<Transport>(_transportFactory());
    if (!transport)
        return makeError(ErrorCode::TransportError, "Transport factory returned no transport");

    auto const weakTransport = std::weak_ptr<Transport>(transport);
    auto handlers = TransportHandlers {
        .onLine = [this, generation, weakTransport](std::string_view line) { handleLine(generation, weakTransport, line); },
        .onStderr = [this](std::string_view line) { log::debug("[{}] {}", _name, line); },
        .onClosed = [this, generation](const ExitInfo& exit) { handleClosed(generation, exit); },
    };

    ++_spawnCount;
    if (auto opened = transport->open(std::move(handlers)); !opened)
        return std::unexpected(opened.error());

    auto superseded = false;
    {
        auto lock = std::lock_guard(_mutex);
        superseded = _explicitStop || generation != _generation;
        if (!superseded)
            _transport = transport;
    }
    if (superseded)
    {
        transport->close(_options.terminationGrace);
        return makeError(ErrorCode::ConnectionClosed, "Connection attempt superseded");
    }

    auto info = handshake(transport);
    if (!info)
    {
        {
            auto lock = std::lock_guard(_mutex);
            if (_transport == transport)
            {
                _transport.reset();
                ++_generation;
            }
        }
        transport->close(_options.terminationGrace);
        return makeError(info.error().code == ErrorCode::ConnectionClosed ? ErrorCode::ConnectionClosed
                                                                          : ErrorCode::ConnectionError,
                         std::format("Handshake with '{}' failed: {}", _name, info.error().message));
    }

    {
        auto lock = std::lock_guard(_mutex);
        superseded = _explicitStop || generation != _generation;
        if (!superseded)
        {
            _state = ClientState::Connected;
            _retryCount = 0;
            _serverInfo = std::move(*info);
        }
    }
    if (superseded)
    {
        transport->close(_options.terminationGrace);
        return makeError(ErrorCode::ConnectionClosed, "Connection attempt superseded");
    }

    log::info("Connected to MCP server '{}' ({} {})", _name, serverInfo().name, serverInfo().version);
    emit(ClientConnected {});
    return {};
}

auto ServerProcessClient::handshake(const std::shared_ptr<Transport>& transport) -> Result<ServerInfo>
{
    auto params = nlohmann::json {
        { "protocolVersion", ProtocolVersion },
        { "capabilities",
          nlohmann::json {
              { "roots", { { "listChanged", false } } },
              { "sampling", nlohmann::json::object() },
          } },
        { "clientInfo",
          nlohmann::json {
              { "name", ClientName },
              { "version", ClientVersion },
          } },
    };

    auto const timeout = std::min(_options.initializeTimeout, _options.connectionTimeout);

    return sendRequest(transport, "initialize", std::move(params), timeout)
        .and_then([this, &transport](const nlohmann::json& result) -> Result<ServerInfo> {
            if (!result.is_object())
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Server '{}' sent a malformed initialize result", _name));

            auto const serverInfo = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json::object();
            auto info = ServerInfo {
                .name = json::getStringOr(serverInfo, "name", _name),
                .version = json::getStringOr(serverInfo, "version", "unknown"),
                .protocolVersion = json::getStringOr(result, "protocolVersion", ""),
            };

            if (info.protocolVersion != ProtocolVersion)
                log::warning("Server '{}' speaks protocol version '{}', expected '{}'",
                             _name,
                             info.protocolVersion,
                             ProtocolVersion);

            if (auto sent = transport->send(jsonrpc::makeNotification("notifications/initialized")); !sent)
                return std::unexpected(sent.error());

            return info;
        });
}

void ServerProcessClient::disconnect()
{
    auto transport = std::shared_ptr<Transport> {};
    auto previousState = ClientState::Disconnected;
    {
        auto lock = std::lock_guard(_mutex);
        _explicitStop = true;
        _reconnectRequested = false;
        ++_generation;
        transport = std::move(_transport);
        previousState = _state;
        _state = ClientState::Disconnected;
    }
    _wakeup.notify_all();

    _pending.rejectAll(Error { ErrorCode::ConnectionClosed, std::format("Client '{}' disconnected", _name) });

    if (transport)
        transport->close(_options.terminationGrace);
    closeRetiredTransport();

    // Wait for an in-flight connection loop to observe the stop.
    {
        auto connectLock = std::lock_guard(_connectMutex);
        auto lock = std::lock_guard(_mutex);
        _state = ClientState::Disconnected;
    }

    if (previousState == ClientState::Connected || previousState == ClientState::Connecting)
    {
        log::info("Disconnected from MCP server '{}'", _name);
        emit(ClientDisconnected { .reason = DisconnectReason::ExplicitStop, .exit = ExitInfo {} });
    }
}

auto ServerProcessClient::connectedTransport() -> Result<std::shared_ptr<Transport>>
{
    auto lock = std::lock_guard(_mutex);
    if (_state != ClientState::Connected || !_transport)
        return makeError(ErrorCode::NotConnected, std::format("Server '{}' is not connected", _name));
    return _transport;
}

auto ServerProcessClient::sendRequest(const std::shared_ptr<Transport>& transport,
                                      std::string_view method,
                                      nlohmann::json params,
                                      std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto future = _pending.add(id);
    if (!future)
        return std::unexpected(future.error());

    if (auto sent = transport->send(jsonrpc::makeRequest(id, method, std::move(params))); !sent)
    {
        _pending.cancel(id, sent.error());
        return std::unexpected(sent.error());
    }

    if (future->wait_for(timeout) == std::future_status::timeout)
    {
        // Whoever removes the entry first completes it; the future holds that outcome.
        _pending.cancel(id,
                        Error { ErrorCode::RequestTimeout,
                                std::format("Request '{}' to '{}' timed out after {} ms",
                                            method,
                                            _name,
                                            timeout.count()) });
    }

    return future->get();
}

auto ServerProcessClient::listTools() -> Result<std::vector<ToolDefinition>>
{
    auto transport = connectedTransport();
    if (!transport)
        return std::unexpected(transport.error());

    return sendRequest(*transport, "tools/list", nlohmann::json::object(), _options.requestTimeout)
        .and_then([this](const nlohmann::json& result) -> Result<std::vector<ToolDefinition>> {
            auto tools = std::vector<ToolDefinition> {};

            if (!result.contains("tools") || !result["tools"].is_array())
                return tools;

            for (const auto& toolJson: result["tools"])
            {
                auto name = json::getString(toolJson, "name");
                if (!name || name->empty())
                {
                    log::warning("Server '{}' listed a tool without a name", _name);
                    continue;
                }

                tools.push_back(ToolDefinition {
                    .name = std::move(*name),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputShape = shapeFromJsonSchema(toolJson.contains("inputSchema") ? toolJson["inputSchema"]
                                                                                        : nlohmann::json {}),
                    .serverName = _name,
                });
            }

            return tools;
        });
}

auto ServerProcessClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolResult>
{
    auto transport = connectedTransport();
    if (!transport)
        return std::unexpected(transport.error());

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    auto response = sendRequest(*transport, "tools/call", std::move(params), _options.toolCallTimeout);
    if (!response)
    {
        if (response.error().code == ErrorCode::ProtocolError)
            return makeError(ErrorCode::ToolCallError, response.error().message);
        return std::unexpected(response.error());
    }

    if (!response->is_object() || (response->contains("isError") && !(*response)["isError"].is_boolean()))
        return makeError(ErrorCode::ToolCallError,
                         std::format("Server '{}' sent a malformed result for tool '{}'", _name, name));

    auto toolResult = ToolResult {};
    toolResult.toolName = std::string(name);
    toolResult.isError = json::getBoolOr(*response, "isError", false);
    if (response->contains("content") && (*response)["content"].is_array())
        toolResult.content = (*response)["content"];
    else
        toolResult.content = nlohmann::json::array();
    toolResult.text = joinTextContent(toolResult.content);

    if (toolResult.isError)
    {
        toolResult.errorCode = "TOOL_ERROR";
        toolResult.errorMessage = toolResult.text;
    }

    log::debug("Tool '{}' on '{}' returned: {} (isError: {})", name, _name, toolResult.text, toolResult.isError);
    return toolResult;
}

auto ServerProcessClient::listResources() -> Result<std::vector<ResourceDefinition>>
{
    auto transport = connectedTransport();
    if (!transport)
        return std::unexpected(transport.error());

    return sendRequest(*transport, "resources/list", nlohmann::json::object(), _options.requestTimeout)
        .and_then([this](const nlohmann::json& result) -> Result<std::vector<ResourceDefinition>> {
            auto resources = std::vector<ResourceDefinition> {};

            if (!result.contains("resources") || !result["resources"].is_array())
                return resources;

            for (const auto& resourceJson: result["resources"])
            {
                auto uri = json::getString(resourceJson, "uri");
                if (!uri)
                    continue;

                resources.push_back(ResourceDefinition {
                    .uri = std::move(*uri),
                    .name = json::getStringOr(resourceJson, "name", ""),
                    .description = json::getStringOr(resourceJson, "description", ""),
                    .mimeType = json::getStringOr(resourceJson, "mimeType", ""),
                    .serverName = _name,
                });
            }

            return resources;
        });
}

auto ServerProcessClient::getResource(std::string_view uri) -> Result<nlohmann::json>
{
    auto transport = connectedTransport();
    if (!transport)
        return std::unexpected(transport.error());

    return sendRequest(*transport, "resources/read", nlohmann::json { { "uri", uri } }, _options.requestTimeout)
        .and_then([this](const nlohmann::json& result) -> Result<nlohmann::json> {
            if (!result.is_object() || !result.contains("contents") || !result["contents"].is_array())
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Server '{}' sent a malformed resources/read result", _name));
            return result["contents"];
        });
}

auto ServerProcessClient::ping() -> bool
{
    auto transport = connectedTransport();
    if (!transport)
        return false;

    auto result = sendRequest(*transport, "ping", nlohmann::json::object(), _options.pingTimeout);
    if (!result)
    {
        log::debug("Ping to '{}' failed: {}", _name, result.error());
        return false;
    }
    return true;
}

void ServerProcessClient::handleLine(uint64_t generation,
                                     const std::weak_ptr<Transport>& transport,
                                     std::string_view line)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (generation != _generation)
            return;
    }

    auto message = json::parse(line);
    if (!message)
    {
        log::warning("Dropping malformed line from '{}': {}", _name, message.error().message);
        return;
    }

    auto kind = jsonrpc::classify(*message);
    if (!kind)
    {
        log::warning("Dropping invalid message from '{}': {}", _name, kind.error().message);
        return;
    }

    switch (*kind)
    {
        case jsonrpc::MessageKind::Response: {
            auto const id = jsonrpc::integerId((*message)["id"]);
            auto outcome = jsonrpc::parseResponse(*message).and_then(
                [](const jsonrpc::Response& response) -> Result<nlohmann::json> {
                    if (response.error)
                        return makeError(
                            ErrorCode::ProtocolError,
                            std::format("RPC error {}: {}", response.error->code, response.error->message));
                    return response.result.value_or(nlohmann::json::object());
                });

            if (!id || !_pending.resolve(*id, std::move(outcome)))
                log::debug("Ignoring response from '{}' for unknown id {}", _name, (*message)["id"].dump());
            break;
        }
        case jsonrpc::MessageKind::Notification:
            log::trace("Notification from '{}': {}", _name, json::getStringOr(*message, "method", ""));
            emit(ClientNotification { .message = std::move(*message) });
            break;
        case jsonrpc::MessageKind::Request: {
            auto const method = json::getStringOr(*message, "method", "");
            auto const& id = (*message)["id"];
            auto reply = method == "ping"
                             ? jsonrpc::makeResult(id, nlohmann::json::object())
                             : jsonrpc::makeErrorResponse(
                                   id, jsonrpc::MethodNotFound, std::format("Method not found: {}", method));

            if (auto peer = transport.lock())
            {
                if (auto sent = peer->send(reply); !sent)
                    log::warning("Failed to answer '{}' request from '{}': {}", method, _name, sent.error());
            }
            break;
        }
    }
}

void ServerProcessClient::handleClosed(uint64_t generation, const ExitInfo& exit)
{
    auto wasConnected = false;
    {
        auto lock = std::lock_guard(_mutex);
        if (generation != _generation)
            return;

        wasConnected = _state == ClientState::Connected;
        if (wasConnected)
        {
            _state = ClientState::Disconnected;
            _retiredTransport = std::move(_transport);
            ++_generation;
        }
    }

    _pending.rejectAll(Error { ErrorCode::ConnectionClosed,
                               std::format("Server '{}' closed the connection ({})", _name, describeExit(exit)) });

    // During a handshake the connection loop handles the failure.
    if (!wasConnected)
        return;

    auto const reason = exit.isCleanExit() ? DisconnectReason::CleanExit : DisconnectReason::Crash;
    log::warning("MCP server '{}' disconnected unexpectedly ({}, {})",
                 _name,
                 disconnectReasonName(reason),
                 describeExit(exit));

    emit(ClientDisconnected { .reason = reason, .exit = exit });
    scheduleReconnect();
}

void ServerProcessClient::scheduleReconnect()
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_explicitStop || _reconnectRequested)
            return;
        _reconnectRequested = true;
        ++_reconnectCount;
    }
    _wakeup.notify_all();
}

void ServerProcessClient::reconnectWorker(const std::stop_token& stopToken)
{
    while (true)
    {
        {
            auto lock = std::unique_lock(_mutex);
            if (!_wakeup.wait(lock, stopToken, [this] { return _reconnectRequested; }))
                return;
            _reconnectRequested = false;
        }

        closeRetiredTransport();

        if (auto result = runConnectLoop(true); !result)
            log::warning("Reconnect to '{}' ended: {}", _name, result.error());
    }
}

void ServerProcessClient::closeRetiredTransport()
{
    auto retired = std::shared_ptr<Transport> {};
    {
        auto lock = std::lock_guard(_mutex);
        retired = std::move(_retiredTransport);
    }
    if (retired)
        retired->close(_options.terminationGrace);
}

auto ServerProcessClient::subscribe(ClientEventCallback callback) -> int
{
    auto lock = std::lock_guard(_subscribersMutex);
    auto const id = _nextSubscription++;
    _subscribers.emplace(id, std::move(callback));
    return id;
}

void ServerProcessClient::unsubscribe(int subscription)
{
    auto lock = std::lock_guard(_subscribersMutex);
    _subscribers.erase(subscription);
}

void ServerProcessClient::emit(const ClientEvent& event)
{
    auto callbacks = std::vector<ClientEventCallback> {};
    {
        auto lock = std::lock_guard(_subscribersMutex);
        for (const auto& [id, callback]: _subscribers)
            callbacks.push_back(callback);
    }
    for (const auto& callback: callbacks)
        callback(event);
}

auto ServerProcessClient::state() const -> ClientState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto ServerProcessClient::retryCount() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _retryCount;
}

auto ServerProcessClient::reconnectCount() const -> int
{
    auto lock = std::lock_guard(_mutex);
    return _reconnectCount;
}

auto ServerProcessClient::processId() const -> std::optional<int>
{
    auto lock = std::lock_guard(_mutex);
    if (!_transport)
        return std::nullopt;
    return _transport->processId();
}

auto ServerProcessClient::serverInfo() const -> ServerInfo
{
    auto lock = std::lock_guard(_mutex);
    return _serverInfo;
}

} // namespace toolhost
