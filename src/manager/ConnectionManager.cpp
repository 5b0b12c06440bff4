// SPDX-License-Identifier: Apache-2.0
#include "ConnectionManager.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace toolhost
{

namespace
{
    auto toolErrorCode(ErrorCode code) -> std::string
    {
        switch (code)
        {
            case ErrorCode::NotConnected: return "NOT_CONNECTED";
            case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
            case ErrorCode::RequestTimeout: return "REQUEST_TIMEOUT";
            case ErrorCode::ToolCallError: return "TOOL_CALL_ERROR";
            case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
            default: return "MCP_ERROR";
        }
    }

    auto isActive(ServerStatus status) -> bool
    {
        return status == ServerStatus::Running || status == ServerStatus::Starting
               || status == ServerStatus::Disconnected;
    }
} // namespace

auto serverStatusName(ServerStatus status) -> std::string_view
{
    switch (status)
    {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Error: return "error";
        case ServerStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(ManagerConfig config,
                                     ToolBridge& bridge,
                                     FallbackRegistry& fallbacks,
                                     ClientFactory clientFactory):
    _bridge(bridge), _fallbacks(fallbacks), _clientFactory(std::move(clientFactory))
{
    if (!_clientFactory)
    {
        _clientFactory = [](const ServerDescriptor& server,
                            const ClientOptions& options) -> std::unique_ptr<ServerProcessClient> {
            return std::make_unique<ServerProcessClient>(server.name, processConfigFor(server), options);
        };
    }

    auto const validation = _validator.validate(config);
    for (const auto& issue: validation.issues)
    {
        if (issue.severity == ValidationIssue::Severity::Warning)
            log::warning("MCP configuration: {}: {}", issue.path, issue.message);
    }

    if (validation.isValid())
    {
        _config = std::move(config);
    }
    else
    {
        _configError = validation.errorSummary();
        log::error("Invalid MCP configuration, MCP integration disabled: {}", *_configError);
        _config = ManagerConfig {};
        _config.enabled = false;
    }

    _fallbacks.setMode(_config.fallbackMode);
}

ConnectionManager::~ConnectionManager()
{
    stop();
}

auto ConnectionManager::start() -> VoidResult
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);
    return startLocked();
}

auto ConnectionManager::startLocked() -> VoidResult
{
    auto config = ManagerConfig {};
    {
        auto lock = std::lock_guard(_mutex);
        if (_started)
            return {};
        if (_configError)
            return makeError(ErrorCode::ConfigError, std::format("Invalid MCP configuration: {}", *_configError));
        _started = true;
        _advisoryIssued = false;
        config = _config;
    }

    _fallbacks.setMode(config.fallbackMode);

    if (!config.enabled)
    {
        log::info("MCP integration is disabled");
        return {};
    }

    // Substitutes stand in until their server is up.
    for (const auto& server: config.servers)
        activateFallback(server.name, false);

    auto pending = std::vector<std::pair<std::string, std::future<VoidResult>>> {};
    for (const auto& server: config.servers)
    {
        if (!server.enabled || !server.autoStart)
            continue;
        pending.emplace_back(server.name,
                             std::async(std::launch::async, [this, name = server.name] { return startServer(name); }));
    }

    for (auto& [name, future]: pending)
    {
        if (auto result = future.get(); !result)
            log::warning("MCP server '{}' failed to start: {}", name, result.error());
    }

    startHealthLoop();
    maybeIssueAdvisory();

    log::info("MCP manager started ({} of {} servers running)", statistics().runningServers, config.servers.size());
    return {};
}

void ConnectionManager::stop()
{
    auto lifecycle = std::lock_guard(_lifecycleMutex);
    stopLocked();
}

void ConnectionManager::stopLocked()
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_started)
            return;
        _started = false;
    }
    _wakeup.notify_all();

    stopHealthLoop();

    auto const drain = [this] {
        auto connections = std::map<std::string, Connection, std::less<>> {};
        {
            auto lock = std::lock_guard(_mutex);
            connections.swap(_connections);
        }

        for (auto& [name, connection]: connections)
        {
            if (connection.client)
            {
                connection.client->unsubscribe(connection.subscription);
                connection.client->disconnect();
            }
            unregisterRealTools(name);
            emit(ServerStopped { .server = name });
        }
    };

    drain();
    waitForBackgroundTasks();
    drain();

    for (const auto& status: _fallbacks.allStatuses())
        deactivateFallback(status.serverName);

    {
        auto lock = std::lock_guard(_mutex);
        _restarting.clear();
    }

    log::info("MCP manager stopped");
}

auto ConnectionManager::startServer(std::string_view name) -> VoidResult
{
    auto descriptor = ServerDescriptor {};
    auto options = ClientOptions {};
    auto previous = std::optional<Connection> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (!_started)
            return makeError(ErrorCode::ConnectionError, "MCP manager is not started");
        if (!_config.enabled)
            return makeError(ErrorCode::ConfigError, "MCP integration is disabled");

        auto const* server = _config.findServer(name);
        if (!server)
            return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", name));
        if (!server->enabled)
            return makeError(ErrorCode::InvalidArgument, std::format("Server '{}' is disabled", name));

        if (auto it = _connections.find(name); it != _connections.end())
        {
            if (it->second.status == ServerStatus::Running || it->second.status == ServerStatus::Starting)
                return {};
            previous = std::move(it->second);
            _connections.erase(it);
        }

        descriptor = *server;
        options = clientOptionsFor(_config);
        _connections.emplace(descriptor.name, Connection { .descriptor = descriptor });
    }

    if (previous && previous->client)
    {
        previous->client->unsubscribe(previous->subscription);
        previous->client->disconnect();
        previous.reset();
    }

    auto client = std::shared_ptr<ServerProcessClient>(_clientFactory(descriptor, options));
    auto const subscription =
        client->subscribe([this, serverName = descriptor.name, raw = client.get()](const ClientEvent& event) {
            handleClientEvent(serverName, raw, event);
        });

    auto attached = false;
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (_started && it != _connections.end() && !it->second.client)
        {
            it->second.client = client;
            it->second.subscription = subscription;
            attached = true;
        }
    }

    if (!attached)
    {
        client->unsubscribe(subscription);
        return makeError(ErrorCode::ConnectionClosed, std::format("Start of server '{}' was cancelled", name));
    }

    log::info("Starting MCP server '{}': {}", descriptor.name, descriptor.command);

    auto result = client->connect();
    if (!result)
    {
        auto stillStarting = false;
        {
            auto lock = std::lock_guard(_mutex);
            auto const it = _connections.find(name);
            if (it != _connections.end() && it->second.client == client
                && it->second.status == ServerStatus::Starting)
            {
                it->second.status = ServerStatus::Error;
                it->second.lastError = result.error().message;
                stillStarting = true;
            }
        }
        if (stillStarting)
            activateFallback(descriptor.name, false);
        return result;
    }

    return {};
}

auto ConnectionManager::stopServer(std::string_view name) -> VoidResult
{
    auto connection = std::optional<Connection> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end())
        {
            if (!_config.findServer(name))
                return makeError(ErrorCode::InvalidArgument, std::format("Unknown server: {}", name));
            return {};
        }
        connection = std::move(it->second);
        _connections.erase(it);
    }

    if (connection->client)
    {
        connection->client->unsubscribe(connection->subscription);
        connection->client->disconnect();
    }

    auto const serverName = std::string(name);
    unregisterRealTools(serverName);
    activateFallback(serverName, false);

    log::info("Stopped MCP server '{}'", serverName);
    emit(ServerStopped { .server = serverName });
    return {};
}

auto ConnectionManager::restartServer(std::string_view name) -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_restarting.contains(name))
        {
            log::debug("Restart of '{}' already in progress", name);
            return {};
        }
        _restarting.emplace(name);
    }
    return performRestart(std::string(name));
}

auto ConnectionManager::requestRestart(std::string_view name) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_started || _restarting.contains(name))
            return false;
        _restarting.emplace(name);
    }

    runBackground([this, serverName = std::string(name)] {
        if (auto result = performRestart(serverName); !result)
            log::warning("Restart of MCP server '{}' failed: {}", serverName, result.error());
    });
    return true;
}

auto ConnectionManager::performRestart(const std::string& name) -> VoidResult
{
    log::info("Restarting MCP server '{}'", name);

    auto result = stopServer(name);
    if (result)
    {
        {
            auto lock = std::unique_lock(_mutex);
            ++_restartCount;
            _wakeup.wait_for(lock, _config.restartDelay, [this] { return !_started; });
        }
        result = startServer(name);
    }

    auto lock = std::lock_guard(_mutex);
    _restarting.erase(name);
    return result;
}

auto ConnectionManager::applyConfiguration(ManagerConfig config) -> VoidResult
{
    auto const validation = _validator.validate(config);
    for (const auto& issue: validation.issues)
    {
        if (issue.severity == ValidationIssue::Severity::Warning)
            log::warning("MCP configuration: {}: {}", issue.path, issue.message);
    }
    if (!validation.isValid())
    {
        log::error("Rejected MCP configuration change: {}", validation.errorSummary());
        return makeError(ErrorCode::ConfigError, validation.errorSummary());
    }

    auto lifecycle = std::lock_guard(_lifecycleMutex);

    auto current = ManagerConfig {};
    auto started = false;
    {
        auto lock = std::lock_guard(_mutex);
        if (_config == config && !_configError)
            return {};
        current = _config;
        started = _started;
    }

    if (needsFullRestart(current, config))
    {
        log::info("MCP configuration changed, restarting the manager");
        if (started)
            stopLocked();
        {
            auto lock = std::lock_guard(_mutex);
            _config = std::move(config);
            _configError.reset();
        }
        if (started)
            return startLocked();
        return {};
    }

    {
        auto lock = std::lock_guard(_mutex);
        _config = config;
        _configError.reset();
    }

    if (!started)
        return {};

    for (const auto& server: config.servers)
    {
        auto const* previous = current.findServer(server.name);
        if (previous && *previous == server)
            continue;

        auto const status = serverStatus(server.name);
        auto const active = status && isActive(*status);
        auto result = VoidResult {};

        if (!server.enabled)
        {
            if (active)
                result = stopServer(server.name);
        }
        else if (active)
        {
            result = restartServer(server.name);
        }
        else if (server.autoStart)
        {
            result = startServer(server.name);
        }

        if (!result)
            log::warning("Applying configuration to '{}' failed: {}", server.name, result.error());
    }

    if (current.healthCheckInterval != config.healthCheckInterval)
    {
        stopHealthLoop();
        startHealthLoop();
    }

    return {};
}

void ConnectionManager::runHealthCheck()
{
    auto targets = std::vector<std::pair<std::string, std::shared_ptr<ServerProcessClient>>> {};
    auto autoRestart = false;
    {
        auto lock = std::lock_guard(_mutex);
        autoRestart = _config.autoRestart;
        for (const auto& [name, connection]: _connections)
        {
            if (connection.status == ServerStatus::Running && connection.client && !_restarting.contains(name))
                targets.emplace_back(name, connection.client);
        }
    }

    for (const auto& [name, client]: targets)
    {
        if (client->ping())
        {
            auto lock = std::lock_guard(_mutex);
            if (auto const it = _connections.find(name); it != _connections.end() && it->second.client == client)
                it->second.lastHeartbeat = std::chrono::system_clock::now();
            continue;
        }

        log::warning("Health check failed for MCP server '{}'", name);
        emit(ServerError { .server = name, .message = "Health check failed" });

        if (autoRestart)
            requestRestart(name);
    }
}

void ConnectionManager::handleClientEvent(const std::string& name,
                                          const ServerProcessClient* client,
                                          const ClientEvent& event)
{
    if (std::holds_alternative<ClientConnected>(event))
    {
        activateServer(name, client);
    }
    else if (auto const* disconnected = std::get_if<ClientDisconnected>(&event))
    {
        if (disconnected->reason != DisconnectReason::ExplicitStop)
            deactivateServer(name,
                             client,
                             ServerStatus::Disconnected,
                             std::format("Server disconnected ({})", disconnectReasonName(disconnected->reason)));
    }
    else if (auto const* failed = std::get_if<ClientConnectionFailed>(&event))
    {
        deactivateServer(name, client, ServerStatus::Error, failed->message);
    }
    else if (auto const* error = std::get_if<ClientError>(&event))
    {
        auto lock = std::lock_guard(_mutex);
        if (auto const it = _connections.find(name); it != _connections.end() && it->second.client.get() == client)
            it->second.lastError = error->message;
    }
    else if (auto const* notification = std::get_if<ClientNotification>(&event))
    {
        auto const method = json::getStringOr(notification->message, "method", "");
        log::debug("Notification from MCP server '{}': {}", name, method);

        // Reader-thread callback: the refresh needs a request round trip, so run it elsewhere.
        if (method == "notifications/tools/list_changed" && isCurrentClient(name, client))
            runBackground([this, name] { refreshTools(name); });
    }
}

void ConnectionManager::activateServer(const std::string& name, const ServerProcessClient* client)
{
    auto shared = std::shared_ptr<ServerProcessClient> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end() || it->second.client.get() != client)
            return;
        shared = it->second.client;
    }

    auto tools = shared->listTools();
    if (!tools)
        log::warning("Failed to list tools of MCP server '{}': {}", name, tools.error());
    auto definitions = tools.value_or(std::vector<ToolDefinition> {});

    if (_fallbacks.shouldUseFallback(name, true))
        activateFallback(name, true);
    else
        deactivateFallback(name);

    unregisterRealTools(name);

    auto const alwaysFallback = _fallbacks.mode() == FallbackMode::Always;
    auto registered = std::vector<std::string> {};
    for (const auto& tool: definitions)
    {
        if (alwaysFallback && _fallbacks.hasBinding(name, tool.name))
        {
            log::debug("Tool '{}' of '{}' is served by its fallback", tool.name, name);
            continue;
        }

        auto proxy = makeProxy(name, tool, shared);
        auto const proxyName = proxy.name;
        if (auto result = _bridge.registerTool(std::move(proxy)); !result)
        {
            log::warning("Failed to register tool '{}': {}", proxyName, result.error());
            continue;
        }
        registered.push_back(proxyName);
        emit(ToolRegistered { .server = name, .tool = proxyName });
    }

    auto current = false;
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it != _connections.end() && it->second.client.get() == client)
        {
            auto const now = std::chrono::system_clock::now();
            it->second.status = ServerStatus::Running;
            it->second.startTime = now;
            it->second.lastHeartbeat = now;
            it->second.lastError.clear();
            it->second.tools = std::move(definitions);
            current = true;
        }
    }

    if (!current)
    {
        for (const auto& proxyName: registered)
        {
            if (_bridge.unregisterTool(proxyName))
                emit(ToolUnregistered { .server = name, .tool = proxyName });
        }
        return;
    }

    log::info("MCP server '{}' running with {} tools", name, registered.size());
    emit(ServerStarted { .server = name });
}

void ConnectionManager::deactivateServer(const std::string& name,
                                         const ServerProcessClient* client,
                                         ServerStatus status,
                                         const std::string& message)
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end() || it->second.client.get() != client)
            return;
        it->second.status = status;
        it->second.lastError = message;
        it->second.tools.clear();
    }

    unregisterRealTools(name);
    activateFallback(name, false);

    log::warning("MCP server '{}' is {}: {}", name, serverStatusName(status), message);
    emit(ServerError { .server = name, .message = message });
}

void ConnectionManager::refreshTools(const std::string& name)
{
    auto client = std::shared_ptr<ServerProcessClient> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end() || it->second.status != ServerStatus::Running)
            return;
        client = it->second.client;
    }
    if (client)
        activateServer(name, client.get());
}

auto ConnectionManager::unregisterRealTools(std::string_view name) -> std::size_t
{
    auto removed = std::size_t { 0 };
    for (const auto& toolName: _bridge.toolNames())
    {
        auto const info = _bridge.toolInfo(toolName);
        if (!info || info->origin != ToolOrigin::Real || info->serverName != name)
            continue;
        if (_bridge.unregisterTool(toolName))
        {
            ++removed;
            emit(ToolUnregistered { .server = std::string(name), .tool = toolName });
        }
    }
    return removed;
}

void ConnectionManager::activateFallback(const std::string& name, bool available)
{
    if (!_fallbacks.shouldUseFallback(name, available) || !_fallbacks.hasBindings(name))
        return;

    if (auto const count = _fallbacks.registerFallbackTools(name); count > 0)
        emit(FallbackActivated { .server = name, .toolCount = count });
}

void ConnectionManager::deactivateFallback(const std::string& name)
{
    if (_fallbacks.unregisterFallbackTools(name) > 0)
        emit(FallbackDeactivated { .server = name });
}

void ConnectionManager::maybeIssueAdvisory()
{
    auto message = std::string {};
    {
        auto lock = std::lock_guard(_mutex);
        if (!_config.enabled || !_config.showSetupGuide || _advisoryIssued)
            return;
        auto const running = std::ranges::any_of(
            _connections, [](const auto& entry) { return entry.second.status == ServerStatus::Running; });
        if (running)
            return;
        _advisoryIssued = true;
        message = _config.servers.empty()
                      ? std::string("No MCP servers are configured. Add servers to the \"mcp\" section of the "
                                    "configuration to enable external tools.")
                      : std::string("No MCP servers are running. Check that their commands are installed; "
                                    "fallback tools are used where available.");
    }

    log::warning("{}", message);
    emit(SetupAdvisory { .message = message });
}

auto ConnectionManager::makeProxy(const std::string& server,
                                  const ToolDefinition& tool,
                                  const std::shared_ptr<ServerProcessClient>& client) const -> RegisteredTool
{
    auto const proxyName = realToolName(server, tool.name);
    return RegisteredTool {
        .name = proxyName,
        .description = tool.description,
        .inputShape = tool.inputShape,
        .handler = [weak = std::weak_ptr<ServerProcessClient>(client), proxyName, server, toolName = tool.name](
                       const nlohmann::json& arguments) -> ToolResult {
            auto target = weak.lock();
            if (!target)
                return makeToolError(
                    proxyName, "SERVER_UNAVAILABLE", std::format("MCP server '{}' is not running", server));

            auto result = target->callTool(toolName, arguments);
            if (!result)
                return makeToolError(proxyName, toolErrorCode(result.error().code), result.error().message);

            result->toolName = proxyName;
            return std::move(*result);
        },
        .origin = ToolOrigin::Real,
        .serverName = server,
        .toolName = tool.name,
    };
}

auto ConnectionManager::isCurrentClient(const std::string& name, const ServerProcessClient* client) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _connections.find(name);
    return it != _connections.end() && it->second.client.get() == client;
}

void ConnectionManager::startHealthLoop()
{
    auto const interval = config().healthCheckInterval;
    _healthThread = std::jthread([this, interval](const std::stop_token& stopToken) {
        while (true)
        {
            {
                auto lock = std::unique_lock(_mutex);
                _wakeup.wait_for(lock, stopToken, interval, [] { return false; });
            }
            if (stopToken.stop_requested())
                return;
            runHealthCheck();
        }
    });
}

void ConnectionManager::stopHealthLoop()
{
    _healthThread.request_stop();
    if (_healthThread.joinable())
        _healthThread.join();
}

void ConnectionManager::runBackground(std::function<void()> task)
{
    auto lock = std::lock_guard(_tasksMutex);
    std::erase_if(_tasks, [](const std::future<void>& future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
    _tasks.push_back(std::async(std::launch::async, std::move(task)));
}

void ConnectionManager::waitForBackgroundTasks()
{
    while (true)
    {
        auto tasks = std::vector<std::future<void>> {};
        {
            auto lock = std::lock_guard(_tasksMutex);
            tasks.swap(_tasks);
        }
        if (tasks.empty())
            return;
        for (auto& task: tasks)
            task.wait();
    }
}

auto ConnectionManager::config() const -> ManagerConfig
{
    auto lock = std::lock_guard(_mutex);
    return _config;
}

auto ConnectionManager::isStarted() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _started;
}

auto ConnectionManager::serverStatus(std::string_view name) const -> std::optional<ServerStatus>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _connections.find(name); it != _connections.end())
        return it->second.status;
    if (_config.findServer(name))
        return ServerStatus::Stopped;
    return std::nullopt;
}

auto ConnectionManager::allServerStatuses() const -> std::map<std::string, ServerStatus>
{
    auto lock = std::lock_guard(_mutex);
    auto statuses = std::map<std::string, ServerStatus> {};
    for (const auto& server: _config.servers)
    {
        auto const it = _connections.find(server.name);
        statuses[server.name] = it != _connections.end() ? it->second.status : ServerStatus::Stopped;
    }
    return statuses;
}

auto ConnectionManager::connectionInfo(std::string_view name) const -> std::optional<ConnectionInfo>
{
    auto info = ConnectionInfo { .name = std::string(name) };
    auto client = std::shared_ptr<ServerProcessClient> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _connections.find(name);
        if (it == _connections.end())
        {
            if (!_config.findServer(name))
                return std::nullopt;
        }
        else
        {
            auto const& connection = it->second;
            info.status = connection.status;
            info.lastError = connection.lastError;
            info.startTime = connection.startTime;
            info.lastHeartbeat = connection.lastHeartbeat;
            info.toolCount = connection.tools.size();
            client = connection.client;
        }
    }

    if (client)
    {
        info.processId = client->processId();
        info.serverInfo = client->serverInfo();
    }
    info.fallbackActive = _fallbacks.isActive(name);
    return info;
}

auto ConnectionManager::statistics() const -> ManagerStatistics
{
    auto stats = ManagerStatistics {};
    auto names = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_mutex);
        stats.totalServers = _config.servers.size();
        stats.runningServers = static_cast<std::size_t>(std::ranges::count_if(
            _connections, [](const auto& entry) { return entry.second.status == ServerStatus::Running; }));
        stats.restarts = _restartCount;
        for (const auto& server: _config.servers)
            names.push_back(server.name);
    }

    for (const auto& toolName: _bridge.toolNames())
    {
        auto const info = _bridge.toolInfo(toolName);
        if (!info || info->serverName.empty())
            continue;
        if (info->origin == ToolOrigin::Real)
            ++stats.realTools;
        else
            ++stats.fallbackTools;
    }

    for (const auto& name: names)
        stats.fallbackStatus[name] = _fallbacks.status(name);
    return stats;
}

auto ConnectionManager::invokeTool(std::string_view server, std::string_view tool, const nlohmann::json& arguments)
    -> ToolResult
{
    auto const ownedBy = [&](const std::string& name) {
        auto const info = _bridge.toolInfo(name);
        return info && info->serverName == server && info->toolName == tool;
    };

    if (auto const real = realToolName(server, tool); ownedBy(real))
        return _bridge.invoke(real, arguments);

    if (auto const substitute = fallbackToolName(server, tool); ownedBy(substitute))
        return _bridge.invoke(substitute, arguments);

    auto const status = serverStatus(server);
    if (!status)
        return makeToolError(std::string(tool), "SERVER_NOT_FOUND", std::format("Unknown MCP server: {}", server));

    return makeToolError(std::string(tool),
                         "TOOL_UNAVAILABLE",
                         std::format("Tool '{}' of MCP server '{}' is not available (server {})",
                                     tool,
                                     server,
                                     serverStatusName(*status)));
}

auto ConnectionManager::listAllTools() const -> std::vector<ToolDefinition>
{
    auto lock = std::lock_guard(_mutex);
    auto tools = std::vector<ToolDefinition> {};
    for (const auto& [name, connection]: _connections)
    {
        if (connection.status == ServerStatus::Running)
            tools.insert(tools.end(), connection.tools.begin(), connection.tools.end());
    }
    return tools;
}

auto ConnectionManager::listAllResources() -> std::vector<ResourceDefinition>
{
    auto clients = std::vector<std::shared_ptr<ServerProcessClient>> {};
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& [name, connection]: _connections)
        {
            if (connection.status == ServerStatus::Running && connection.client)
                clients.push_back(connection.client);
        }
    }

    auto resources = std::vector<ResourceDefinition> {};
    for (const auto& client: clients)
    {
        auto listed = client->listResources();
        if (!listed)
        {
            log::warning("Failed to list resources of MCP server '{}': {}", client->name(), listed.error());
            continue;
        }
        resources.insert(resources.end(), listed->begin(), listed->end());
    }
    return resources;
}

auto ConnectionManager::setupAdvisoryIssued() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _advisoryIssued;
}

auto ConnectionManager::subscribe(ManagerEventCallback callback) -> int
{
    auto lock = std::lock_guard(_subscribersMutex);
    auto const id = _nextSubscription++;
    _subscribers.emplace(id, std::move(callback));
    return id;
}

void ConnectionManager::unsubscribe(int subscription)
{
    auto lock = std::lock_guard(_subscribersMutex);
    _subscribers.erase(subscription);
}

void ConnectionManager::emit(const ManagerEvent& event)
{
    auto callbacks = std::vector<ManagerEventCallback> {};
    {
        auto lock = std::lock_guard(_subscribersMutex);
        for (const auto& [id, callback]: _subscribers)
            callbacks.push_back(callback);
    }
    for (const auto& callback: callbacks)
        callback(event);
}

} // namespace toolhost
