// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolhost::test
{

class FakeProviderTransport;

/// @brief Behavior of a scripted in-process provider, shared by every transport it spawns.
struct FakeProviderScript
{
    std::mutex mutex;
    bool failOpen = false;
    bool answerInitialize = true;
    bool answerPing = true;
    bool answerToolCalls = true;
    std::string protocolVersion = "2024-11-05";
    nlohmann::json tools = nlohmann::json::array();

    /// @brief Replaces the whole "initialize" result when set.
    std::optional<nlohmann::json> initializeResult;

    /// @brief Raw lines emitted before the response to "tools/list".
    std::vector<std::string> linesBeforeToolList;

    int opens = 0;
    std::vector<std::string> methods;
    std::vector<nlohmann::json> toolCalls;
    FakeProviderTransport* current = nullptr;

    /// @brief Simulates the current provider process exiting.
    void exitCurrent(ExitInfo exit);

    /// @brief Emits a raw line from the current provider.
    void emitFromCurrent(std::string line);

    [[nodiscard]] auto methodCount(std::string_view method) -> int
    {
        auto lock = std::lock_guard(mutex);
        return static_cast<int>(std::ranges::count(methods, method));
    }

    [[nodiscard]] auto openCount() -> int
    {
        auto lock = std::lock_guard(mutex);
        return opens;
    }
};

/// @brief Transport answering requests from a FakeProviderScript on its own delivery thread.
class FakeProviderTransport: public Transport
{
  public:
    explicit FakeProviderTransport(std::shared_ptr<FakeProviderScript> script): _script(std::move(script)) {}

    ~FakeProviderTransport() override
    {
        close(std::chrono::milliseconds(0));
        auto lock = std::lock_guard(_script->mutex);
        if (_script->current == this)
            _script->current = nullptr;
    }

    auto open(TransportHandlers handlers) -> VoidResult override
    {
        {
            auto lock = std::lock_guard(_script->mutex);
            ++_script->opens;
            if (_script->failOpen)
                return makeError(ErrorCode::TransportError, "Failed to spawn fake provider");
            _script->current = this;
        }

        _handlers = std::move(handlers);
        _connected = true;
        _worker = std::jthread([this](const std::stop_token& stopToken) { deliver(stopToken); });
        return {};
    }

    auto send(const nlohmann::json& message) -> VoidResult override
    {
        if (!_connected)
            return makeError(ErrorCode::TransportError, "Fake provider is not running");

        if (auto reply = answer(message))
            enqueue(Item { .line = reply->dump() });
        return {};
    }

    void close(std::chrono::milliseconds /*grace*/) override
    {
        _connected = false;
        _worker.request_stop();
        if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id())
            _worker.join();
    }

    auto isConnected() const -> bool override { return _connected; }

    auto processId() const -> std::optional<int> override { return 4242; }

    void enqueueExit(ExitInfo exit) { enqueue(Item { .exit = std::move(exit) }); }
    void enqueueLine(std::string line) { enqueue(Item { .line = std::move(line) }); }

  private:
    struct Item
    {
        std::string line;
        std::optional<ExitInfo> exit;
    };

    void enqueue(Item item)
    {
        {
            auto lock = std::lock_guard(_queueMutex);
            _queue.push_back(std::move(item));
        }
        _queueReady.notify_all();
    }

    void deliver(const std::stop_token& stopToken)
    {
        while (true)
        {
            auto item = Item {};
            {
                auto lock = std::unique_lock(_queueMutex);
                if (!_queueReady.wait(lock, stopToken, [this] { return !_queue.empty(); }))
                    return;
                item = std::move(_queue.front());
                _queue.pop_front();
            }

            if (item.exit)
            {
                _connected = false;
                if (_handlers.onClosed)
                    _handlers.onClosed(*item.exit);
                return;
            }

            if (_handlers.onLine)
                _handlers.onLine(item.line);
        }
    }

    auto answer(const nlohmann::json& message) -> std::optional<nlohmann::json>
    {
        if (!message.contains("method") || !message.contains("id"))
            return std::nullopt;

        auto const method = message["method"].get<std::string>();
        auto const& id = message["id"];

        auto lock = std::lock_guard(_script->mutex);
        _script->methods.push_back(method);

        if (method == "initialize")
        {
            if (!_script->answerInitialize)
                return std::nullopt;
            if (_script->initializeResult)
                return jsonrpc::makeResult(id, *_script->initializeResult);
            return jsonrpc::makeResult(id,
                                       nlohmann::json {
                                           { "protocolVersion", _script->protocolVersion },
                                           { "serverInfo", { { "name", "fake-provider" }, { "version", "1.0" } } },
                                           { "capabilities", { { "tools", nlohmann::json::object() } } },
                                       });
        }

        if (method == "ping")
        {
            if (!_script->answerPing)
                return std::nullopt;
            return jsonrpc::makeResult(id, nlohmann::json::object());
        }

        if (method == "tools/list")
        {
            for (const auto& line: _script->linesBeforeToolList)
                enqueue(Item { .line = line });
            return jsonrpc::makeResult(id, nlohmann::json { { "tools", _script->tools } });
        }

        if (method == "tools/call")
        {
            _script->toolCalls.push_back(message["params"]);
            if (!_script->answerToolCalls)
                return std::nullopt;

            auto const& params = message["params"];
            auto const toolName = params.value("name", "");
            if (toolName == "rpc_error")
                return jsonrpc::makeErrorResponse(id, -32602, "Invalid params");
            if (toolName == "text_error_code")
                return nlohmann::json {
                    { "jsonrpc", "2.0" },
                    { "id", id },
                    { "error", { { "code", "bad" }, { "message", "m" } } },
                };
            if (toolName == "array_result")
                return jsonrpc::makeResult(id, nlohmann::json::array());
            if (toolName == "null_result")
                return jsonrpc::makeResult(id, nullptr);
            if (toolName == "text_is_error")
                return jsonrpc::makeResult(id, nlohmann::json { { "isError", "yes" } });

            auto const text = std::format("real:{}", params["arguments"].value("text", ""));
            return jsonrpc::makeResult(
                id,
                nlohmann::json {
                    { "content", nlohmann::json::array({ { { "type", "text" }, { "text", text } } }) },
                    { "isError", toolName == "fail" },
                });
        }

        if (method == "resources/list")
        {
            return jsonrpc::makeResult(
                id,
                nlohmann::json { { "resources",
                                   nlohmann::json::array({ { { "uri", "file:///readme.md" },
                                                             { "name", "readme" },
                                                             { "mimeType", "text/markdown" } } }) } });
        }

        if (method == "resources/read")
        {
            return jsonrpc::makeResult(
                id,
                nlohmann::json { { "contents",
                                   nlohmann::json::array({ { { "uri", message["params"].value("uri", "") },
                                                             { "text", "# Readme" } } }) } });
        }

        return jsonrpc::makeErrorResponse(id, jsonrpc::MethodNotFound, "Method not found");
    }

    std::shared_ptr<FakeProviderScript> _script;
    TransportHandlers _handlers;
    std::atomic<bool> _connected = false;

    std::mutex _queueMutex;
    std::condition_variable_any _queueReady;
    std::deque<Item> _queue;
    std::jthread _worker;
};

inline void FakeProviderScript::exitCurrent(ExitInfo exit)
{
    auto lock = std::lock_guard(mutex);
    if (current)
        current->enqueueExit(std::move(exit));
}

inline void FakeProviderScript::emitFromCurrent(std::string line)
{
    auto lock = std::lock_guard(mutex);
    if (current)
        current->enqueueLine(std::move(line));
}

/// @brief Returns a transport factory bound to @p script.
inline auto fakeProviderFactory(const std::shared_ptr<FakeProviderScript>& script)
{
    return [script]() -> std::unique_ptr<Transport> { return std::make_unique<FakeProviderTransport>(script); };
}

/// @brief Polls @p predicate until it holds or @p timeout elapses.
inline auto waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // namespace toolhost::test
