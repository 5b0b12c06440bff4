// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolhost::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto classify(const nlohmann::json& message) -> Result<MessageKind>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto const hasId = message.contains("id") && !message["id"].is_null();
    auto const hasMethod = message.contains("method") && message["method"].is_string();

    if (hasMethod)
        return hasId ? MessageKind::Request : MessageKind::Notification;

    if (hasId && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;

    return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        if (err.contains("code") && !err["code"].is_number_integer())
            return makeError(ErrorCode::ProtocolError, "JSON-RPC error code must be an integer");

        response.error = RpcError {
            .code = json::getIntOr(err, "code", 0),
            .message = json::getStringOr(err, "message", "Unknown error"),
            .data = err.contains("data") ? err["data"] : nlohmann::json {},
        };
    }
    else
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC response has neither result nor error");
    }

    return response;
}

auto integerId(const nlohmann::json& id) -> std::optional<int64_t>
{
    if (id.is_number_integer())
        return id.get<int64_t>();
    return std::nullopt;
}

} // namespace toolhost::jsonrpc
