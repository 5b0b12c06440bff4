// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace toolhost::jsonrpc
{

/// @brief JSON-RPC 2.0 error code for an unknown method.
constexpr auto MethodNotFound = -32601;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief The kind of an incoming JSON-RPC message.
enum class MessageKind
{
    Response,     ///< Has an id and a result or error.
    Notification, ///< Has a method and no id.
    Request,      ///< Has a method and an id (peer-initiated call).
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a success response to a peer-initiated request.
[[nodiscard]] auto makeResult(const nlohmann::json& id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds an error response to a peer-initiated request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message)
    -> nlohmann::json;

/// @brief Classifies an incoming message.
/// @param message The JSON message.
/// @return The message kind, or a ProtocolError if it is not a valid JSON-RPC 2.0 message.
[[nodiscard]] auto classify(const nlohmann::json& message) -> Result<MessageKind>;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Extracts an integer correlation id.
/// @return The id, or std::nullopt if the id is absent or not an integer.
[[nodiscard]] auto integerId(const nlohmann::json& id) -> std::optional<int64_t>;

} // namespace toolhost::jsonrpc
