// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace toolhost
{

/// @brief Error codes for categorizing failures across the tool host.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ConnectionError,
    ConnectionClosed,
    NotConnected,
    ProtocolError,
    RequestTimeout,
    ToolCallError,
    FallbackError,
};

/// @brief Returns the symbolic name of an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ConnectionError: return "ConnectionError";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::ToolCallError: return "ToolCallError";
        case ErrorCode::FallbackError: return "FallbackError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace toolhost

template <>
struct std::formatter<toolhost::Error>: std::formatter<std::string>
{
    auto format(const toolhost::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", toolhost::errorCodeName(error.code), error.message), ctx);
    }
};
