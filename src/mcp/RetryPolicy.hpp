// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace toolhost
{

/// @brief Retry and timeout parameters of one ServerProcessClient.
struct ClientOptions
{
    int maxRetries = 3;                                       ///< Retries after the first attempt.
    std::chrono::milliseconds baseRetryDelay { 5000 };        ///< Delay before the first retry.
    std::chrono::milliseconds maxRetryDelay { 30000 };        ///< Upper bound for any retry delay.
    std::chrono::milliseconds maxJitter { 1000 };             ///< Random extra delay, 0 to disable.
    std::chrono::milliseconds connectionTimeout { 10000 };    ///< Spawn plus handshake.
    std::chrono::milliseconds initializeTimeout { 6000 };     ///< The initialize request alone.
    std::chrono::milliseconds requestTimeout { 10000 };       ///< Generic requests.
    std::chrono::milliseconds toolCallTimeout { 30000 };      ///< tools/call requests.
    std::chrono::milliseconds pingTimeout { 5000 };           ///< Liveness probes.
    std::chrono::milliseconds terminationGrace { 1000 };      ///< SIGTERM to SIGKILL.
};

/// @brief Computes the delay before retry number @p attempt (0-based).
///
/// The delay is baseRetryDelay * 2^attempt plus a uniform jitter in [0, maxJitter],
/// capped at maxRetryDelay.
[[nodiscard]] auto computeRetryDelay(const ClientOptions& options, int attempt, std::mt19937& rng)
    -> std::chrono::milliseconds;

} // namespace toolhost
