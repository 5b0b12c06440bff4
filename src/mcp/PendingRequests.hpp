// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>

namespace toolhost
{

/// @brief Correlation table of in-flight requests for one connection.
///
/// Every entry is completed exactly once: by resolve(), cancel() or rejectAll(),
/// whichever removes it from the table first. Later completions for the same id
/// report false and have no effect.
class PendingRequests
{
  public:
    /// @brief Registers a new in-flight request.
    /// @return A future fulfilled when the request completes, or an error if @p id is already pending.
    [[nodiscard]] auto add(int64_t id) -> Result<std::future<Result<nlohmann::json>>>;

    /// @brief Completes the request with @p id.
    /// @return false if no such request is pending.
    auto resolve(int64_t id, Result<nlohmann::json> outcome) -> bool;

    /// @brief Rejects the request with @p id with @p error.
    /// @return false if no such request is pending.
    auto cancel(int64_t id, Error error) -> bool;

    /// @brief Rejects every pending request with @p error.
    /// @return The number of requests rejected.
    auto rejectAll(const Error& error) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto contains(int64_t id) const -> bool;

  private:
    mutable std::mutex _mutex;
    std::map<int64_t, std::promise<Result<nlohmann::json>>> _entries;
};

} // namespace toolhost
