// SPDX-License-Identifier: Apache-2.0
#include "PendingRequests.hpp"

#include <format>

namespace toolhost
{

auto PendingRequests::add(int64_t id) -> Result<std::future<Result<nlohmann::json>>>
{
    auto lock = std::lock_guard(_mutex);
    auto [it, inserted] = _entries.try_emplace(id);
    if (!inserted)
        return makeError(ErrorCode::InvalidArgument, std::format("Request id {} is already pending", id));
    return it->second.get_future();
}

auto PendingRequests::resolve(int64_t id, Result<nlohmann::json> outcome) -> bool
{
    auto promise = std::promise<Result<nlohmann::json>> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _entries.find(id);
        if (it == _entries.end())
            return false;
        promise = std::move(it->second);
        _entries.erase(it);
    }
    promise.set_value(std::move(outcome));
    return true;
}

auto PendingRequests::cancel(int64_t id, Error error) -> bool
{
    return resolve(id, std::unexpected(std::move(error)));
}

auto PendingRequests::rejectAll(const Error& error) -> std::size_t
{
    auto drained = std::map<int64_t, std::promise<Result<nlohmann::json>>> {};
    {
        auto lock = std::lock_guard(_mutex);
        drained.swap(_entries);
    }
    for (auto& [id, promise]: drained)
        promise.set_value(std::unexpected(error));
    return drained.size();
}

auto PendingRequests::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _entries.size();
}

auto PendingRequests::contains(int64_t id) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _entries.contains(id);
}

} // namespace toolhost
