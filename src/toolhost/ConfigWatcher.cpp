// SPDX-License-Identifier: Apache-2.0
#include "ConfigWatcher.hpp"

#include <core/Log.hpp>

namespace toolhost
{

ConfigWatcher::ConfigWatcher(std::string path, ChangeCallback callback, std::chrono::milliseconds interval):
    _path(std::move(path)), _callback(std::move(callback)), _interval(interval)
{
    _lastWriteTime = currentWriteTime();
}

ConfigWatcher::~ConfigWatcher()
{
    stop();
}

void ConfigWatcher::start()
{
    if (_thread.joinable())
        return;

    _thread = std::jthread([this](const std::stop_token& stopToken) {
        while (!stopToken.stop_requested())
        {
            {
                auto lock = std::unique_lock(_mutex);
                _wakeup.wait_for(lock, stopToken, _interval, [] { return false; });
            }
            if (stopToken.stop_requested())
                return;
            poll();
        }
    });
}

void ConfigWatcher::stop()
{
    _thread.request_stop();
    if (_thread.joinable())
        _thread.join();
}

auto ConfigWatcher::currentWriteTime() const -> std::optional<std::filesystem::file_time_type>
{
    auto ec = std::error_code {};
    auto const time = std::filesystem::last_write_time(_path, ec);
    if (ec)
        return std::nullopt;
    return time;
}

auto ConfigWatcher::poll() -> bool
{
    auto const writeTime = currentWriteTime();
    {
        auto lock = std::lock_guard(_mutex);
        if (!writeTime || writeTime == _lastWriteTime)
            return false;
    }

    auto config = loadConfigFromFile(_path);
    if (!config)
    {
        log::warning("Ignoring changed configuration: {}", config.error());
        return false;
    }

    {
        auto lock = std::lock_guard(_mutex);
        _lastWriteTime = writeTime;
    }

    log::info("Configuration file changed: {}", _path);
    if (_callback)
        _callback(*config);
    return true;
}

} // namespace toolhost
