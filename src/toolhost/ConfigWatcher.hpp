// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <toolhost/Config.hpp>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace toolhost
{

/// @brief Polls a configuration file and reports changed contents.
///
/// The callback runs on the watcher thread and receives the newly loaded configuration.
/// Files that fail to load are logged and skipped; the next successful load is reported.
class ConfigWatcher
{
  public:
    using ChangeCallback = std::function<void(const AppConfig& config)>;

    ConfigWatcher(std::string path, ChangeCallback callback, std::chrono::milliseconds interval = std::chrono::seconds(2));
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void start();
    void stop();

    /// @brief Checks the file once, invoking the callback if it changed.
    /// @return true if a change was reported.
    auto poll() -> bool;

    [[nodiscard]] auto path() const -> const std::string& { return _path; }

  private:
    [[nodiscard]] auto currentWriteTime() const -> std::optional<std::filesystem::file_time_type>;

    std::string _path;
    ChangeCallback _callback;
    std::chrono::milliseconds _interval;

    std::mutex _mutex;
    std::condition_variable_any _wakeup;
    std::optional<std::filesystem::file_time_type> _lastWriteTime;
    std::jthread _thread;
};

} // namespace toolhost
