// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>
#include <mcp/LineFramer.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolhost
{

namespace
{

    constexpr auto ReaderPollInterval = std::chrono::milliseconds(100);
    constexpr auto ReapPollInterval = std::chrono::milliseconds(10);
    constexpr auto ExitAfterEofWindow = std::chrono::milliseconds(500);
    constexpr auto DefaultCloseGrace = std::chrono::milliseconds(1000);

    /// @brief Writes to a pipe whose reader has gone must fail with EPIPE, not kill the host.
    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto toExitInfo(int status) -> ExitInfo
    {
        auto info = ExitInfo {};
        if (WIFEXITED(status))
            info.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            info.signal = WTERMSIG(status);
        return info;
    }

    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto envStrings = std::vector<std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view { *e };
                auto const key = entry.substr(0, entry.find('='));
                if (!overrides.contains(std::string(key)))
                    envStrings.emplace_back(entry);
            }
        }
        for (const auto& [key, value]: overrides)
            envStrings.push_back(std::format("{}={}", key, value));
        return envStrings;
    }

} // namespace

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    TransportHandlers handlers;

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;
    bool opened = false;

    std::mutex writeMutex;

    std::mutex reapMutex;
    bool reaped = false;
    ExitInfo exitInfo;

    std::jthread stdoutReader;
    std::jthread stderrReader;

    /// @brief Waits up to @p window for the child to exit.
    /// @return The exit info if the child has been reaped.
    auto reap(std::chrono::milliseconds window) -> std::optional<ExitInfo>
    {
        auto lock = std::lock_guard(reapMutex);
        if (reaped)
            return exitInfo;
        if (childPid <= 0)
            return std::nullopt;

        auto const deadline = std::chrono::steady_clock::now() + window;
        while (true)
        {
            auto status = 0;
            auto const rc = ::waitpid(childPid, &status, WNOHANG);
            if (rc == childPid)
            {
                reaped = true;
                exitInfo = toExitInfo(status);
                return exitInfo;
            }
            if (rc < 0 && errno != EINTR)
            {
                reaped = true;
                exitInfo = ExitInfo { .exitCode = std::nullopt, .signal = std::nullopt, .detail = "waitpid failed" };
                return exitInfo;
            }
            if (std::chrono::steady_clock::now() >= deadline)
                return std::nullopt;
            std::this_thread::sleep_for(ReapPollInterval);
        }
    }

    /// @brief Blocks until the fd is readable or the stop token fires.
    /// @return Bytes read, 0 on end-of-file, -1 on error or stop.
    static auto readChunk(int fd, std::span<char> buffer, const std::stop_token& stopToken) -> ssize_t
    {
        while (!stopToken.stop_requested())
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, static_cast<int>(ReaderPollInterval.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                return -1;
            }
            if (ready == 0)
                continue;

            auto const bytesRead = ::read(fd, buffer.data(), buffer.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            return bytesRead;
        }
        return -1;
    }

    void readStdout(const std::stop_token& stopToken)
    {
        auto framer = LineFramer {};
        auto buffer = std::array<char, 4096> {};
        auto detail = std::string {};

        while (true)
        {
            auto const bytesRead = readChunk(stdoutRead, buffer, stopToken);
            if (bytesRead == 0)
                break;
            if (bytesRead < 0)
            {
                if (!stopToken.stop_requested())
                    detail = std::format("read error on provider stdout: {}", std::strerror(errno));
                break;
            }

            for (const auto& line: framer.feed(std::string_view(buffer.data(), static_cast<size_t>(bytesRead))))
            {
                if (closing)
                    return;
                if (handlers.onLine)
                    handlers.onLine(line);
            }
        }

        if (auto const rest = framer.flush(); !rest.empty() && !closing && handlers.onLine)
            handlers.onLine(rest);

        connected = false;
        if (closing)
            return;

        auto exit = reap(ExitAfterEofWindow).value_or(ExitInfo {});
        if (!detail.empty())
            exit.detail = detail;
        else if (!exit.exitCode && !exit.signal && exit.detail.empty())
            exit.detail = "provider closed stdout";

        if (!closing && handlers.onClosed)
            handlers.onClosed(exit);
    }

    void readStderr(const std::stop_token& stopToken)
    {
        auto framer = LineFramer {};
        auto buffer = std::array<char, 4096> {};

        while (true)
        {
            auto const bytesRead = readChunk(stderrRead, buffer, stopToken);
            if (bytesRead <= 0)
                return;

            for (const auto& line: framer.feed(std::string_view(buffer.data(), static_cast<size_t>(bytesRead))))
            {
                if (closing)
                    return;
                if (handlers.onStderr)
                    handlers.onStderr(line);
            }
        }
    }
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close(DefaultCloseGrace);
}

auto StdioTransport::open(TransportHandlers handlers) -> VoidResult
{
    if (_impl->opened)
        return makeError(ErrorCode::TransportError, "Transport already opened");

    auto const& config = _impl->config;
    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command configured");

    if (!config.workingDirectory.empty())
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_directory(config.workingDirectory, ec))
            return makeError(ErrorCode::TransportError,
                             std::format("Working directory does not exist: {}", config.workingDirectory));
    }

    ignoreSigpipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->handlers = std::move(handlers);
    _impl->opened = true;
    _impl->connected = true;

    _impl->stdoutReader = std::jthread([this](const std::stop_token& token) { _impl->readStdout(token); });
    _impl->stderrReader = std::jthread([this](const std::stop_token& token) { _impl->readStderr(token); });

    log::debug("Provider process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto lock = std::lock_guard(_impl->writeMutex);

    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto offset = std::size_t { 0 };

    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    return {};
}

void StdioTransport::close(std::chrono::milliseconds grace)
{
    if (!_impl->opened || _impl->closing.exchange(true))
        return;

    _impl->connected = false;

    {
        auto lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    if (_impl->childPid > 0 && !_impl->reap(std::chrono::milliseconds(0)))
    {
        ::kill(_impl->childPid, SIGTERM);
        if (!_impl->reap(grace))
        {
            log::debug("Provider pid {} ignored SIGTERM, sending SIGKILL", _impl->childPid);
            ::kill(_impl->childPid, SIGKILL);
            if (!_impl->reap(grace))
                log::warning("Provider pid {} could not be reaped", _impl->childPid);
        }
    }

    _impl->stdoutReader.request_stop();
    _impl->stderrReader.request_stop();
    if (_impl->stdoutReader.joinable())
        _impl->stdoutReader.join();
    if (_impl->stderrReader.joinable())
        _impl->stderrReader.join();

    closeFd(_impl->stdoutRead);
    closeFd(_impl->stderrRead);

    log::debug("Stdio transport closed: {}", _impl->config.command);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::processId() const -> std::optional<int>
{
    if (_impl->childPid > 0)
        return static_cast<int>(_impl->childPid);
    return std::nullopt;
}

} // namespace toolhost
