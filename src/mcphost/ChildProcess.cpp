//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: posix_spawn based launcher with kill-once teardown
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <map>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/errors/Errors.h"

extern char** environ;

namespace mcphost {

namespace {

// Pipe pair closed on scope exit unless an end was released.
struct Pipe {
    int fds[2]{-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe() {
        for (int& fd : fds) {
            if (fd >= 0) { ::close(fd); fd = -1; }
        }
    }

    void open(const char* which) {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw errors::makeException(errors::ErrorCategory::Connection,
                fmt::format("failed to create {} pipe: {}", which, ::strerror(errno)));
        }
    }

    int release(int end) {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }

    void closeEnd(int end) {
        if (fds[end] >= 0) { ::close(fds[end]); fds[end] = -1; }
    }
};

// A dead server turns writes on its stdin into EPIPE instead of killing the host.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> buildEnvironment(const std::unordered_map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overlay) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.command.empty()) {
        throw errors::makeException(errors::ErrorCategory::Connection, "cannot spawn an empty command");
    }
    ignoreSigpipeOnce();

    Pipe in, out, err;
    in.open("stdin");
    out.open("stdout");
    err.open("stderr");

    std::vector<std::string> argStore;
    argStore.push_back(config.command);
    argStore.insert(argStore.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : argStore) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStore = buildEnvironment(config.env);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    int rc = ::posix_spawn_file_actions_init(&actions);
    if (rc != 0) {
        throw errors::makeException(errors::ErrorCategory::Connection,
            fmt::format("posix_spawn_file_actions_init failed: {}", ::strerror(rc)));
    }
    // Every pipe end is O_CLOEXEC; only the dup2 targets survive exec
    rc = ::posix_spawn_file_actions_adddup2(&actions, in.fds[0], STDIN_FILENO);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(&actions, out.fds[1], STDOUT_FILENO);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(&actions, err.fds[1], STDERR_FILENO);

    pid_t pid = -1;
    if (rc == 0) {
        rc = ::posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    }
    ::posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        throw errors::makeException(errors::ErrorCategory::Connection,
            fmt::format("failed to spawn '{}': {}", config.CommandLine(), ::strerror(rc)));
    }

    in.closeEnd(0);
    out.closeEnd(1);
    err.closeEnd(1);
    LOG_INFO("Spawned MCP server process '{}' (pid={})", config.CommandLine(), static_cast<long>(pid));
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, in.release(1), out.release(0), err.release(0)));
}

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd) {}

ChildProcess::~ChildProcess() {
    Kill();
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

int ChildProcess::ReleaseStdin() {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stdinFd_; stdinFd_ = -1; return fd;
}

int ChildProcess::ReleaseStdout() {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stdoutFd_; stdoutFd_ = -1; return fd;
}

int ChildProcess::ReleaseStderr() {
    std::lock_guard<std::mutex> lock(mutex_);
    int fd = stderrFd_; stderrFd_ = -1; return fd;
}

bool ChildProcess::Kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (killed_) {
        return false;
    }
    killed_ = true;
    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("ChildProcess: kill(pid={}) failed: {}", static_cast<long>(pid_), ::strerror(errno));
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        exitStatus_ = status;
        LOG_DEBUG("ChildProcess: reaped pid={} (status={})", static_cast<long>(pid_), status);
    } else {
        LOG_WARN("ChildProcess: waitpid(pid={}) failed: {}", static_cast<long>(pid_), ::strerror(errno));
    }
    return true;
}

bool ChildProcess::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !killed_;
}

std::optional<int> ChildProcess::ExitStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitStatus_;
}

} // namespace mcphost
