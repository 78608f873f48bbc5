//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: Owning handle for a spawned MCP server process and its three stdio pipes (POSIX)
//==========================================================================================================
#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <optional>

#include "mcphost/ServerConfig.h"

namespace mcphost {

//==========================================================================================================
// ChildProcess
// Purpose: Launches a command with piped stdin/stdout/stderr and guarantees it is killed and reaped
//          exactly once, either by Kill() or by the destructor.
// Notes:
//   - Pipe ends are handed over with Release*(); unreleased ends are closed by the destructor.
//   - Not copyable or movable; share it through std::unique_ptr.
//==========================================================================================================
class ChildProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: Starts config.command with config.args, inheriting the environment overlaid with config.env.
    // Returns:
    //   The running child.
    // Throws:
    //   errors::McpException (Connection) when a pipe cannot be created or the command cannot be executed.
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const ServerConfig& config);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid_; }

    // Transfer ownership of the parent's pipe ends; each returns -1 once released.
    int ReleaseStdin();
    int ReleaseStdout();
    int ReleaseStderr();

    //==========================================================================================================
    // Kill
    // Purpose: Sends SIGKILL and waits for the process to exit. Only the first call does anything.
    // Returns:
    //   true when this call performed the kill; false when it had already happened.
    //==========================================================================================================
    bool Kill();

    // True until Kill() has run.
    bool IsRunning() const;

    // Raw wait status captured by Kill(), if the process was reaped.
    std::optional<int> ExitStatus() const;

private:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    mutable std::mutex mutex_;
    bool killed_{false};
    std::optional<int> exitStatus_;
};

} // namespace mcphost
