#pragma once

#include "daemon/service_types.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>

/// Owns at most one child process. Not thread-safe: the owner serializes access.
/// The destructor terminates and reaps a still-running child.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /// Fork and exec the launch spec. Returns false and fills err if the
    /// executable is missing, the working directory is unusable, or fork/exec fails.
    bool spawn(const LaunchSpec& spec, std::string& err);

    /// Reap without blocking; true while the child has not exited
    bool is_alive();

    /// SIGTERM, wait up to grace, then SIGKILL and block until the OS confirms
    /// exit. Returns false if signalling or waiting reported an error; the
    /// handle is released either way.
    bool terminate(std::chrono::milliseconds grace);

    /// PID of the owned child (-1 if none)
    pid_t pid() const { return pid_; }

    /// Exit code once reaped (-1 if still running or killed by a signal)
    int exit_code() const { return exit_code_; }

    /// Resolve a bare program name against PATH. Returns empty if not found.
    static std::string resolve_executable(const std::string& executable);

private:
    pid_t pid_ = -1;
    int exit_code_ = -1;

    void record_exit(int status);
};
