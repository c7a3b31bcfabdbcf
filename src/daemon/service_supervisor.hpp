#pragma once

#include "daemon/notifier.hpp"
#include "daemon/process_handle.hpp"
#include "daemon/service_types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

struct SupervisorOptions {
    /// Pause between stop and start inside restart()
    std::chrono::milliseconds restart_grace{500};
    /// How long stop() waits after SIGTERM before SIGKILL
    std::chrono::milliseconds stop_timeout{3000};
};

/// Scoped ownership of a supervisor's restart slot. Releases on destruction.
class RestartGuard {
public:
    explicit RestartGuard(std::atomic<bool>* flag = nullptr) : flag_(flag) {}
    ~RestartGuard() { release(); }

    RestartGuard(RestartGuard&& other) noexcept : flag_(other.flag_) { other.flag_ = nullptr; }
    RestartGuard& operator=(RestartGuard&& other) noexcept {
        if (this != &other) {
            release();
            flag_ = other.flag_;
            other.flag_ = nullptr;
        }
        return *this;
    }
    RestartGuard(const RestartGuard&) = delete;
    RestartGuard& operator=(const RestartGuard&) = delete;

    bool acquired() const { return flag_ != nullptr; }
    explicit operator bool() const { return acquired(); }

private:
    std::atomic<bool>* flag_;

    void release() {
        if (flag_) {
            flag_->store(false);
            flag_ = nullptr;
        }
    }
};

/// Owns the lifecycle of exactly one child process and its status cell.
class ServiceSupervisor {
public:
    explicit ServiceSupervisor(SupervisorOptions options = {});
    ~ServiceSupervisor();

    ServiceSupervisor(const ServiceSupervisor&) = delete;
    ServiceSupervisor& operator=(const ServiceSupervisor&) = delete;

    /// Spawn the service. A previously owned process is terminated first.
    ServiceResult start(const LaunchSpec& spec);

    /// Terminate the owned process (if any) and wait for its exit. Idempotent.
    ServiceResult stop();

    /// Stop for good: later start/restart calls are refused. Used at host exit.
    void shutdown();
    bool is_shutting_down() const { return shutting_down_.load(); }

    /// Stop, pause, start. Fails with RestartAlreadyInProgress if another
    /// restart holds the restart slot.
    ServiceResult restart(const LaunchSpec& spec);

    /// Same as restart(spec) for a caller that already holds the restart slot
    /// and keeps it for longer (e.g. until the health gate passes).
    ServiceResult restart(const LaunchSpec& spec, const RestartGuard& held);

    void mark_running();
    void mark_error(ServiceError error, const std::string& reason);

    /// Like mark_running/mark_error, but only while a process is owned and
    /// no stop has been requested. Returns false and leaves the status alone
    /// otherwise.
    bool mark_running_if_active();
    bool mark_error_if_active(ServiceError error, const std::string& reason);

    /// OS-level liveness of the owned process; no health probe
    bool is_running();

    ServiceStatus get_status() const;

    pid_t child_pid() const;

    bool should_auto_restart() const { return should_restart_.load(); }

    /// Try to take the restart slot. The returned guard is empty if it is taken.
    RestartGuard try_acquire_restart();

    bool restart_in_progress() const { return restart_in_progress_.load(); }

    Notifier& notifier() { return notifier_; }

private:
    SupervisorOptions options_;
    Notifier notifier_;

    mutable std::mutex process_mutex_;
    std::unique_ptr<ProcessHandle> process_;
    std::atomic<pid_t> pid_{-1};

    // Guards status_ and the event queue. Events are queued in transition
    // order and delivered by one thread at a time with no lock held.
    mutable std::mutex status_mutex_;
    ServiceStatus status_;
    std::deque<ServiceEvent> pending_events_;
    bool dispatching_ = false;

    std::atomic<bool> should_restart_{true};
    std::atomic<bool> restart_in_progress_{false};
    std::atomic<bool> shutting_down_{false};

    ServiceResult start_locked(const LaunchSpec& spec);
    void terminate_locked();
    bool set_status_if_active(const ServiceStatus& status);
    void set_status(const ServiceStatus& status);
    void dispatch_events();
};
