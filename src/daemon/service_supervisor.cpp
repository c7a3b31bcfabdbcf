#include "daemon/service_supervisor.hpp"

#include <spdlog/spdlog.h>

#include <thread>

ServiceSupervisor::ServiceSupervisor(SupervisorOptions options)
    : options_(options) {}

ServiceSupervisor::~ServiceSupervisor() {
    shutting_down_.store(true);
    should_restart_.store(false);
    std::lock_guard<std::mutex> lock(process_mutex_);
    terminate_locked();
}

// ── Status cell ─────────────────────────────────────────────

// Records the transition and queues its event. Safe to call with
// process_mutex_ held; listeners only run from dispatch_events().
void ServiceSupervisor::set_status(const ServiceStatus& status) {
    ServiceStatus previous;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (status_ == status) return;
        previous = status_;
        status_ = status;

        switch (status.kind) {
            case ServiceStatus::Kind::Running:
                pending_events_.push_back({ServiceEvent::Type::Ready, ""});
                break;
            case ServiceStatus::Kind::Restarting:
                pending_events_.push_back({ServiceEvent::Type::Restarting, ""});
                break;
            case ServiceStatus::Kind::Error:
                if (!previous.is_error()) {
                    pending_events_.push_back({ServiceEvent::Type::Error, status.reason});
                }
                break;
            default:
                break;
        }
    }

    if (status.reason.empty()) {
        spdlog::info("[Supervisor] Status: {} -> {}", previous.name(), status.name());
    } else {
        spdlog::info("[Supervisor] Status: {} -> {} ({})", previous.name(), status.name(),
                     status.reason);
    }
}

// Must be called without process_mutex_ held. A call made while another
// thread (or an outer frame of this one) is dispatching leaves its events to
// that dispatcher.
void ServiceSupervisor::dispatch_events() {
    std::unique_lock<std::mutex> lock(status_mutex_);
    if (dispatching_) return;
    dispatching_ = true;
    while (!pending_events_.empty()) {
        ServiceEvent event = pending_events_.front();
        pending_events_.pop_front();
        lock.unlock();
        notifier_.emit(event);
        lock.lock();
    }
    dispatching_ = false;
}

ServiceStatus ServiceSupervisor::get_status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

void ServiceSupervisor::mark_running() {
    set_status(ServiceStatus::running());
    dispatch_events();
}

void ServiceSupervisor::mark_error(ServiceError error, const std::string& reason) {
    set_status(ServiceStatus::failed(error, reason));
    dispatch_events();
}

bool ServiceSupervisor::set_status_if_active(const ServiceStatus& status) {
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (!process_ || !should_restart_.load() || shutting_down_.load()) {
            return false;
        }
        set_status(status);
    }
    dispatch_events();
    return true;
}

bool ServiceSupervisor::mark_running_if_active() {
    return set_status_if_active(ServiceStatus::running());
}

bool ServiceSupervisor::mark_error_if_active(ServiceError error, const std::string& reason) {
    return set_status_if_active(ServiceStatus::failed(error, reason));
}

// ── Process control ─────────────────────────────────────────

void ServiceSupervisor::terminate_locked() {
    if (!process_) return;

    pid_t pid = process_->pid();
    if (pid > 0) {
        spdlog::info("[Supervisor] Stopping service (PID {})...", pid);
    }
    if (!process_->terminate(options_.stop_timeout)) {
        spdlog::warn("[Supervisor] Service (PID {}) did not shut down cleanly", pid);
    }
    process_.reset();
    pid_.store(-1);
}

ServiceResult ServiceSupervisor::start_locked(const LaunchSpec& spec) {
    if (process_) {
        spdlog::warn("[Supervisor] start() with PID {} still owned, terminating it first",
                     pid_.load());
        terminate_locked();
    }

    set_status(ServiceStatus::starting());
    spdlog::info("[Supervisor] Starting service: {}", spec.executable);

    auto process = std::make_unique<ProcessHandle>();
    std::string err;
    if (!process->spawn(spec, err)) {
        spdlog::error("[Supervisor] Failed to spawn service: {}", err);
        set_status(ServiceStatus::failed(ServiceError::SpawnError, err));
        return ServiceResult::fail(ServiceError::SpawnError, err);
    }

    pid_.store(process->pid());
    process_ = std::move(process);
    spdlog::info("[Supervisor] Service started with PID {}", pid_.load());
    return ServiceResult::ok();
}

ServiceResult ServiceSupervisor::start(const LaunchSpec& spec) {
    ServiceResult result;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (shutting_down_.load()) {
            set_status(ServiceStatus::stopped());
            result = ServiceResult::fail(ServiceError::SpawnError, "Supervisor is shutting down");
        } else {
            should_restart_.store(true);
            result = start_locked(spec);
        }
    }
    dispatch_events();
    return result;
}

ServiceResult ServiceSupervisor::stop() {
    should_restart_.store(false);
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        terminate_locked();
        set_status(ServiceStatus::stopped());
    }
    dispatch_events();
    return ServiceResult::ok();
}

void ServiceSupervisor::shutdown() {
    if (shutting_down_.exchange(true)) return;
    spdlog::info("[Supervisor] Shutting down");
    stop();
}

ServiceResult ServiceSupervisor::restart(const LaunchSpec& spec) {
    RestartGuard guard = try_acquire_restart();
    if (!guard) {
        spdlog::warn("[Supervisor] Restart rejected: another restart is in progress");
        return ServiceResult::fail(ServiceError::RestartAlreadyInProgress,
                                   "A restart is already in progress");
    }
    return restart(spec, guard);
}

ServiceResult ServiceSupervisor::restart(const LaunchSpec& spec, const RestartGuard& held) {
    if (!held) {
        return ServiceResult::fail(ServiceError::RestartAlreadyInProgress,
                                   "Restart slot not held");
    }

    spdlog::info("[Supervisor] Restarting service...");
    should_restart_.store(false);
    set_status(ServiceStatus::restarting());
    dispatch_events();

    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        terminate_locked();
    }

    std::this_thread::sleep_for(options_.restart_grace);

    ServiceResult result;
    {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (shutting_down_.load()) {
            set_status(ServiceStatus::stopped());
            result = ServiceResult::fail(ServiceError::SpawnError, "Supervisor is shutting down");
        } else {
            should_restart_.store(true);
            result = start_locked(spec);
        }
    }
    dispatch_events();
    return result;
}

RestartGuard ServiceSupervisor::try_acquire_restart() {
    bool expected = false;
    if (restart_in_progress_.compare_exchange_strong(expected, true)) {
        return RestartGuard(&restart_in_progress_);
    }
    return RestartGuard();
}

bool ServiceSupervisor::is_running() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!process_) return false;
    bool alive = process_->is_alive();
    if (!alive) pid_.store(-1);
    return alive;
}

pid_t ServiceSupervisor::child_pid() const {
    return pid_.load();
}
