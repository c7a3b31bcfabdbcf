#include "daemon/service_controller.hpp"

#include <spdlog/spdlog.h>

ServiceController::ServiceController(ServiceSupervisor& supervisor, const HealthProbe& probe,
                                     LaunchSpec spec, std::chrono::milliseconds startup_timeout)
    : supervisor_(supervisor),
      probe_(probe),
      startup_timeout_(startup_timeout),
      spec_(std::move(spec)) {}

void ServiceController::set_launch_spec(const LaunchSpec& spec) {
    std::lock_guard<std::mutex> lock(spec_mutex_);
    spec_ = spec;
}

LaunchSpec ServiceController::launch_spec() const {
    std::lock_guard<std::mutex> lock(spec_mutex_);
    return spec_;
}

ServiceResult ServiceController::await_health() {
    // An explicit stop during the wait wins over the probe outcome
    auto stopped = [this] { return !supervisor_.should_auto_restart(); };
    auto wait = probe_.wait_until_healthy(startup_timeout_, stopped);

    const std::string stopped_message = "Service was stopped while waiting for health";
    if (wait.cancelled || stopped()) {
        spdlog::info("[Controller] {}", stopped_message);
        return ServiceResult::fail(ServiceError::HealthTimeout, stopped_message);
    }

    // A stop can still land between the checks above and the status write
    if (wait.success) {
        if (supervisor_.mark_running_if_active()) return ServiceResult::ok();
    } else if (supervisor_.mark_error_if_active(ServiceError::HealthTimeout, wait.error)) {
        return ServiceResult::fail(ServiceError::HealthTimeout, wait.error);
    }
    spdlog::info("[Controller] {}", stopped_message);
    return ServiceResult::fail(ServiceError::HealthTimeout, stopped_message);
}

ServiceResult ServiceController::start_and_wait() {
    auto started = supervisor_.start(launch_spec());
    if (!started.success) return started;
    return await_health();
}

ServiceResult ServiceController::restart_and_wait() {
    // The slot stays held until the health gate finishes
    RestartGuard guard = supervisor_.try_acquire_restart();
    if (!guard) {
        spdlog::warn("[Controller] Restart rejected: another restart is in progress");
        return ServiceResult::fail(ServiceError::RestartAlreadyInProgress,
                                   "A restart is already in progress");
    }

    auto restarted = supervisor_.restart(launch_spec(), guard);
    if (!restarted.success) return restarted;
    return await_health();
}

ServiceResult ServiceController::respawn_and_wait(const RestartGuard& held) {
    if (!held) {
        return ServiceResult::fail(ServiceError::RestartAlreadyInProgress,
                                   "Restart slot not held");
    }
    auto started = supervisor_.start(launch_spec());
    if (!started.success) return started;
    return await_health();
}

ServiceResult ServiceController::stop() {
    return supervisor_.stop();
}
