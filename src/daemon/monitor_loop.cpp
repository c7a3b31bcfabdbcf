#include "daemon/monitor_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

bool parse_respawn_policy(const std::string& text, RespawnPolicy& out) {
    if (text == "report-only") {
        out = RespawnPolicy::ReportOnly;
        return true;
    }
    if (text == "auto-respawn") {
        out = RespawnPolicy::AutoRespawn;
        return true;
    }
    return false;
}

const char* respawn_policy_name(RespawnPolicy policy) {
    return policy == RespawnPolicy::AutoRespawn ? "auto-respawn" : "report-only";
}

MonitorLoop::MonitorLoop(ServiceController& controller, MonitorOptions options)
    : controller_(controller), options_(options) {}

MonitorLoop::~MonitorLoop() {
    stop();
}

void MonitorLoop::start() {
    if (running_.exchange(true)) return;
    spdlog::info("[Monitor] Started (interval {}ms, threshold {}, policy {})",
                 options_.interval.count(), options_.failure_threshold,
                 respawn_policy_name(options_.policy));
    thread_ = std::thread(&MonitorLoop::run, this);
}

void MonitorLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool MonitorLoop::sleep_for(std::chrono::milliseconds duration) {
    const auto slice = std::chrono::milliseconds(100);
    auto until = std::chrono::steady_clock::now() + duration;
    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= until) return true;
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(slice, until - now));
    }
    return false;
}

void MonitorLoop::run() {
    if (!sleep_for(options_.initial_delay)) return;

    while (running_.load()) {
        tick();
        if (!sleep_for(options_.interval)) break;
    }
}

void MonitorLoop::tick() {
    ServiceSupervisor& supervisor = controller_.supervisor();

    // Deliberately stopped, or a restart owns the process right now
    if (!supervisor.should_auto_restart()) {
        return;
    }

    if (!supervisor.is_running()) {
        handle_process_exit();
        return;
    }

    // The startup health gate owns the Starting window
    if (supervisor.get_status().kind == ServiceStatus::Kind::Starting) {
        consecutive_failures_.store(0);
        return;
    }

    if (controller_.probe().check_once()) {
        if (consecutive_failures_.load() > 0) {
            spdlog::info("[Monitor] Health check recovered");
        }
        consecutive_failures_.store(0);
        return;
    }

    int failures = ++consecutive_failures_;
    spdlog::warn("[Monitor] Health check failed ({}/{})", failures, options_.failure_threshold);

    if (failures >= options_.failure_threshold) {
        if (!supervisor.get_status().is_error()) {
            spdlog::error("[Monitor] Too many health check failures, marking as error");
            supervisor.mark_error_if_active(ServiceError::Unresponsive, "Service unresponsive");
        }
    }
}

void MonitorLoop::handle_process_exit() {
    ServiceSupervisor& supervisor = controller_.supervisor();
    ServiceStatus status = supervisor.get_status();

    // Spawn failures are not retried automatically
    if (status.is_error() && status.error == ServiceError::SpawnError) {
        return;
    }

    // A restart between the intent check and here owns the process
    if (status.kind == ServiceStatus::Kind::Restarting) {
        return;
    }

    if (!status.is_error()) {
        spdlog::warn("[Monitor] Service process is not running");
        supervisor.mark_error_if_active(ServiceError::ProcessExited, "Service stopped");
    }

    if (options_.policy != RespawnPolicy::AutoRespawn) {
        return;
    }

    RestartGuard guard = supervisor.try_acquire_restart();
    if (!guard) {
        spdlog::debug("[Monitor] Restart already in progress, skipping respawn");
        return;
    }

    spdlog::info("[Monitor] Respawning service");
    auto result = controller_.respawn_and_wait(guard);
    if (result.success) {
        consecutive_failures_.store(0);
        spdlog::info("[Monitor] Service recovered");
    } else {
        spdlog::error("[Monitor] Respawn failed: {}", result.message);
    }
}
