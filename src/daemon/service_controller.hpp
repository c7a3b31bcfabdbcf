#pragma once

#include "api/health_probe.hpp"
#include "daemon/service_supervisor.hpp"
#include "daemon/service_types.hpp"

#include <chrono>
#include <mutex>

/// Start/restart followed by the health gate that decides Running vs Error.
class ServiceController {
public:
    ServiceController(ServiceSupervisor& supervisor, const HealthProbe& probe,
                      LaunchSpec spec, std::chrono::milliseconds startup_timeout);

    ServiceResult start_and_wait();
    ServiceResult restart_and_wait();
    ServiceResult stop();

    /// Spawn with the current launch spec and wait for health. The caller
    /// must hold the supervisor's restart slot.
    ServiceResult respawn_and_wait(const RestartGuard& held);

    void set_launch_spec(const LaunchSpec& spec);
    LaunchSpec launch_spec() const;

    ServiceSupervisor& supervisor() { return supervisor_; }
    const HealthProbe& probe() const { return probe_; }

private:
    ServiceSupervisor& supervisor_;
    const HealthProbe& probe_;
    std::chrono::milliseconds startup_timeout_;

    mutable std::mutex spec_mutex_;
    LaunchSpec spec_;

    ServiceResult await_health();
};
