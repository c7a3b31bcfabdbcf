#pragma once

#include "daemon/service_controller.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

enum class RespawnPolicy {
    ReportOnly,  // a dead process is surfaced as Error, nothing more
    AutoRespawn, // a dead process is surfaced and then started again
};

/// "report-only" / "auto-respawn"; returns false for anything else
bool parse_respawn_policy(const std::string& text, RespawnPolicy& out);
const char* respawn_policy_name(RespawnPolicy policy);

struct MonitorOptions {
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds initial_delay{5000};
    int failure_threshold = 3;
    RespawnPolicy policy = RespawnPolicy::ReportOnly;
};

/// Background liveness and health verification of the supervised service.
class MonitorLoop {
public:
    MonitorLoop(ServiceController& controller, MonitorOptions options);
    ~MonitorLoop();

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    void start();
    void stop();
    bool is_active() const { return running_.load(); }

    /// One monitoring pass; the background thread calls this every interval
    void tick();

    int consecutive_failures() const { return consecutive_failures_.load(); }

private:
    ServiceController& controller_;
    MonitorOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<int> consecutive_failures_{0};
    std::thread thread_;

    void run();
    void handle_process_exit();
    /// Sleep in small slices so stop() is honored promptly. False if stopped.
    bool sleep_for(std::chrono::milliseconds duration);
};
