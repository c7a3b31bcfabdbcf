#pragma once

#include "api/health_probe.hpp"
#include "daemon/service_supervisor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/// Texts for the shell's tray menu
struct TrayLabels {
    std::string status = "Status: Stopped";
    std::string action = "Start Service";
    std::string items = "Items: -";
};

struct PublisherOptions {
    std::chrono::milliseconds status_interval{2000};
    std::chrono::milliseconds stats_interval{30000};
};

/// Read-only observer of a supervisor. Polls its status and the stats endpoint
/// and reports changes to the UI layer; it never controls the service.
class StatusPublisher {
public:
    StatusPublisher(const ServiceSupervisor& supervisor, const HealthProbe& probe,
                    PublisherOptions options = {});
    ~StatusPublisher();

    StatusPublisher(const StatusPublisher&) = delete;
    StatusPublisher& operator=(const StatusPublisher&) = delete;

    void start();
    void stop();

    /// Check the status once. Returns true (and notifies) only if it changed.
    bool poll_status();

    /// Refresh the item count once. Returns true (and notifies) only if it changed.
    bool poll_stats();

    TrayLabels labels() const;

    /// Invoked on every observed status change
    std::function<void(const ServiceStatus&)> on_status_changed;
    /// Invoked when the item count changes; empty means unknown
    std::function<void(std::optional<std::uint64_t>)> on_item_count_changed;

    static std::string status_label(const ServiceStatus& status);
    static std::string action_label(const ServiceStatus& status);
    static std::string item_count_label(std::optional<std::uint64_t> count);

private:
    const ServiceSupervisor& supervisor_;
    const HealthProbe& probe_;
    PublisherOptions options_;

    mutable std::mutex mutex_;
    std::optional<ServiceStatus> last_status_;
    std::optional<std::uint64_t> item_count_;
    TrayLabels labels_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    void run();
};
