#pragma once

#include "api/health_probe.hpp"
#include "core/config.hpp"
#include "daemon/monitor_loop.hpp"
#include "daemon/service_controller.hpp"
#include "daemon/service_supervisor.hpp"
#include "ui/status_publisher.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop, blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    /// Handle one control request line and return the response line
    std::string handle_command(const std::string& json_line);

    std::string socket_path() const;

    ServiceSupervisor& supervisor() { return supervisor_; }
    ServiceController& controller() { return controller_; }

private:
    Config& config_;
    HealthProbe probe_;
    ServiceSupervisor supervisor_;
    ServiceController controller_;
    MonitorLoop monitor_;
    StatusPublisher publisher_;

    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    void serve_client(int client_fd);
    void cleanup_socket();

    std::mutex clients_mutex_;
    std::vector<std::future<void>> clients_;
    void reap_clients(bool wait_all);

    std::thread startup_thread_;
};
