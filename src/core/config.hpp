#pragma once

#include "api/health_probe.hpp"
#include "daemon/monitor_loop.hpp"
#include "daemon/service_supervisor.hpp"
#include "daemon/service_types.hpp"
#include "ui/status_publisher.hpp"

#include <map>
#include <string>
#include <vector>

struct ServiceSection {
    std::string executable = "python3";
    std::vector<std::string> args = {"-m", "uvicorn", "app:app", "--host", "{host}",
                                     "--port", "{port}"};
    std::string working_dir;
    std::string module_path;  // exported as PYTHONPATH when set
    std::string host = "127.0.0.1";
    int port = 8000;
    bool tls = false;
    std::map<std::string, std::string> env;
    std::vector<std::string> forward_env;  // copied from our own environment (credentials)
    bool auto_start = true;
};

struct AppConfig {
    ServiceSection service;

    // Supervisor
    int restart_grace_ms = 500;
    int stop_timeout_ms = 3000;

    // Health
    std::string health_path = "/health";
    std::string stats_path = "/v2/stats";
    int health_timeout_ms = 2000;
    int health_poll_interval_ms = 250;
    int startup_timeout_ms = 30000;

    // Monitor
    int monitor_interval_ms = 5000;
    int monitor_initial_delay_ms = 5000;
    int failure_threshold = 3;
    std::string monitor_policy = "report-only";

    // Publisher
    int status_interval_ms = 2000;
    int stats_interval_ms = 30000;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class Config {
public:
    Config();
    ~Config();

    /// Load from the default location
    bool load();
    /// Load from an explicit file; unknown keys are ignored, missing keys keep defaults
    bool load_from(const std::string& path);
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    // Component settings derived from the file
    LaunchSpec launch_spec() const;
    HealthEndpoint health_endpoint() const;
    SupervisorOptions supervisor_options() const;
    MonitorOptions monitor_options() const;
    PublisherOptions publisher_options() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
