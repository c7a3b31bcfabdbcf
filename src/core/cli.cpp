#include "core/cli.hpp"
#include "core/config.hpp"
#include "api/health_probe.hpp"
#include "daemon/ipc_client.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "run") == 0 || std::strcmp(cmd, "daemon") == 0) {
        return -2;  // special: caller runs the supervisor in the foreground
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "start") == 0 || std::strcmp(cmd, "stop") == 0 ||
        std::strcmp(cmd, "restart") == 0) {
        return cmd_service(cmd);
    }
    if (std::strcmp(cmd, "health") == 0) {
        return cmd_health(argc, argv);
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'svcwatch help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "svcwatch - supervisor for a desktop shell's backend service\n"
        "\n"
        "Usage:\n"
        "  svcwatch run                   Supervise the service in the foreground\n"
        "  svcwatch status                Show supervisor and service status\n"
        "  svcwatch start                 Start the service and wait until healthy\n"
        "  svcwatch stop                  Stop the service\n"
        "  svcwatch restart               Restart the service and wait until healthy\n"
        "  svcwatch health [--wait SEC]   Probe the health endpoint directly\n"
        "  svcwatch config path           Print the config file location\n"
        "  svcwatch config init           Write a config file with default values\n"
        "  svcwatch version               Show version\n"
        "  svcwatch help                  Show this help\n"
        "\n"
        "start, stop, restart and status talk to a running 'svcwatch run'.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "svcwatch " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    DaemonClient dc;
    DaemonClient::DaemonStatus st;
    std::string err;
    if (!dc.get_status(st, err)) {
        std::cout << "Supervisor: not running (" << err << ")\n";
        return 1;
    }

    std::cout << "Supervisor: running\n";
    std::cout << "Service:    " << st.state;
    if (st.pid > 0) std::cout << " (pid " << st.pid << ")";
    std::cout << "\n";
    if (!st.reason.empty()) {
        std::cout << "Reason:     " << st.reason << " [" << st.error << "]\n";
    }
    std::cout << "Recovery:   " << (st.auto_restart ? "enabled" : "disabled")
              << (st.restart_in_progress ? ", restart in progress" : "") << "\n";
    if (!st.items_label.empty()) {
        std::cout << st.items_label << "\n";
    }
    return 0;
}

// ── start / stop / restart ──────────────────────────────────

int CLI::cmd_service(const std::string& action) {
    DaemonClient dc;
    std::string err;
    bool ok = false;

    if (action == "start") ok = dc.service_start(err);
    else if (action == "stop") ok = dc.service_stop(err);
    else ok = dc.service_restart(err);

    if (!ok) {
        std::cerr << "Failed to " << action << " service: " << err << "\n";
        return 1;
    }
    std::cout << "Service " << (action == "stop" ? "stopped" : "is running") << "\n";
    return 0;
}

// ── health ──────────────────────────────────────────────────

int CLI::cmd_health(int argc, char* argv[]) {
    Config config;
    config.load();
    HealthProbe probe(config.health_endpoint());

    if (argc >= 4 && std::strcmp(argv[2], "--wait") == 0) {
        int seconds = std::atoi(argv[3]);
        if (seconds <= 0) {
            std::cerr << "Usage: svcwatch health [--wait SEC]\n";
            return 1;
        }
        auto result = probe.wait_until_healthy(std::chrono::seconds(seconds));
        if (!result.success) {
            std::cerr << result.error << "\n";
            return 1;
        }
        std::cout << "healthy: " << result.health.status << " (version "
                  << result.health.version << ")\n";
        return 0;
    }

    auto health = probe.check_once();
    if (!health) {
        std::cerr << "Service not available at " << probe.base_url() << "\n";
        return 1;
    }
    std::cout << "healthy: " << health->status << " (version " << health->version << ")\n";
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: svcwatch config <path|init>\n";
        return 1;
    }

    if (std::strcmp(argv[2], "path") == 0) {
        std::cout << Config::config_path() << "\n";
        return 0;
    }
    if (std::strcmp(argv[2], "init") == 0) {
        Config config;
        config.load();
        if (!config.save()) {
            std::cerr << "Failed to write " << Config::config_path() << "\n";
            return 1;
        }
        std::cout << "Wrote " << Config::config_path() << "\n";
        return 0;
    }

    std::cerr << "Unknown config command: " << argv[2] << "\n";
    return 1;
}
