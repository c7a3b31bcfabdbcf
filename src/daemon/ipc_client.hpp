#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

class DaemonClient {
public:
    /// Defaults to the socket of the daemon for the current user
    DaemonClient();
    explicit DaemonClient(std::string socket_path);

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct DaemonStatus {
        std::string state;          // "Running", "Error", ...
        std::string reason;
        std::string error;          // error category, "none" unless state is Error
        int pid = -1;
        bool auto_restart = false;
        bool restart_in_progress = false;
        std::string status_label;
        std::string action_label;
        std::string items_label;
    };

    /// Get daemon status; false if the daemon did not answer
    bool get_status(DaemonStatus& out, std::string& err);

    /// Request service start/stop/restart
    bool service_start(std::string& err);
    bool service_stop(std::string& err);
    bool service_restart(std::string& err);

private:
    std::string socket_path_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

    bool simple_command(const char* name, std::string& err);
};
