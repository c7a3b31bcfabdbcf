#include "daemon/daemon.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json status_to_json(const ServiceStatus& status) {
    json j;
    j["state"] = status.name();
    j["reason"] = status.reason;
    j["error"] = service_error_name(status.error);
    return j;
}

std::string result_response(const ServiceResult& result) {
    if (result.success) {
        return json({{"ok", true}}).dump();
    }
    return json({{"ok", false},
                 {"code", service_error_name(result.error)},
                 {"error", result.message}}).dump();
}

} // namespace

Daemon::Daemon(Config& config)
    : config_(config),
      probe_(config.health_endpoint()),
      supervisor_(config.supervisor_options()),
      controller_(supervisor_, probe_, config.launch_spec(),
                  std::chrono::milliseconds(config.data().startup_timeout_ms)),
      monitor_(controller_, config.monitor_options()),
      publisher_(supervisor_, probe_, config.publisher_options()) {}

Daemon::~Daemon() {
    request_stop();
    monitor_.stop();
    publisher_.stop();
    supervisor_.shutdown();
    reap_clients(true);
    if (startup_thread_.joinable()) {
        startup_thread_.join();
    }
    cleanup_socket();
}

std::string Daemon::socket_path() const {
    std::string dir = Config::config_dir();
    if (dir.empty()) return "";
    return dir + "/svcwatch.sock";
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) {
        spdlog::error("[Daemon] Cannot determine socket path (HOME unset?)");
        return false;
    }

    // Clean up any stale socket
    unlink(path.c_str());

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("[Daemon] Cannot create {}: {}", fs::path(path).parent_path().string(),
                      ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        spdlog::error("[Daemon] socket() failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("[Daemon] bind({}) failed: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        spdlog::error("[Daemon] listen() failed: {}", std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    spdlog::info("[Daemon] Control socket at {}", path);
    return true;
}

void Daemon::reap_clients(bool wait_all) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (wait_all ||
            it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void Daemon::serve_client(int client_fd) {
    // A silent client must not hold up shutdown
    struct timeval tv;
    tv.tv_sec = 5;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Read a single JSON line
    std::string buffer;
    char c;
    while (read(client_fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break; // prevent abuse
    }

    if (!buffer.empty()) {
        std::string response = handle_command(buffer) + "\n";
        size_t total = 0;
        while (total < response.size()) {
            ssize_t n = send(client_fd, response.data() + total, response.size() - total,
                             MSG_NOSIGNAL);
            if (n <= 0) {
                spdlog::debug("[Daemon] Client went away before the response was written");
                break;
            }
            total += static_cast<size_t>(n);
        }
    }

    close(client_fd);
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500); // 500ms timeout
        reap_clients(false);
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept(socket_fd_, nullptr, nullptr);
            if (client_fd < 0) continue;

            // Each client gets its own worker so a long restart never blocks status queries
            std::lock_guard<std::mutex> lock(clients_mutex_);
            clients_.push_back(
                std::async(std::launch::async, &Daemon::serve_client, this, client_fd));
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            json data = status_to_json(supervisor_.get_status());
            data["pid"] = supervisor_.child_pid();
            data["auto_restart"] = supervisor_.should_auto_restart();
            data["restart_in_progress"] = supervisor_.restart_in_progress();
            TrayLabels labels = publisher_.labels();
            data["labels"] = {{"status", labels.status},
                              {"action", labels.action},
                              {"items", labels.items}};
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "start") {
            if (supervisor_.is_running()) {
                return json({{"ok", false},
                             {"error", "Service is already running (use restart)"}}).dump();
            }
            return result_response(controller_.start_and_wait());
        }

        if (cmd == "stop") {
            return result_response(controller_.stop());
        }

        if (cmd == "restart") {
            return result_response(controller_.restart_and_wait());
        }

        if (cmd == "health") {
            auto health = probe_.check_once();
            if (!health) {
                return json({{"ok", false}, {"error", "Service not available"}}).dump();
            }
            return json({{"ok", true},
                         {"data", {{"status", health->status}, {"version", health->version}}}})
                .dump();
        }

        if (cmd == "stats") {
            if (supervisor_.get_status().kind != ServiceStatus::Kind::Running) {
                return json({{"ok", false}, {"error", "Service is not running"}}).dump();
            }
            auto count = probe_.fetch_item_count();
            if (!count) {
                return json({{"ok", false}, {"error", "No stats available"}}).dump();
            }
            return json({{"ok", true}, {"data", {{"items_total", *count}}}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const json::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. Surface events and tray labels
    supervisor_.notifier().subscribe([](const ServiceEvent& event) {
        if (event.type == ServiceEvent::Type::Error) {
            spdlog::error("[Daemon] {}: {}", event.name(), event.message);
        } else {
            spdlog::info("[Daemon] {}", event.name());
        }
    });
    publisher_.on_status_changed = [this](const ServiceStatus&) {
        TrayLabels labels = publisher_.labels();
        spdlog::info("[Daemon] Tray: {} | {}", labels.status, labels.action);
    };
    publisher_.on_item_count_changed = [](std::optional<std::uint64_t> count) {
        spdlog::info("[Daemon] Tray: {}", StatusPublisher::item_count_label(count));
    };

    // 3. Start the service, or record that it is intentionally stopped
    if (config_.data().service.auto_start) {
        startup_thread_ = std::thread([this] {
            auto result = controller_.start_and_wait();
            if (!result.success) {
                spdlog::error("[Daemon] Service failed to start: {}", result.message);
            }
        });
    } else {
        supervisor_.stop();
    }

    // 4. Background loops
    monitor_.start();
    publisher_.start();

    // 5. IPC main loop
    ipc_loop();

    // 6. Cleanup: the child must be gone before we return
    spdlog::info("[Daemon] Shutting down");
    monitor_.stop();
    publisher_.stop();
    supervisor_.shutdown();
    reap_clients(true);
    if (startup_thread_.joinable()) {
        startup_thread_.join();
    }
    cleanup_socket();

    return 0;
}
