#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

using json = nlohmann::json;

namespace {

// start/restart block on the health gate (30s by default)
constexpr int kReplyTimeoutSec = 60;
constexpr size_t kMaxReply = 65536;

/// Closes the descriptor when it goes out of scope
struct SocketFd {
    int fd;
    explicit SocketFd(int f) : fd(f) {}
    ~SocketFd() {
        if (fd >= 0) close(fd);
    }
    SocketFd(const SocketFd&) = delete;
    SocketFd& operator=(const SocketFd&) = delete;
};

int connect_to(const std::string& path) {
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return -1;
    }

    struct timeval tv;
    tv.tv_sec = kReplyTimeoutSec;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

bool send_line(int fd, const std::string& line) {
    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

/// Read up to the first newline. Empty on timeout or a closed connection.
std::string recv_line(int fd) {
    std::string buffer;
    char chunk[512];
    while (buffer.size() < kMaxReply) {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        buffer.append(chunk, static_cast<size_t>(n));
        auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            buffer.resize(newline);
            return buffer;
        }
    }
    return buffer;
}

} // namespace

DaemonClient::DaemonClient() {
    std::string dir = Config::config_dir();
    if (!dir.empty()) {
        socket_path_ = dir + "/svcwatch.sock";
    }
}

DaemonClient::DaemonClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

json DaemonClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    SocketFd sock(connect_to(socket_path_));
    if (sock.fd < 0) return json();

    if (!send_line(sock.fd, cmd.dump() + "\n")) return json();

    std::string reply = recv_line(sock.fd);
    if (reply.empty()) return json();

    try {
        return json::parse(reply);
    } catch (const json::exception&) {
        return json();
    }
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}});
    return resp.is_object() && resp.value("ok", false);
}

bool DaemonClient::get_status(DaemonStatus& out, std::string& err) {
    auto resp = send_command({{"cmd", "status"}});
    if (!resp.is_object()) {
        err = "Cannot connect to svcwatch at " + socket_path_;
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }

    try {
        const auto& data = resp.at("data");
        out.state = data.value("state", "");
        out.reason = data.value("reason", "");
        out.error = data.value("error", "none");
        out.pid = data.value("pid", -1);
        out.auto_restart = data.value("auto_restart", false);
        out.restart_in_progress = data.value("restart_in_progress", false);
        if (data.contains("labels")) {
            const auto& labels = data.at("labels");
            out.status_label = labels.value("status", "");
            out.action_label = labels.value("action", "");
            out.items_label = labels.value("items", "");
        }
    } catch (const json::exception& e) {
        err = std::string("Malformed status response: ") + e.what();
        return false;
    }
    return true;
}

bool DaemonClient::simple_command(const char* name, std::string& err) {
    auto resp = send_command({{"cmd", name}});
    if (!resp.is_object()) {
        err = "Cannot connect to svcwatch at " + socket_path_;
        return false;
    }
    if (resp.value("ok", false)) return true;

    err = resp.value("error", "Unknown error");
    std::string code = resp.value("code", "");
    if (!code.empty()) err += " [" + code + "]";
    return false;
}

bool DaemonClient::service_start(std::string& err) {
    return simple_command("start", err);
}

bool DaemonClient::service_stop(std::string& err) {
    return simple_command("stop", err);
}

bool DaemonClient::service_restart(std::string& err) {
    return simple_command("restart", err);
}
