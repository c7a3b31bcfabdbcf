#include "daemon/process_handle.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (pid_ > 0) {
        terminate(std::chrono::milliseconds(0));
    }
}

std::string ProcessHandle::resolve_executable(const std::string& executable) {
    if (executable.empty()) return "";

    if (executable.find('/') != std::string::npos) {
        return access(executable.c_str(), F_OK) == 0 ? executable : "";
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

bool ProcessHandle::spawn(const LaunchSpec& spec, std::string& err) {
    if (pid_ > 0) {
        err = "A process is already owned (PID " + std::to_string(pid_) + ")";
        return false;
    }

    std::string exe = resolve_executable(spec.executable);
    if (exe.empty()) {
        err = "Executable not found: " + spec.executable;
        return false;
    }
    if (access(exe.c_str(), X_OK) != 0) {
        err = "Executable not runnable: " + exe + " (" + std::strerror(errno) + ")";
        return false;
    }
    if (!spec.working_dir.empty()) {
        struct stat st;
        if (stat(spec.working_dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            err = "Working directory not found: " + spec.working_dir;
            return false;
        }
    }

    // Build argv/envp before fork: the child may only make async-signal-safe calls
    std::vector<std::string> env_storage;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string line(*entry);
        std::string name = line.substr(0, line.find('='));
        if (spec.env.count(name)) continue;
        env_storage.push_back(std::move(line));
    }
    for (const auto& kv : spec.env) {
        env_storage.push_back(kv.first + "=" + kv.second);
    }

    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& arg : spec.args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    // The child reports a failed chdir/exec through this pipe; a successful
    // exec closes it and the parent reads EOF.
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(fds[0]);
        close(fds[1]);
        err = std::string("fork failed: ") + std::strerror(saved);
        return false;
    }

    if (pid == 0) {
        // Child process
        close(fds[0]);

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        int child_errno = 0;
        if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
            child_errno = errno;
        } else {
            execve(exe.c_str(), argv.data(), envp.data());
            child_errno = errno;
        }
        ssize_t written = write(fds[1], &child_errno, sizeof(child_errno));
        (void)written;
        _exit(127);
    }

    // Parent process
    close(fds[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        err = "Failed to launch " + exe + ": " + std::strerror(child_errno);
        return false;
    }

    pid_ = pid;
    exit_code_ = -1;
    return true;
}

void ProcessHandle::record_exit(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
        spdlog::debug("[Process] PID {} exited with code {}", pid_, exit_code_);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -1;
        spdlog::debug("[Process] PID {} killed by signal {}", pid_, WTERMSIG(status));
    }
    pid_ = -1;
}

bool ProcessHandle::is_alive() {
    if (pid_ <= 0) return false;

    int status;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        record_exit(status);
        return false;
    }

    if (errno == EINTR) return true;
    spdlog::warn("[Process] waitpid({}) failed: {}", pid_, std::strerror(errno));
    pid_ = -1;
    return false;
}

bool ProcessHandle::terminate(std::chrono::milliseconds grace) {
    if (!is_alive()) return true;

    bool clean = true;
    const pid_t pid = pid_;

    if (grace.count() > 0) {
        if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
            spdlog::warn("[Process] SIGTERM to {} failed: {}", pid, std::strerror(errno));
            clean = false;
        }

        auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!is_alive()) return clean;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        spdlog::warn("[Process] PID {} ignored SIGTERM for {}ms, killing", pid, grace.count());
    }

    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("[Process] SIGKILL to {} failed: {}", pid, std::strerror(errno));
        clean = false;
    }

    int status;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid) {
        record_exit(status);
    } else {
        spdlog::warn("[Process] waiting for PID {} failed: {}", pid, std::strerror(errno));
        pid_ = -1;
        clean = false;
    }
    return clean;
}
