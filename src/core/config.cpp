#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::string substitute(std::string text, const std::string& key, const std::string& value) {
    std::string::size_type pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        text.replace(pos, key.size(), value);
        pos += value.size();
    }
    return text;
}

} // namespace

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;
Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/svcwatch";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/svcwatch";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }
    return load_from(path);
}

bool Config::load_from(const std::string& path) {
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto svc = root["service"]) {
            auto& s = config_.service;
            s.executable = svc["executable"].as<std::string>(s.executable);
            if (auto args = svc["args"]) {
                s.args.clear();
                for (const auto& arg : args) {
                    s.args.push_back(arg.as<std::string>());
                }
            }
            s.working_dir = svc["working_dir"].as<std::string>(s.working_dir);
            s.module_path = svc["module_path"].as<std::string>(s.module_path);
            s.host = svc["host"].as<std::string>(s.host);
            s.port = svc["port"].as<int>(s.port);
            s.tls = svc["tls"].as<bool>(s.tls);
            if (auto env = svc["env"]) {
                s.env.clear();
                for (const auto& kv : env) {
                    s.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                }
            }
            if (auto fwd = svc["forward_env"]) {
                s.forward_env.clear();
                for (const auto& name : fwd) {
                    s.forward_env.push_back(name.as<std::string>());
                }
            }
            s.auto_start = svc["auto_start"].as<bool>(s.auto_start);
        }

        if (auto sup = root["supervisor"]) {
            config_.restart_grace_ms = sup["restart_grace_ms"].as<int>(config_.restart_grace_ms);
            config_.stop_timeout_ms = sup["stop_timeout_ms"].as<int>(config_.stop_timeout_ms);
        }

        if (auto health = root["health"]) {
            config_.health_path = health["path"].as<std::string>(config_.health_path);
            config_.stats_path = health["stats_path"].as<std::string>(config_.stats_path);
            config_.health_timeout_ms = health["timeout_ms"].as<int>(config_.health_timeout_ms);
            config_.health_poll_interval_ms =
                health["poll_interval_ms"].as<int>(config_.health_poll_interval_ms);
            config_.startup_timeout_ms =
                health["startup_timeout_ms"].as<int>(config_.startup_timeout_ms);
        }

        if (auto monitor = root["monitor"]) {
            config_.monitor_interval_ms = monitor["interval_ms"].as<int>(config_.monitor_interval_ms);
            config_.monitor_initial_delay_ms =
                monitor["initial_delay_ms"].as<int>(config_.monitor_initial_delay_ms);
            config_.failure_threshold =
                monitor["failure_threshold"].as<int>(config_.failure_threshold);
            config_.monitor_policy = monitor["policy"].as<std::string>(config_.monitor_policy);
        }

        if (auto publisher = root["publisher"]) {
            config_.status_interval_ms =
                publisher["status_interval_ms"].as<int>(config_.status_interval_ms);
            config_.stats_interval_ms =
                publisher["stats_interval_ms"].as<int>(config_.stats_interval_ms);
        }

        if (auto log = root["log"]) {
            config_.log_level = log["level"].as<std::string>(config_.log_level);
            config_.log_file = log["file"].as<std::string>(config_.log_file);
        }

        return true;
    } catch (const YAML::Exception& e) {
        spdlog::warn("[Config] Failed to parse {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        const auto& s = config_.service;
        out << YAML::Key << "service" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "executable" << YAML::Value << s.executable;
        out << YAML::Key << "args" << YAML::Value << YAML::Flow << s.args;
        out << YAML::Key << "working_dir" << YAML::Value << s.working_dir;
        out << YAML::Key << "module_path" << YAML::Value << s.module_path;
        out << YAML::Key << "host" << YAML::Value << s.host;
        out << YAML::Key << "port" << YAML::Value << s.port;
        out << YAML::Key << "tls" << YAML::Value << s.tls;
        out << YAML::Key << "env" << YAML::Value << YAML::BeginMap;
        for (const auto& kv : s.env) {
            out << YAML::Key << kv.first << YAML::Value << kv.second;
        }
        out << YAML::EndMap;
        out << YAML::Key << "forward_env" << YAML::Value << YAML::Flow << s.forward_env;
        out << YAML::Key << "auto_start" << YAML::Value << s.auto_start;
        out << YAML::EndMap;

        out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "restart_grace_ms" << YAML::Value << config_.restart_grace_ms;
        out << YAML::Key << "stop_timeout_ms" << YAML::Value << config_.stop_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "health" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << config_.health_path;
        out << YAML::Key << "stats_path" << YAML::Value << config_.stats_path;
        out << YAML::Key << "timeout_ms" << YAML::Value << config_.health_timeout_ms;
        out << YAML::Key << "poll_interval_ms" << YAML::Value << config_.health_poll_interval_ms;
        out << YAML::Key << "startup_timeout_ms" << YAML::Value << config_.startup_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "monitor" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "interval_ms" << YAML::Value << config_.monitor_interval_ms;
        out << YAML::Key << "initial_delay_ms" << YAML::Value << config_.monitor_initial_delay_ms;
        out << YAML::Key << "failure_threshold" << YAML::Value << config_.failure_threshold;
        out << YAML::Key << "policy" << YAML::Value << config_.monitor_policy;
        out << YAML::EndMap;

        out << YAML::Key << "publisher" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "status_interval_ms" << YAML::Value << config_.status_interval_ms;
        out << YAML::Key << "stats_interval_ms" << YAML::Value << config_.stats_interval_ms;
        out << YAML::EndMap;

        out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[Config] Failed to save {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

// ── Derived component settings ──────────────────────────────

LaunchSpec Config::launch_spec() const {
    const auto& s = config_.service;
    const std::string port = std::to_string(s.port);

    LaunchSpec spec;
    spec.executable = expand_home(s.executable);
    for (const auto& arg : s.args) {
        spec.args.push_back(substitute(substitute(arg, "{host}", s.host), "{port}", port));
    }
    spec.working_dir = expand_home(s.working_dir);

    if (!s.module_path.empty()) {
        spec.env["PYTHONPATH"] = expand_home(s.module_path);
    }
    for (const auto& kv : s.env) {
        spec.env[kv.first] = kv.second;
    }
    for (const auto& name : s.forward_env) {
        if (const char* value = std::getenv(name.c_str())) {
            spec.env[name] = value;
        }
    }
    return spec;
}

HealthEndpoint Config::health_endpoint() const {
    HealthEndpoint ep;
    ep.host = config_.service.host;
    ep.port = config_.service.port;
    ep.tls = config_.service.tls;
    ep.health_path = config_.health_path;
    ep.stats_path = config_.stats_path;
    ep.timeout = std::chrono::milliseconds(config_.health_timeout_ms);
    ep.poll_interval = std::chrono::milliseconds(config_.health_poll_interval_ms);
    return ep;
}

SupervisorOptions Config::supervisor_options() const {
    SupervisorOptions opts;
    opts.restart_grace = std::chrono::milliseconds(config_.restart_grace_ms);
    opts.stop_timeout = std::chrono::milliseconds(config_.stop_timeout_ms);
    return opts;
}

MonitorOptions Config::monitor_options() const {
    MonitorOptions opts;
    opts.interval = std::chrono::milliseconds(config_.monitor_interval_ms);
    opts.initial_delay = std::chrono::milliseconds(config_.monitor_initial_delay_ms);
    opts.failure_threshold = config_.failure_threshold > 0 ? config_.failure_threshold : 1;
    if (!parse_respawn_policy(config_.monitor_policy, opts.policy)) {
        spdlog::warn("[Config] Unknown monitor policy '{}', using report-only",
                     config_.monitor_policy);
        opts.policy = RespawnPolicy::ReportOnly;
    }
    return opts;
}

PublisherOptions Config::publisher_options() const {
    PublisherOptions opts;
    opts.status_interval = std::chrono::milliseconds(config_.status_interval_ms);
    opts.stats_interval = std::chrono::milliseconds(config_.stats_interval_ms);
    return opts;
}
