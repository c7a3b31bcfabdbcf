#pragma once

#include <map>
#include <string>
#include <vector>

enum class ServiceError {
    None,
    SpawnError,
    HealthTimeout,
    ProcessExited,
    Unresponsive,
    RestartAlreadyInProgress,
};

const char* service_error_name(ServiceError error);

struct ServiceStatus {
    enum class Kind { Starting, Running, Restarting, Stopped, Error };

    Kind kind = Kind::Stopped;
    ServiceError error = ServiceError::None; // only meaningful for Kind::Error
    std::string reason;

    static ServiceStatus starting() { return {Kind::Starting, ServiceError::None, ""}; }
    static ServiceStatus running() { return {Kind::Running, ServiceError::None, ""}; }
    static ServiceStatus restarting() { return {Kind::Restarting, ServiceError::None, ""}; }
    static ServiceStatus stopped() { return {Kind::Stopped, ServiceError::None, ""}; }
    static ServiceStatus failed(ServiceError error, const std::string& reason) {
        return {Kind::Error, error, reason};
    }

    bool is_error() const { return kind == Kind::Error; }

    /// "Starting", "Running", ... as shown to users
    const char* name() const;

    bool operator==(const ServiceStatus& other) const {
        return kind == other.kind && error == other.error && reason == other.reason;
    }
    bool operator!=(const ServiceStatus& other) const { return !(*this == other); }
};

/// Everything needed to spawn the supervised service.
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // set on top of the inherited environment
    std::string working_dir;                // empty = inherit
};

struct ServiceResult {
    bool success = false;
    ServiceError error = ServiceError::None;
    std::string message;

    static ServiceResult ok() { return {true, ServiceError::None, ""}; }
    static ServiceResult fail(ServiceError error, const std::string& message) {
        return {false, error, message};
    }
};

struct ServiceEvent {
    enum class Type { Ready, Error, Restarting };

    Type type;
    std::string message; // set for Error

    /// Wire name: "service-ready", "service-error", "service-restarting"
    const char* name() const;
};
