#include "daemon/service_types.hpp"

const char* service_error_name(ServiceError error) {
    switch (error) {
        case ServiceError::None: return "none";
        case ServiceError::SpawnError: return "spawn_error";
        case ServiceError::HealthTimeout: return "health_timeout";
        case ServiceError::ProcessExited: return "process_exited";
        case ServiceError::Unresponsive: return "unresponsive";
        case ServiceError::RestartAlreadyInProgress: return "restart_in_progress";
    }
    return "unknown";
}

const char* ServiceStatus::name() const {
    switch (kind) {
        case Kind::Starting: return "Starting";
        case Kind::Running: return "Running";
        case Kind::Restarting: return "Restarting";
        case Kind::Stopped: return "Stopped";
        case Kind::Error: return "Error";
    }
    return "Unknown";
}

const char* ServiceEvent::name() const {
    switch (type) {
        case Type::Ready: return "service-ready";
        case Type::Error: return "service-error";
        case Type::Restarting: return "service-restarting";
    }
    return "service-unknown";
}
