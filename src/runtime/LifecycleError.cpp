#include "runtime/LifecycleError.hpp"
#include "runtime/LifecycleState.hpp"

namespace ferry::runtime {

std::string to_string(const LifecycleState state) {
    switch (state) {
    case LifecycleState::Stopped: return "Stopped";
    case LifecycleState::Starting: return "Starting";
    case LifecycleState::Running: return "Running";
    case LifecycleState::Stopping: return "Stopping";
    case LifecycleState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string to_string(const LifecycleErrorKind kind) {
    switch (kind) {
    case LifecycleErrorKind::AlreadyActive: return "AlreadyActive";
    case LifecycleErrorKind::EngineBindError: return "EngineBindError";
    case LifecycleErrorKind::EngineFatal: return "EngineFatal";
    }
    return "Unknown";
}

LifecycleError::LifecycleError(const LifecycleErrorKind kind, const std::string& message, const std::error_code code)
    : std::runtime_error(message), kind_(kind), code_(code) {}

}
