#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace ferry::runtime {

enum class LifecycleErrorKind { AlreadyActive, EngineBindError, EngineFatal };

std::string to_string(LifecycleErrorKind kind);

class LifecycleError : public std::runtime_error {
public:
    LifecycleError(LifecycleErrorKind kind, const std::string& message, std::error_code code = {});

    [[nodiscard]] LifecycleErrorKind kind() const noexcept { return kind_; }

    // Underlying OS error for EngineBindError, empty otherwise
    [[nodiscard]] std::error_code code() const noexcept { return code_; }

private:
    LifecycleErrorKind kind_;
    std::error_code code_;
};

struct LifecycleFailure {
    LifecycleErrorKind kind;
    std::string message;
    std::error_code code{};
};

}
