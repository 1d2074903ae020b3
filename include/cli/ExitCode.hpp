#pragma once

#include "runtime/LifecycleError.hpp"

namespace ferry::cli {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_CONFIG = 1, // validation, unreadable file or bad arguments
    EXIT_BIND = 2,
    EXIT_ENGINE = 3,
};

ExitCode exitCodeFor(runtime::LifecycleErrorKind kind);

}
