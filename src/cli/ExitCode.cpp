#include "cli/ExitCode.hpp"

namespace ferry::cli {

ExitCode exitCodeFor(const runtime::LifecycleErrorKind kind) {
    switch (kind) {
    case runtime::LifecycleErrorKind::EngineBindError: return EXIT_BIND;
    case runtime::LifecycleErrorKind::EngineFatal: return EXIT_ENGINE;
    case runtime::LifecycleErrorKind::AlreadyActive: break;
    }
    return EXIT_ENGINE;
}

}
