#pragma once

#include <string>

namespace ferry::runtime {

enum class LifecycleState { Stopped, Starting, Running, Stopping, Failed };

std::string to_string(LifecycleState state);

// Failed behaves like Stopped for the purpose of the next start().
inline bool isInactive(const LifecycleState state) {
    return state == LifecycleState::Stopped || state == LifecycleState::Failed;
}

}
