#pragma once

#include <chrono>

#include "runtime/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"

namespace boxrun::sandbox {

// Owns a launched environment and stops it exactly once: on Release() or,
// failing that, on destruction. Stop failures are logged, never thrown.
class LifecycleGuard {
public:
    LifecycleGuard(runtime::ContainerRuntime& runtime,
                   SandboxEnvironment environment,
                   std::chrono::seconds grace = std::chrono::seconds(1));
    ~LifecycleGuard();

    LifecycleGuard(const LifecycleGuard&) = delete;
    LifecycleGuard& operator=(const LifecycleGuard&) = delete;

    const SandboxEnvironment& environment() const { return environment_; }

    void Release();

private:
    runtime::ContainerRuntime& runtime_;
    SandboxEnvironment environment_;
    std::chrono::seconds grace_;
    bool released_ = false;
};

}  // namespace boxrun::sandbox
