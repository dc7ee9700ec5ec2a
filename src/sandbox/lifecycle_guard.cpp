#include "sandbox/lifecycle_guard.hpp"

#include "utils/logging.hpp"

namespace boxrun::sandbox {

LifecycleGuard::LifecycleGuard(runtime::ContainerRuntime& runtime,
                               SandboxEnvironment environment,
                               std::chrono::seconds grace)
    : runtime_(runtime)
    , environment_(std::move(environment))
    , grace_(grace) {}

LifecycleGuard::~LifecycleGuard() {
    Release();
}

void LifecycleGuard::Release() {
    if (released_) {
        return;
    }
    released_ = true;
    const auto short_id = environment_.id.substr(0, 12);
    utils::LogInfo("sandbox", "stopping container", {{"id", short_id}});
    try {
        runtime_.StopContainer(environment_.id, grace_);
    } catch (const std::exception& ex) {
        utils::LogWarn("sandbox", "error while stopping container", {
            {"id", short_id},
            {"error", ex.what()}
        });
    }
}

}  // namespace boxrun::sandbox
