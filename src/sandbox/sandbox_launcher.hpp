#pragma once

#include <chrono>
#include <string>

#include "config/config_schema.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"

namespace boxrun::sandbox {

struct LaunchOptions {
    config::ImageConfig image;
    ResourceLimits limits;
    // The idle command keeps the container up this long.
    std::chrono::seconds keep_alive{30};
    bool network_enabled = false;
    bool non_root = true;
    std::string working_dir;
};

class SandboxLauncher {
public:
    explicit SandboxLauncher(runtime::ContainerRuntime& runtime);

    LaunchResult Launch(const LaunchOptions& options) const;

    // The container policy Launch() would request for |options|.
    static runtime::ContainerSpec BuildSpec(const LaunchOptions& options);

    // Empty string means the image's default identity.
    static std::string ResolveUser(config::ImageFamily family, bool non_root);

private:
    runtime::ContainerRuntime& runtime_;
};

}  // namespace boxrun::sandbox
