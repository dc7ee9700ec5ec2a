#pragma once

#include <set>
#include <string>

#include "runtime/container_runtime.hpp"

namespace boxrun::sandbox {

// Warms the local image cache. A failed pull is logged and skipped.
class ImageProvisioner {
public:
    explicit ImageProvisioner(runtime::ContainerRuntime& runtime);

    void Ensure(const std::set<std::string>& images) const;

private:
    runtime::ContainerRuntime& runtime_;
};

}  // namespace boxrun::sandbox
