#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "runtime/container_runtime.hpp"

namespace boxrun::runtime {

std::unique_ptr<ContainerRuntime> CreateRuntime(const config::RuntimeConfig& config);

}  // namespace boxrun::runtime
