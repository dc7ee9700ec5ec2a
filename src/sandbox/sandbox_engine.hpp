#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/command_pipeline.hpp"
#include "sandbox/sandbox_types.hpp"

namespace boxrun::sandbox {

class ConnectivityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SandboxEngine {
public:
    // Validates |config| (config::ConfigError) and pings the runtime
    // (ConnectivityError). Pulls the configured images when pull_on_start is
    // set.
    SandboxEngine(config::Config config,
                  std::unique_ptr<runtime::ContainerRuntime> runtime,
                  CommandPipeline::Clock clock = {});

    ExecutionReport ExecutePython(const std::string& code,
                                  const std::vector<std::string>& requirements) const;
    ExecutionReport ExecuteBash(const std::string& commands) const;

    // Launch, upload, run, bound and tear down. Never throws; every failure
    // comes back as report text.
    ExecutionReport Execute(const ExecutionRequest& request) const;

    ExecutionRequest MakeRequest(const config::ImageConfig& image,
                                 std::vector<PayloadFile> files,
                                 std::vector<std::string> commands) const;

    void ProvisionImages() const;

    const config::Config& config() const { return config_; }

private:
    ExecutionReport RunInEnvironment(const ExecutionRequest& request,
                                     const SandboxEnvironment& environment,
                                     std::chrono::steady_clock::time_point start) const;

    config::Config config_;
    std::unique_ptr<runtime::ContainerRuntime> runtime_;
    CommandPipeline pipeline_;
    std::int64_t memory_bytes_ = 0;
};

}  // namespace boxrun::sandbox
