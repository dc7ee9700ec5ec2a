#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "runtime/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"

namespace boxrun::sandbox {

struct PipelineOptions {
    std::chrono::seconds overall{30};
    std::chrono::seconds per_command{25};
    // Hand each command's budget to the runtime as a hard ceiling. When off,
    // deadlines are only checked between commands.
    bool enforce_command_timeout = true;
    std::string output_encoding = "utf-8";
};

enum class PipelineStop {
    kCompleted,
    kCommandFailed,
    kDeadlineExceeded,
    kCommandError
};

struct PipelineResult {
    std::vector<CommandOutcome> outcomes;
    std::string log;
    PipelineStop stop = PipelineStop::kCompleted;
};

// "Command not found", "Permission denied", "Command timed out" or
// "Unknown error".
const char* ClassifyExitStatus(int exit_status);

class CommandPipeline {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit CommandPipeline(runtime::ContainerRuntime& runtime, Clock clock = {});

    // Runs |commands| in order with `sh -c`, stopping at the first failure or
    // when the deadline measured from |start| is used up.
    PipelineResult Run(const SandboxEnvironment& environment,
                       const std::vector<std::string>& commands,
                       const PipelineOptions& options,
                       std::chrono::steady_clock::time_point start) const;

    PipelineResult Run(const SandboxEnvironment& environment,
                       const std::vector<std::string>& commands,
                       const PipelineOptions& options) const;

    std::chrono::steady_clock::time_point Now() const;

private:
    runtime::ContainerRuntime& runtime_;
    Clock clock_;
};

}  // namespace boxrun::sandbox
