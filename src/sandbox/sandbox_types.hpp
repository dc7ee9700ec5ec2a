#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/payload_packager.hpp"

namespace boxrun::sandbox {

struct ResourceLimits {
    std::int64_t memory_bytes = 0;
    double cpu_share = 1.0;
};

struct TimeLimits {
    std::chrono::seconds overall{30};
    std::chrono::seconds per_command{25};
};

// Everything one execution needs. Built once by the engine and only read
// afterwards.
struct ExecutionRequest {
    config::ImageConfig image;
    std::vector<PayloadFile> files;
    std::vector<std::string> commands;
    ResourceLimits limits;
    TimeLimits time_limits;
    bool network_enabled = false;
    std::size_t max_output_size = 10 * 1024;
    std::string output_encoding = "utf-8";
    bool non_root = true;
    bool enforce_command_timeout = true;
    std::string working_dir = "/";
};

struct SandboxEnvironment {
    std::string id;
    // Empty when the image's default user applies.
    std::string user;
    runtime::ContainerSpec policy;
};

struct CommandOutcome {
    int exit_status = 0;
    std::string stdout_text;
    std::string stderr_text;
};

struct LaunchError {
    enum class Kind {
        kDaemonUnreachable,
        kImageNotFound,
        kRejected
    };

    Kind kind = Kind::kRejected;
    std::string message;

    std::string Describe() const;
};

struct LaunchResult {
    std::optional<SandboxEnvironment> environment;
    std::optional<LaunchError> error;

    bool ok() const { return environment.has_value(); }
};

enum class ReportStatus {
    kSuccess,
    kCommandFailed,
    kDeadlineExceeded,
    kCommandError,
    kLaunchFailed,
    kRejected,
    kError
};

const char* ToString(ReportStatus status);

struct ExecutionReport {
    std::string text;
    ReportStatus status = ReportStatus::kSuccess;

    bool ok() const { return status == ReportStatus::kSuccess; }
};

}  // namespace boxrun::sandbox
