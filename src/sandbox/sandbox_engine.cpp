#include "sandbox/sandbox_engine.hpp"

#include <set>

#include "config/config_loader.hpp"
#include "sandbox/image_provisioner.hpp"
#include "sandbox/lifecycle_guard.hpp"
#include "sandbox/output_bounder.hpp"
#include "sandbox/payload_packager.hpp"
#include "sandbox/sandbox_launcher.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace boxrun::sandbox {
namespace {

constexpr auto kStopGrace = std::chrono::seconds(1);

runtime::ContainerRuntime& RequireRuntime(const std::unique_ptr<runtime::ContainerRuntime>& runtime) {
    if (!runtime) {
        throw std::invalid_argument("sandbox engine needs a container runtime");
    }
    return *runtime;
}

ReportStatus ToReportStatus(PipelineStop stop) {
    switch (stop) {
        case PipelineStop::kCompleted: return ReportStatus::kSuccess;
        case PipelineStop::kCommandFailed: return ReportStatus::kCommandFailed;
        case PipelineStop::kDeadlineExceeded: return ReportStatus::kDeadlineExceeded;
        case PipelineStop::kCommandError: return ReportStatus::kCommandError;
    }
    return ReportStatus::kError;
}

}  // namespace

SandboxEngine::SandboxEngine(config::Config config,
                             std::unique_ptr<runtime::ContainerRuntime> runtime,
                             CommandPipeline::Clock clock)
    : config_(std::move(config))
    , runtime_(std::move(runtime))
    , pipeline_(RequireRuntime(runtime_), std::move(clock)) {
    config::ValidateConfig(config_);
    if (!config::ParseMemoryLimit(config_.sandbox.memory_limit, memory_bytes_)) {
        throw config::ConfigError("invalid memoryLimit '" + config_.sandbox.memory_limit + "'");
    }

    try {
        runtime_->Ping();
    } catch (const runtime::RuntimeError& ex) {
        utils::LogError("sandbox", "failed to connect to Docker daemon", {{"error", ex.what()}});
        throw ConnectivityError(std::string("Failed to connect to Docker daemon: ") + ex.what());
    }
    utils::LogInfo("sandbox", "connected to Docker daemon");

    if (config_.sandbox.pull_on_start) {
        ProvisionImages();
    }
    utils::LogInfo("sandbox", "engine ready", {
        {"memory_limit", config_.sandbox.memory_limit},
        {"cpu_limit", std::to_string(config_.sandbox.cpu_limit)},
        {"network_access", config_.sandbox.network_access ? "true" : "false"}
    });
}

void SandboxEngine::ProvisionImages() const {
    std::set<std::string> images;
    if (config_.sandbox.enable_python) {
        images.insert(config_.sandbox.python_image.name);
    }
    if (config_.sandbox.enable_bash) {
        images.insert(config_.sandbox.bash_image.name);
    }
    ImageProvisioner(*runtime_).Ensure(images);
}

ExecutionRequest SandboxEngine::MakeRequest(const config::ImageConfig& image,
                                            std::vector<PayloadFile> files,
                                            std::vector<std::string> commands) const {
    const auto& sandbox = config_.sandbox;
    ExecutionRequest request{};
    request.image = image;
    request.files = std::move(files);
    request.commands = std::move(commands);
    request.limits.memory_bytes = memory_bytes_;
    request.limits.cpu_share = sandbox.cpu_limit;
    request.time_limits.overall = std::chrono::seconds(sandbox.timeout_s);
    request.time_limits.per_command = std::chrono::seconds(sandbox.command_timeout_s);
    request.network_enabled = sandbox.network_access;
    request.max_output_size = sandbox.max_output_size;
    request.output_encoding = sandbox.output_encoding;
    request.non_root = sandbox.use_non_root_user;
    request.enforce_command_timeout = sandbox.enforce_command_timeout;
    request.working_dir = sandbox.workdir;
    return request;
}

ExecutionReport SandboxEngine::ExecutePython(const std::string& code,
                                             const std::vector<std::string>& requirements) const {
    // Any requirement at all, even a blank one, needs the network.
    if (!requirements.empty() && !config_.sandbox.network_access) {
        utils::LogWarn("sandbox", "package installation requested but network access is disabled");
        return {"Error: Cannot install requirements without network access", ReportStatus::kRejected};
    }

    std::vector<std::string> packages;
    for (const auto& requirement : requirements) {
        const auto trimmed = utils::Trim(requirement);
        if (!trimmed.empty()) {
            packages.push_back(trimmed);
        }
    }

    std::vector<PayloadFile> files = {{"main.py", code}};
    std::vector<std::string> commands;
    if (!packages.empty()) {
        utils::LogInfo("sandbox", "adding requirements", {{"packages", utils::Join(packages, ", ")}});
        files.push_back({"requirements.txt", utils::Join(packages, "\n")});
        commands.emplace_back("pip install --no-cache-dir -r requirements.txt");
    }
    commands.emplace_back("python main.py");
    return Execute(MakeRequest(config_.sandbox.python_image, std::move(files), std::move(commands)));
}

ExecutionReport SandboxEngine::ExecuteBash(const std::string& commands) const {
    return Execute(MakeRequest(
        config_.sandbox.bash_image,
        std::vector<PayloadFile>{{"script.sh", commands}},
        std::vector<std::string>{"chmod +x script.sh", "./script.sh"}));
}

ExecutionReport SandboxEngine::Execute(const ExecutionRequest& request) const {
    const auto start = pipeline_.Now();

    LaunchOptions options{};
    options.image = request.image;
    options.limits = request.limits;
    options.keep_alive = request.time_limits.overall;
    options.network_enabled = request.network_enabled;
    options.non_root = request.non_root;
    options.working_dir = request.working_dir;

    const auto launched = SandboxLauncher(*runtime_).Launch(options);
    if (!launched.ok()) {
        return {BoundOutput(launched.error->Describe(), request.max_output_size),
                ReportStatus::kLaunchFailed};
    }

    LifecycleGuard guard(*runtime_, *launched.environment, kStopGrace);
    return RunInEnvironment(request, guard.environment(), start);
}

ExecutionReport SandboxEngine::RunInEnvironment(const ExecutionRequest& request,
                                                const SandboxEnvironment& environment,
                                                std::chrono::steady_clock::time_point start) const {
    try {
        const auto archive = PayloadPackager::Pack(request.files);
        utils::LogInfo("sandbox", "copying files to container", {
            {"files", std::to_string(request.files.size())},
            {"bytes", std::to_string(archive.size())}
        });
        runtime_->PutArchive(environment.id, request.working_dir, archive);

        PipelineOptions options{};
        options.overall = request.time_limits.overall;
        options.per_command = request.time_limits.per_command;
        options.enforce_command_timeout = request.enforce_command_timeout;
        options.output_encoding = request.output_encoding;
        const auto result = pipeline_.Run(environment, request.commands, options, start);

        utils::LogInfo("sandbox", "pipeline finished", {
            {"commands", std::to_string(result.outcomes.size()) + "/" +
                         std::to_string(request.commands.size())},
            {"bytes", std::to_string(result.log.size())}
        });
        return {BoundOutput(result.log, request.max_output_size), ToReportStatus(result.stop)};
    } catch (const runtime::RuntimeError& ex) {
        utils::LogError("sandbox", "Docker API error", {{"error", ex.what()}});
        return {BoundOutput(std::string("Docker API error: ") + ex.what(), request.max_output_size),
                ReportStatus::kError};
    } catch (const std::exception& ex) {
        utils::LogError("sandbox", "unexpected error", {{"error", ex.what()}});
        return {BoundOutput(std::string("Error: ") + ex.what(), request.max_output_size),
                ReportStatus::kError};
    }
}

}  // namespace boxrun::sandbox
