#include "sandbox/sandbox_launcher.hpp"

#include <cmath>
#include <stdexcept>

#include "utils/logging.hpp"

namespace boxrun::sandbox {
namespace {

struct UserPolicy {
    config::ImageFamily family;
    const char* non_root_user;
};

constexpr UserPolicy kUserPolicies[] = {
    {config::ImageFamily::kInterpreter, "1000"},
    {config::ImageFamily::kSystem, ""},
};

LaunchError::Kind ClassifyLaunchFailure(runtime::RuntimeError::Kind kind) {
    switch (kind) {
        case runtime::RuntimeError::Kind::kUnreachable:
            return LaunchError::Kind::kDaemonUnreachable;
        case runtime::RuntimeError::Kind::kNotFound:
            return LaunchError::Kind::kImageNotFound;
        case runtime::RuntimeError::Kind::kApi:
        case runtime::RuntimeError::Kind::kTimeout:
            break;
    }
    return LaunchError::Kind::kRejected;
}

}  // namespace

SandboxLauncher::SandboxLauncher(runtime::ContainerRuntime& runtime)
    : runtime_(runtime) {}

std::string SandboxLauncher::ResolveUser(config::ImageFamily family, bool non_root) {
    if (!non_root) {
        return {};
    }
    for (const auto& policy : kUserPolicies) {
        if (policy.family == family) {
            return policy.non_root_user;
        }
    }
    return {};
}

runtime::ContainerSpec SandboxLauncher::BuildSpec(const LaunchOptions& options) {
    runtime::ContainerSpec spec{};
    spec.image = options.image.name;
    spec.command = {"sleep", std::to_string(options.keep_alive.count())};
    spec.user = ResolveUser(options.image.family, options.non_root);
    spec.memory_bytes = options.limits.memory_bytes;
    spec.nano_cpus = static_cast<std::int64_t>(std::llround(options.limits.cpu_share * 1e9));
    spec.network_enabled = options.network_enabled;
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges"};
    spec.auto_remove = true;
    spec.working_dir = options.working_dir;
    return spec;
}

LaunchResult SandboxLauncher::Launch(const LaunchOptions& options) const {
    LaunchResult result{};
    auto spec = BuildSpec(options);
    utils::LogInfo("sandbox", "creating container", {
        {"image", spec.image},
        {"user", spec.user.empty() ? "(image default)" : spec.user},
        {"network", spec.network_enabled ? "on" : "off"},
        {"memory", std::to_string(spec.memory_bytes)}
    });
    try {
        SandboxEnvironment environment{};
        environment.id = runtime_.CreateContainer(spec);
        environment.user = spec.user;
        environment.policy = std::move(spec);
        result.environment = std::move(environment);
    } catch (const runtime::RuntimeError& ex) {
        LaunchError error{};
        error.kind = ClassifyLaunchFailure(ex.kind());
        error.message = ex.what();
        utils::LogError("sandbox", "launch failed", {
            {"image", options.image.name},
            {"kind", runtime::ToString(ex.kind())},
            {"error", ex.what()}
        });
        result.error = std::move(error);
    } catch (const std::exception& ex) {
        // Malformed requests (e.g. a spec the client cannot encode) never
        // reach the daemon.
        LaunchError error{};
        error.kind = LaunchError::Kind::kRejected;
        error.message = ex.what();
        utils::LogError("sandbox", "launch failed", {
            {"image", options.image.name},
            {"error", ex.what()}
        });
        result.error = std::move(error);
    }
    return result;
}

}  // namespace boxrun::sandbox
