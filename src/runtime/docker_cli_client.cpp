#include "runtime/docker_cli_client.hpp"

#include <iomanip>
#include <sstream>

#include "runtime/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace boxrun::runtime {
namespace {

constexpr auto kControlTimeout = std::chrono::seconds(60);
constexpr auto kPullTimeout = std::chrono::minutes(10);

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

RuntimeError ClassifyFailure(const std::string& what, const ProcessResult& result) {
    if (!result.spawn_error.empty()) {
        return RuntimeError(RuntimeError::Kind::kUnreachable, what + ": " + result.spawn_error);
    }
    if (result.timed_out) {
        return RuntimeError(RuntimeError::Kind::kTimeout, what + ": timed out");
    }
    const auto message = utils::Trim(result.error);
    if (Contains(message, "Cannot connect to the Docker daemon") ||
        Contains(message, "Is the docker daemon running")) {
        return RuntimeError(RuntimeError::Kind::kUnreachable, what + ": " + message);
    }
    if (Contains(message, "No such container") || Contains(message, "No such image") ||
        Contains(message, "Unable to find image") || Contains(message, "not found") ||
        Contains(message, "manifest unknown") || Contains(message, "does not exist")) {
        return RuntimeError(RuntimeError::Kind::kNotFound, what + ": " + message);
    }
    return RuntimeError(RuntimeError::Kind::kApi,
                        what + ": exit " + std::to_string(result.exit_code) + " " + message);
}

std::string FormatCpus(std::int64_t nano_cpus) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << static_cast<double>(nano_cpus) / 1e9;
    return out.str();
}

}  // namespace

DockerCliClient::DockerCliClient(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

std::vector<std::string> DockerCliClient::BuildRunArguments(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "--detach"};
    if (spec.auto_remove) {
        args.emplace_back("--rm");
    }
    if (!spec.user.empty()) {
        args.emplace_back("--user");
        args.push_back(spec.user);
    }
    if (spec.memory_bytes > 0) {
        args.emplace_back("--memory");
        args.push_back(std::to_string(spec.memory_bytes) + "b");
    }
    if (spec.nano_cpus > 0) {
        args.emplace_back("--cpus");
        args.push_back(FormatCpus(spec.nano_cpus));
    }
    if (!spec.network_enabled) {
        args.emplace_back("--network");
        args.emplace_back("none");
    }
    for (const auto& cap : spec.cap_drop) {
        args.emplace_back("--cap-drop");
        args.push_back(cap);
    }
    for (const auto& opt : spec.security_opt) {
        args.emplace_back("--security-opt");
        args.push_back(opt);
    }
    if (!spec.working_dir.empty()) {
        args.emplace_back("--workdir");
        args.push_back(spec.working_dir);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

void DockerCliClient::Ping() {
    const auto result = ProcessRunner::Run(
        {docker_binary_, "version", "--format", "{{.Server.Version}}"}, "", kControlTimeout);
    if (!result.spawn_error.empty() || result.exit_code != 0) {
        auto error = ClassifyFailure("docker version", result);
        throw RuntimeError(RuntimeError::Kind::kUnreachable, error.what());
    }
    utils::LogDebug("docker", "server version", {{"version", utils::Trim(result.output)}});
}

void DockerCliClient::PullImage(const std::string& image) {
    const auto result = ProcessRunner::Run(
        {docker_binary_, "pull", "--quiet", image}, "", kPullTimeout);
    if (!result.spawn_error.empty() || result.exit_code != 0) {
        throw ClassifyFailure("pull " + image, result);
    }
}

std::string DockerCliClient::CreateContainer(const ContainerSpec& spec) {
    auto argv = BuildRunArguments(spec);
    argv.insert(argv.begin(), docker_binary_);
    const auto result = ProcessRunner::Run(argv, "", kControlTimeout);
    if (!result.spawn_error.empty() || result.exit_code != 0) {
        throw ClassifyFailure("create container from " + spec.image, result);
    }
    const auto id = utils::Trim(result.output);
    if (id.empty()) {
        throw RuntimeError(RuntimeError::Kind::kApi, "create container: no id printed");
    }
    return id;
}

void DockerCliClient::PutArchive(const std::string& container_id,
                                 const std::string& path,
                                 const std::string& archive) {
    const auto result = ProcessRunner::Run(
        {docker_binary_, "cp", "-", container_id + ":" + path}, archive, kControlTimeout);
    if (!result.spawn_error.empty() || result.exit_code != 0) {
        throw ClassifyFailure("upload archive", result);
    }
}

ExecOutput DockerCliClient::Exec(const std::string& container_id,
                                 const std::vector<std::string>& argv,
                                 std::optional<std::chrono::milliseconds> timeout) {
    std::vector<std::string> command = {docker_binary_, "exec", container_id};
    command.insert(command.end(), argv.begin(), argv.end());
    const auto result = ProcessRunner::Run(command, "", timeout);
    if (!result.spawn_error.empty() || result.timed_out) {
        throw ClassifyFailure("exec", result);
    }
    // The client reports its own failures with this prefix; anything else is
    // the command's exit status.
    if (result.exit_code != 0 && result.error.rfind("Error response from daemon:", 0) == 0) {
        throw ClassifyFailure("exec", result);
    }
    ExecOutput output{};
    output.exit_code = result.exit_code;
    output.stdout_bytes = result.output;
    output.stderr_bytes = result.error;
    return output;
}

void DockerCliClient::StopContainer(const std::string& container_id,
                                    std::chrono::seconds grace) {
    const auto result = ProcessRunner::Run(
        {docker_binary_, "stop", "--time", std::to_string(grace.count()), container_id},
        "", grace + kControlTimeout);
    if (!result.spawn_error.empty() || result.exit_code != 0) {
        if (Contains(result.error, "No such container")) {
            return;
        }
        throw ClassifyFailure("stop container " + container_id.substr(0, 12), result);
    }
}

}  // namespace boxrun::runtime
