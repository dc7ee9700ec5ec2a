#include "runtime/runtime_factory.hpp"

#include "runtime/docker_api_client.hpp"
#include "runtime/docker_cli_client.hpp"

namespace boxrun::runtime {

std::unique_ptr<ContainerRuntime> CreateRuntime(const config::RuntimeConfig& config) {
    switch (config.backend) {
        case config::RuntimeBackend::kCli:
            return std::make_unique<DockerCliClient>(config.docker_binary);
        case config::RuntimeBackend::kApi:
            break;
    }
    return std::make_unique<DockerApiClient>(config.socket_path, config.api_version);
}

}  // namespace boxrun::runtime
