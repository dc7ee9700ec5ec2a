#pragma once

#include <string>

#include "runtime/container_runtime.hpp"

namespace boxrun::runtime {

// Drives the same contract through the docker command line client, for hosts
// where the engine socket is not directly reachable.
class DockerCliClient : public ContainerRuntime {
public:
    explicit DockerCliClient(std::string docker_binary);

    void Ping() override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void PutArchive(const std::string& container_id,
                    const std::string& path,
                    const std::string& archive) override;
    ExecOutput Exec(const std::string& container_id,
                    const std::vector<std::string>& argv,
                    std::optional<std::chrono::milliseconds> timeout) override;
    void StopContainer(const std::string& container_id,
                       std::chrono::seconds grace) override;

    // Arguments passed to `docker` for |spec|, without the binary itself.
    static std::vector<std::string> BuildRunArguments(const ContainerSpec& spec);

private:
    std::string docker_binary_;
};

}  // namespace boxrun::runtime
