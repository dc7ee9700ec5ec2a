#pragma once

#include <string>

#include "runtime/container_runtime.hpp"

namespace boxrun::runtime {

// Talks to the Docker Engine API over its unix socket. Every call opens its
// own connection, so one instance can serve concurrent requests.
class DockerApiClient : public ContainerRuntime {
public:
    DockerApiClient(std::string socket_path, std::string api_version);

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

private:
    std::string Endpoint(const std::string& path) const;
    void RemoveContainer(const std::string& container_id);

    std::string socket_path_;
    std::string api_version_;
};

// Splits "registry:5000/repo/name:tag" into repository and tag; the tag
// defaults to "latest" and a digest reference is kept whole.
void SplitImageReference(const std::string& image, std::string& repository, std::string& tag);

}  // namespace boxrun::runtime
