#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace boxrun::runtime {

class RuntimeError : public std::runtime_error {
public:
    enum class Kind {
        kUnreachable,
        kNotFound,
        kApi,
        kTimeout
    };

    RuntimeError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* ToString(RuntimeError::Kind kind);

struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    // Empty means the image's default user.
    std::string user;
    std::int64_t memory_bytes = 0;
    std::int64_t nano_cpus = 0;
    bool network_enabled = false;
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;
    bool auto_remove = true;
    std::string working_dir;
};

struct ExecOutput {
    int exit_code = -1;
    std::string stdout_bytes;
    std::string stderr_bytes;
};

// Container runtime service consumed by the sandbox. Implementations must be
// safe to call from several request threads at once; every call works on a
// container owned by exactly one request.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual void Ping() = 0;
    virtual void PullImage(const std::string& image) = 0;
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    virtual void PutArchive(const std::string& container_id,
                            const std::string& path,
                            const std::string& archive) = 0;
    // |timeout| of std::nullopt waits for the command however long it runs.
    virtual ExecOutput Exec(const std::string& container_id,
                            const std::vector<std::string>& argv,
                            std::optional<std::chrono::milliseconds> timeout) = 0;
    virtual void StopContainer(const std::string& container_id,
                               std::chrono::seconds grace) = 0;
};

}  // namespace boxrun::runtime
