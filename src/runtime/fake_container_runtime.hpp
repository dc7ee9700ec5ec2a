#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "runtime/container_runtime.hpp"

namespace boxrun::runtime {

// Scriptable in-memory runtime for tests. Commands are matched on the shell
// string passed to `sh -c`.
class FakeContainerRuntime : public ContainerRuntime {
public:
    struct ExecCall {
        std::string container_id;
        std::vector<std::string> argv;
        std::optional<std::chrono::milliseconds> timeout;
    };

    void Ping() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++ping_calls;
        if (ping_fails) {
            throw RuntimeError(RuntimeError::Kind::kUnreachable, "connection refused");
        }
    }

    void PullImage(const std::string& image) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pulled.push_back(image);
        if (pull_fails.count(image) > 0) {
            throw RuntimeError(RuntimeError::Kind::kNotFound, "pull " + image + ": manifest unknown");
        }
    }

    std::string CreateContainer(const ContainerSpec& spec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        created.push_back(spec);
        if (create_error) {
            throw RuntimeError(*create_error, "create container from " + spec.image + ": rejected");
        }
        if (create_encoding_fails) {
            throw std::domain_error("invalid UTF-8 byte in image name");
        }
        return "container" + std::to_string(created.size()) + "abcdef0123456789";
    }

    void PutArchive(const std::string& container_id,
                    const std::string& path,
                    const std::string& archive) override {
        std::lock_guard<std::mutex> lock(mutex_);
        archives.push_back({container_id, path, archive});
        if (put_archive_fails) {
            throw RuntimeError(RuntimeError::Kind::kApi, "upload archive: 500 disk full");
        }
    }

    ExecOutput Exec(const std::string& container_id,
                    const std::vector<std::string>& argv,
                    std::optional<std::chrono::milliseconds> timeout) override {
        std::function<void(const std::string&)> hook;
        ExecOutput output{0, "", ""};
        const std::string command = argv.size() == 3 ? argv[2] : std::string();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            execs.push_back({container_id, argv, timeout});
            hook = on_exec;
            auto it = exec_results.find(command);
            if (it != exec_results.end()) {
                output = it->second;
            }
        }
        if (hook) {
            hook(command);
        }
        if (exec_throws.count(command) > 0) {
            throw RuntimeError(RuntimeError::Kind::kApi, "exec start: connection reset");
        }
        if (exec_timeouts.count(command) > 0) {
            throw RuntimeError(RuntimeError::Kind::kTimeout, "command exceeded budget");
        }
        return output;
    }

    void StopContainer(const std::string& container_id, std::chrono::seconds grace) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped.push_back({container_id, grace});
        if (stop_fails) {
            throw RuntimeError(RuntimeError::Kind::kApi, "stop container: 500 busy");
        }
    }

    std::vector<std::string> ExecutedCommands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> commands;
        for (const auto& call : execs) {
            commands.push_back(call.argv.size() == 3 ? call.argv[2] : std::string());
        }
        return commands;
    }

    struct Upload {
        std::string container_id;
        std::string path;
        std::string archive;
    };

    // Scripting.
    bool ping_fails = false;
    std::set<std::string> pull_fails;
    std::optional<RuntimeError::Kind> create_error;
    // Fails create with an exception that is not a RuntimeError.
    bool create_encoding_fails = false;
    bool put_archive_fails = false;
    bool stop_fails = false;
    std::map<std::string, ExecOutput> exec_results;
    std::set<std::string> exec_throws;
    std::set<std::string> exec_timeouts;
    std::function<void(const std::string&)> on_exec;

    // Recorded calls.
    int ping_calls = 0;
    std::vector<std::string> pulled;
    std::vector<ContainerSpec> created;
    std::vector<Upload> archives;
    std::vector<ExecCall> execs;
    std::vector<std::pair<std::string, std::chrono::seconds>> stopped;

private:
    mutable std::mutex mutex_;
};

}  // namespace boxrun::runtime
