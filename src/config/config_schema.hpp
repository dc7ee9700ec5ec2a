#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace boxrun::config {

// Image family decides which identity a non-root request runs as.
enum class ImageFamily {
    kInterpreter,
    kSystem
};

enum class RuntimeBackend {
    kApi,
    kCli
};

struct ImageConfig {
    std::string name;
    ImageFamily family = ImageFamily::kSystem;
};

struct SandboxConfig {
    ImageConfig python_image{"python:3.12-slim", ImageFamily::kInterpreter};
    ImageConfig bash_image{"alpine:latest", ImageFamily::kSystem};
    std::string memory_limit = "512m";
    double cpu_limit = 1.0;
    int timeout_s = 30;
    int command_timeout_s = 25;
    bool network_access = false;
    std::size_t max_output_size = 10 * 1024;
    std::string output_encoding = "utf-8";
    bool use_non_root_user = true;
    bool enable_python = true;
    bool enable_bash = true;
    bool enforce_command_timeout = true;
    std::string workdir = "/";
    bool pull_on_start = true;
};

struct RuntimeConfig {
    RuntimeBackend backend = RuntimeBackend::kApi;
    std::string socket_path = "/var/run/docker.sock";
    std::string docker_binary = "docker";
    std::string api_version = "v1.41";
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct Config {
    SandboxConfig sandbox;
    RuntimeConfig runtime;
    ServerConfig server;
    std::string log_level = "INFO";
};

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace boxrun::config
