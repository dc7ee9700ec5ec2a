#include "config/config_loader.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace boxrun::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".boxrun" / "config.json";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (!source.contains(key) || !source[key].is_number_integer()) {
        return;
    }
    const auto value = source[key].get<long long>();
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be positive");
    }
    target = static_cast<std::size_t>(value);
}

void ReadFamily(const nlohmann::json& source, const char* key, ImageFamily& target) {
    if (!source.contains(key) || !source[key].is_string()) {
        return;
    }
    const auto value = source[key].get<std::string>();
    if (!ParseImageFamily(value, target)) {
        throw ConfigError(std::string("unknown image family '") + value + "' for " + key);
    }
}

RuntimeBackend ParseBackend(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "api") {
        return RuntimeBackend::kApi;
    }
    if (lowered == "cli") {
        return RuntimeBackend::kCli;
    }
    throw ConfigError("unknown runtime backend '" + value + "'");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(name + " is not an integer: " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not an integer: " + value);
    }
}

double ParseDouble(const std::string& name, const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not a number: " + value);
    }
}

}  // namespace

const char* ToString(ImageFamily family) {
    switch (family) {
        case ImageFamily::kInterpreter: return "interpreter";
        case ImageFamily::kSystem: return "system";
    }
    return "unknown";
}

bool ParseImageFamily(const std::string& value, ImageFamily& family) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "interpreter") {
        family = ImageFamily::kInterpreter;
        return true;
    }
    if (lowered == "system") {
        family = ImageFamily::kSystem;
        return true;
    }
    return false;
}

bool ParseMemoryLimit(const std::string& value, std::int64_t& bytes) {
    const auto trimmed = utils::ToLower(utils::Trim(value));
    if (trimmed.empty()) {
        return false;
    }
    std::int64_t multiplier = 1;
    std::string digits = trimmed;
    switch (trimmed.back()) {
        case 'b': multiplier = 1; digits.pop_back(); break;
        case 'k': multiplier = 1024; digits.pop_back(); break;
        case 'm': multiplier = 1024LL * 1024; digits.pop_back(); break;
        case 'g': multiplier = 1024LL * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }
    if (digits.empty()) {
        return false;
    }
    for (const char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (digits.size() > 15) {
        return false;
    }
    const auto amount = std::stoll(digits);
    if (amount <= 0 || amount > std::numeric_limits<std::int64_t>::max() / multiplier) {
        return false;
    }
    bytes = amount * multiplier;
    return true;
}

bool IsSupportedEncoding(const std::string& encoding) {
    const auto lowered = utils::ToLower(encoding);
    return lowered == "utf-8" || lowered == "utf8" ||
        lowered == "latin-1" || lowered == "latin1" || lowered == "iso-8859-1" ||
        lowered == "ascii" || lowered == "us-ascii";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "logLevel", config.log_level);

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        auto& target = config.sandbox;
        ReadString(sandbox, "pythonImage", target.python_image.name);
        ReadFamily(sandbox, "pythonImageFamily", target.python_image.family);
        ReadString(sandbox, "bashImage", target.bash_image.name);
        ReadFamily(sandbox, "bashImageFamily", target.bash_image.family);
        ReadString(sandbox, "memoryLimit", target.memory_limit);
        ReadDouble(sandbox, "cpuLimit", target.cpu_limit);
        ReadInt(sandbox, "timeoutS", target.timeout_s);
        ReadInt(sandbox, "commandTimeoutS", target.command_timeout_s);
        ReadBool(sandbox, "networkAccess", target.network_access);
        ReadSize(sandbox, "maxOutputSize", target.max_output_size);
        ReadString(sandbox, "outputEncoding", target.output_encoding);
        ReadBool(sandbox, "useNonRootUser", target.use_non_root_user);
        ReadBool(sandbox, "enablePython", target.enable_python);
        ReadBool(sandbox, "enableBash", target.enable_bash);
        ReadBool(sandbox, "enforceCommandTimeout", target.enforce_command_timeout);
        ReadString(sandbox, "workdir", target.workdir);
        ReadBool(sandbox, "pullOnStart", target.pull_on_start);
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        if (runtime.contains("backend") && runtime["backend"].is_string()) {
            config.runtime.backend = ParseBackend(runtime["backend"].get<std::string>());
        }
        ReadString(runtime, "socketPath", config.runtime.socket_path);
        ReadString(runtime, "dockerBinary", config.runtime.docker_binary);
        ReadString(runtime, "apiVersion", config.runtime.api_version);
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
    }
}

void ApplyConfigFromEnv(Config& config) {
    auto& sandbox = config.sandbox;

    const auto log_level = utils::GetEnv("BOXRUN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    const auto python_image = GetEnvFallback(
        "BOXRUN_SANDBOX__PYTHON_IMAGE",
        "BOXRUN_SANDBOX_PYTHON_IMAGE");
    if (!python_image.empty()) {
        sandbox.python_image.name = python_image;
    }

    const auto bash_image = GetEnvFallback(
        "BOXRUN_SANDBOX__BASH_IMAGE",
        "BOXRUN_SANDBOX_BASH_IMAGE");
    if (!bash_image.empty()) {
        sandbox.bash_image.name = bash_image;
    }

    const auto memory_limit = GetEnvFallback(
        "BOXRUN_SANDBOX__MEMORY_LIMIT",
        "BOXRUN_SANDBOX_MEMORY_LIMIT");
    if (!memory_limit.empty()) {
        sandbox.memory_limit = memory_limit;
    }

    const auto cpu_limit = GetEnvFallback(
        "BOXRUN_SANDBOX__CPU_LIMIT",
        "BOXRUN_SANDBOX_CPU_LIMIT");
    if (!cpu_limit.empty()) {
        sandbox.cpu_limit = ParseDouble("BOXRUN_SANDBOX_CPU_LIMIT", cpu_limit);
    }

    const auto timeout = GetEnvFallback(
        "BOXRUN_SANDBOX__TIMEOUT_S",
        "BOXRUN_SANDBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        sandbox.timeout_s = ParseInt("BOXRUN_SANDBOX_TIMEOUT_S", timeout);
    }

    const auto command_timeout = GetEnvFallback(
        "BOXRUN_SANDBOX__COMMAND_TIMEOUT_S",
        "BOXRUN_SANDBOX_COMMAND_TIMEOUT_S");
    if (!command_timeout.empty()) {
        sandbox.command_timeout_s = ParseInt("BOXRUN_SANDBOX_COMMAND_TIMEOUT_S", command_timeout);
    }

    const auto network_access = GetEnvFallback(
        "BOXRUN_SANDBOX__NETWORK_ACCESS",
        "BOXRUN_SANDBOX_NETWORK_ACCESS");
    if (!network_access.empty()) {
        sandbox.network_access = ParseBool(network_access);
    }

    const auto max_output_size = GetEnvFallback(
        "BOXRUN_SANDBOX__MAX_OUTPUT_SIZE",
        "BOXRUN_SANDBOX_MAX_OUTPUT_SIZE");
    if (!max_output_size.empty()) {
        const auto value = ParseInt("BOXRUN_SANDBOX_MAX_OUTPUT_SIZE", max_output_size);
        if (value <= 0) {
            throw ConfigError("BOXRUN_SANDBOX_MAX_OUTPUT_SIZE must be positive");
        }
        sandbox.max_output_size = static_cast<std::size_t>(value);
    }

    const auto output_encoding = GetEnvFallback(
        "BOXRUN_SANDBOX__OUTPUT_ENCODING",
        "BOXRUN_SANDBOX_OUTPUT_ENCODING");
    if (!output_encoding.empty()) {
        sandbox.output_encoding = output_encoding;
    }

    const auto non_root = GetEnvFallback(
        "BOXRUN_SANDBOX__USE_NON_ROOT_USER",
        "BOXRUN_SANDBOX_USE_NON_ROOT_USER");
    if (!non_root.empty()) {
        sandbox.use_non_root_user = ParseBool(non_root);
    }

    const auto enforce_timeout = GetEnvFallback(
        "BOXRUN_SANDBOX__ENFORCE_COMMAND_TIMEOUT",
        "BOXRUN_SANDBOX_ENFORCE_COMMAND_TIMEOUT");
    if (!enforce_timeout.empty()) {
        sandbox.enforce_command_timeout = ParseBool(enforce_timeout);
    }

    const auto backend = GetEnvFallback(
        "BOXRUN_RUNTIME__BACKEND",
        "BOXRUN_RUNTIME_BACKEND");
    if (!backend.empty()) {
        config.runtime.backend = ParseBackend(backend);
    }

    const auto socket_path = GetEnvFallback(
        "BOXRUN_RUNTIME__SOCKET_PATH",
        "BOXRUN_RUNTIME_SOCKET_PATH");
    if (!socket_path.empty()) {
        config.runtime.socket_path = socket_path;
    }

    const auto docker_binary = GetEnvFallback(
        "BOXRUN_RUNTIME__DOCKER_BINARY",
        "BOXRUN_RUNTIME_DOCKER_BINARY");
    if (!docker_binary.empty()) {
        config.runtime.docker_binary = docker_binary;
    }

    const auto server_port = GetEnvFallback(
        "BOXRUN_SERVER__PORT",
        "BOXRUN_SERVER_PORT");
    if (!server_port.empty()) {
        config.server.port = ParseInt("BOXRUN_SERVER_PORT", server_port);
    }
}

void ValidateConfig(const Config& config) {
    const auto& sandbox = config.sandbox;
    if (sandbox.python_image.name.empty()) {
        throw ConfigError("pythonImage must not be empty");
    }
    if (sandbox.bash_image.name.empty()) {
        throw ConfigError("bashImage must not be empty");
    }
    std::int64_t memory_bytes = 0;
    if (!ParseMemoryLimit(sandbox.memory_limit, memory_bytes)) {
        throw ConfigError("invalid memoryLimit '" + sandbox.memory_limit + "'");
    }
    if (!(sandbox.cpu_limit > 0.0) || !std::isfinite(sandbox.cpu_limit)) {
        throw ConfigError("cpuLimit must be positive");
    }
    if (sandbox.timeout_s <= 0) {
        throw ConfigError("timeoutS must be positive");
    }
    if (sandbox.command_timeout_s <= 0) {
        throw ConfigError("commandTimeoutS must be positive");
    }
    if (sandbox.max_output_size == 0) {
        throw ConfigError("maxOutputSize must be positive");
    }
    if (!IsSupportedEncoding(sandbox.output_encoding)) {
        throw ConfigError("unsupported outputEncoding '" + sandbox.output_encoding + "'");
    }
    if (sandbox.workdir.empty() || sandbox.workdir.front() != '/') {
        throw ConfigError("workdir must be an absolute path");
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        throw ConfigError("server port out of range");
    }
    utils::LogLevel level{};
    if (!utils::ParseLogLevel(config.log_level, level)) {
        throw ConfigError("unknown logLevel '" + config.log_level + "'");
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    const auto config_path = path.empty() ? GetConfigPath() : path;
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            throw ConfigError("cannot open " + config_path.string());
        }
        nlohmann::json data;
        try {
            input >> data;
        } catch (const nlohmann::json::parse_error& ex) {
            throw ConfigError("invalid JSON in " + config_path.string() + ": " + ex.what());
        }
        ApplyConfigFromJson(config, data);
    } else if (!path.empty()) {
        throw ConfigError("config file not found: " + config_path.string());
    }

    ApplyConfigFromEnv(config);
    ValidateConfig(config);
    return config;
}

}  // namespace boxrun::config
