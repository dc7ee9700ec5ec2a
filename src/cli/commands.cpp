#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config_loader.hpp"
#include "runtime/runtime_factory.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "tools/sandbox_tools.hpp"
#include "tools/tool_registry.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: boxrun [--config <path>] <command>\n"
              << "  python <file|-> [requirement...]  run a Python program\n"
              << "  bash <file|->                     run a shell script\n"
              << "  tools                             print tool definitions\n"
              << "  pull                              pull the configured images\n"
              << "  serve                             serve tools over HTTP" << std::endl;
}

bool ReadSource(const std::string& path, std::string& content) {
    if (path == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

nlohmann::json DefinitionsJson(const std::vector<boxrun::tools::ToolDefinition>& defs) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : defs) {
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    return json;
}

std::unordered_map<std::string, std::string> ParamsFromJson(const nlohmann::json& body) {
    std::unordered_map<std::string, std::string> params;
    for (const auto& [key, value] : body.items()) {
        params[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return params;
}

int RunServer(const boxrun::config::Config& config, boxrun::tools::ToolRegistry& registry) {
    httplib::Server http_server;
    http_server.Get("/tools", [&registry](const httplib::Request&, httplib::Response& res) {
        res.set_content(DefinitionsJson(registry.GetDefinitions()).dump(2), "application/json");
    });
    http_server.Post(R"(/tools/([A-Za-z0-9_]+))",
                     [&registry](const httplib::Request& req, httplib::Response& res) {
        const std::string name = req.matches[1];
        if (!registry.Has(name)) {
            res.status = 404;
            res.set_content("Error: Tool '" + name + "' not found", "text/plain");
            return;
        }
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (!body.is_object()) {
            res.status = 400;
            res.set_content("Error: request body must be a JSON object", "text/plain");
            return;
        }
        res.set_content(registry.Execute(name, ParamsFromJson(body)), "text/plain; charset=utf-8");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            boxrun::utils::LogError("serve", "failed to listen", {
                {"host", host},
                {"port", std::to_string(port)}
            });
            listen_failed.store(true);
        }
    });

    boxrun::utils::LogInfo("serve", "listening", {{"host", host}, {"port", std::to_string(port)}});
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;
    if (args.size() >= 2 && args[0] == "--config") {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    const auto command = args[0];

    boxrun::config::Config config;
    try {
        config = boxrun::config::LoadConfig(config_path);
    } catch (const boxrun::config::ConfigError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    boxrun::utils::LogConfig log_config{};
    if (!boxrun::utils::ParseLogLevel(config.log_level, log_config.min_level)) {
        std::cerr << "Invalid configuration: unknown logLevel '" << config.log_level << "'" << std::endl;
        return 1;
    }
    boxrun::utils::SetLogConfig(log_config);

    // Listing tools needs no daemon.
    if (command == "tools") {
        std::cout << DefinitionsJson(boxrun::tools::SandboxToolDefinitions(config.sandbox)).dump(2)
                  << std::endl;
        return 0;
    }

    // Only the commands that run something need the images up front.
    if (command != "serve" && command != "pull") {
        config.sandbox.pull_on_start = false;
    }
    if (command == "pull") {
        config.sandbox.pull_on_start = true;
    }

    std::unique_ptr<boxrun::sandbox::SandboxEngine> engine;
    try {
        engine = std::make_unique<boxrun::sandbox::SandboxEngine>(
            config, boxrun::runtime::CreateRuntime(config.runtime));
    } catch (const boxrun::sandbox::ConnectivityError& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    } catch (const boxrun::config::ConfigError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    boxrun::tools::ToolRegistry registry;
    boxrun::tools::RegisterSandboxTools(registry, *engine);

    if (command == "pull") {
        return 0;
    }
    if (command == "serve") {
        return RunServer(config, registry);
    }
    if ((command == "python" || command == "bash") && args.size() >= 2) {
        std::string source;
        if (!ReadSource(args[1], source)) {
            std::cerr << "Cannot read " << args[1] << std::endl;
            return 1;
        }
        if (command == "python" && !config.sandbox.enable_python) {
            std::cerr << "Python execution is disabled" << std::endl;
            return 1;
        }
        if (command == "bash" && !config.sandbox.enable_bash) {
            std::cerr << "Bash execution is disabled" << std::endl;
            return 1;
        }
        const auto report = command == "python"
            ? engine->ExecutePython(source, std::vector<std::string>(args.begin() + 2, args.end()))
            : engine->ExecuteBash(source);
        std::cout << report.text << std::endl;
        return report.ok() ? 0 : 1;
    }

    PrintUsage();
    return 1;
}
