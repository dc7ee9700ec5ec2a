#include "tools/sandbox_tools.hpp"

#include <algorithm>
#include <memory>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace boxrun::tools {

std::vector<std::string> ParseRequirements(const std::string& value) {
    std::vector<std::string> packages;
    const auto trimmed = utils::Trim(value);
    if (trimmed.empty()) {
        return packages;
    }
    if (trimmed.front() == '[') {
        const auto parsed = nlohmann::json::parse(trimmed, nullptr, false);
        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                if (item.is_string() && !utils::Trim(item.get<std::string>()).empty()) {
                    packages.push_back(utils::Trim(item.get<std::string>()));
                }
            }
            return packages;
        }
    }
    std::string normalized = trimmed;
    for (auto& c : normalized) {
        if (c == ',') {
            c = '\n';
        }
    }
    std::istringstream lines(normalized);
    std::string line;
    while (std::getline(lines, line)) {
        line = utils::Trim(line);
        if (!line.empty()) {
            packages.push_back(line);
        }
    }
    return packages;
}

ExecutePythonTool::ExecutePythonTool(const sandbox::SandboxEngine& engine)
    : engine_(engine) {}

ToolDefinition ExecutePythonTool::Definition() {
    ToolDefinition def{};
    def.name = "execute_python";
    def.description = "Execute Python code in a sandboxed Docker container.";
    def.parameters_json = R"({"type":"object","properties":{"code":{"type":"string"},"requirements":{"type":"array","items":{"type":"string"}}},"required":["code"]})";
    return def;
}

std::string ExecutePythonTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    auto it = params.find("code");
    if (it == params.end()) {
        return "Error: missing code";
    }
    std::vector<std::string> requirements;
    auto req = params.find("requirements");
    if (req != params.end()) {
        requirements = ParseRequirements(req->second);
    }
    return engine_.ExecutePython(it->second, requirements).text;
}

ExecuteBashTool::ExecuteBashTool(const sandbox::SandboxEngine& engine)
    : engine_(engine) {}

ToolDefinition ExecuteBashTool::Definition() {
    ToolDefinition def{};
    def.name = "execute_bash";
    def.description = "Execute bash commands in a sandboxed Docker container.";
    def.parameters_json = R"({"type":"object","properties":{"commands":{"type":"string"}},"required":["commands"]})";
    return def;
}

std::string ExecuteBashTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    auto it = params.find("commands");
    if (it == params.end()) {
        return "Error: missing commands";
    }
    return engine_.ExecuteBash(it->second).text;
}

std::vector<ToolDefinition> SandboxToolDefinitions(const config::SandboxConfig& config) {
    std::vector<ToolDefinition> defs;
    if (config.enable_python) {
        defs.push_back(ExecutePythonTool::Definition());
    }
    if (config.enable_bash) {
        defs.push_back(ExecuteBashTool::Definition());
    }
    std::sort(defs.begin(), defs.end(), [](const ToolDefinition& a, const ToolDefinition& b) {
        return a.name < b.name;
    });
    return defs;
}

void RegisterSandboxTools(ToolRegistry& registry, const sandbox::SandboxEngine& engine) {
    const auto& sandbox = engine.config().sandbox;
    if (sandbox.enable_python) {
        registry.Register(std::make_unique<ExecutePythonTool>(engine));
    }
    if (sandbox.enable_bash) {
        registry.Register(std::make_unique<ExecuteBashTool>(engine));
    }
}

}  // namespace boxrun::tools
