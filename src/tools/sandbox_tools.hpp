#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "tools/tool.hpp"
#include "tools/tool_registry.hpp"

namespace boxrun::tools {

class ExecutePythonTool : public Tool {
public:
    explicit ExecutePythonTool(const sandbox::SandboxEngine& engine);

    static ToolDefinition Definition();

    std::string Name() const override { return Definition().name; }
    std::string Description() const override { return Definition().description; }
    std::string ParametersJson() const override { return Definition().parameters_json; }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    const sandbox::SandboxEngine& engine_;
};

class ExecuteBashTool : public Tool {
public:
    explicit ExecuteBashTool(const sandbox::SandboxEngine& engine);

    static ToolDefinition Definition();

    std::string Name() const override { return Definition().name; }
    std::string Description() const override { return Definition().description; }
    std::string ParametersJson() const override { return Definition().parameters_json; }
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    const sandbox::SandboxEngine& engine_;
};

// Accepts a JSON array of strings, or one package per line or comma.
std::vector<std::string> ParseRequirements(const std::string& value);

// Definitions of the tools |config| enables, sorted by name. Needs no
// engine, so no daemon either.
std::vector<ToolDefinition> SandboxToolDefinitions(const config::SandboxConfig& config);

// Registers the tools enabled in the engine's configuration.
void RegisterSandboxTools(ToolRegistry& registry, const sandbox::SandboxEngine& engine);

}  // namespace boxrun::tools
