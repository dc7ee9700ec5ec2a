#include "tools/tool_registry.hpp"

#include "utils/logging.hpp"

namespace boxrun::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    utils::LogInfo("tool", "registered", {{"name", name}});
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& [name, tool] : tools_) {
        ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    return defs;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        return "Error: Tool '" + name + "' not found";
    }
    utils::LogFields fields = {{"name", name}};
    for (const auto& [key, value] : params) {
        fields.emplace_back(key, std::to_string(value.size()) + "B");
    }
    utils::LogInfo("tool", "start", std::move(fields));
    const auto result = tool->Execute(params);
    utils::LogInfo("tool", "end", {{"name", name}, {"size", std::to_string(result.size())}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace boxrun::tools
