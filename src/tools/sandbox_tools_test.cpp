#include "tools/sandbox_tools.hpp"

#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/fake_container_runtime.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using boxrun::config::Config;
using boxrun::runtime::ExecOutput;
using boxrun::runtime::FakeContainerRuntime;
using boxrun::sandbox::SandboxEngine;
using boxrun::tools::ParseRequirements;
using boxrun::tools::RegisterSandboxTools;
using boxrun::tools::SandboxToolDefinitions;
using boxrun::tools::ToolRegistry;

class SandboxToolsTest : public ::testing::Test {
protected:
    void Build() {
        auto runtime = std::make_unique<FakeContainerRuntime>();
        runtime_ = runtime.get();
        config_.sandbox.pull_on_start = false;
        engine_ = std::make_unique<SandboxEngine>(config_, std::move(runtime));
        RegisterSandboxTools(registry_, *engine_);
    }

    Config config_;
    FakeContainerRuntime* runtime_ = nullptr;
    std::unique_ptr<SandboxEngine> engine_;
    ToolRegistry registry_;
};

TEST(ParseRequirements, JsonArray) {
    EXPECT_THAT(ParseRequirements(R"(["numpy", " pandas ", ""])"), ElementsAre("numpy", "pandas"));
}

TEST(ParseRequirements, CommaAndNewlineLists) {
    EXPECT_THAT(ParseRequirements("numpy, requests\nflask==3.0\n"),
                ElementsAre("numpy", "requests", "flask==3.0"));
}

TEST(ParseRequirements, Empty) {
    EXPECT_TRUE(ParseRequirements("").empty());
    EXPECT_TRUE(ParseRequirements("  \n ").empty());
    EXPECT_TRUE(ParseRequirements("[]").empty());
}

TEST_F(SandboxToolsTest, RegistersEnabledTools) {
    Build();
    EXPECT_THAT(registry_.List(), ElementsAre("execute_bash", "execute_python"));
    const auto definitions = registry_.GetDefinitions();
    ASSERT_EQ(definitions.size(), 2u);
    EXPECT_THAT(definitions[1].parameters_json, HasSubstr("\"code\""));
}

TEST_F(SandboxToolsTest, DisabledToolIsNotRegistered) {
    config_.sandbox.enable_bash = false;
    Build();
    EXPECT_FALSE(registry_.Has("execute_bash"));
    EXPECT_TRUE(registry_.Has("execute_python"));
    EXPECT_EQ(registry_.Execute("execute_bash", {{"commands", "ls"}}),
              "Error: Tool 'execute_bash' not found");
}

TEST(SandboxToolDefinitions, ListedFromConfigAlone) {
    boxrun::config::SandboxConfig config;
    config.enable_bash = false;
    const auto defs = SandboxToolDefinitions(config);
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].name, "execute_python");
    EXPECT_THAT(defs[0].parameters_json, HasSubstr("\"requirements\""));
}

TEST_F(SandboxToolsTest, DefinitionsMatchRegisteredTools) {
    Build();
    const auto listed = SandboxToolDefinitions(config_.sandbox);
    const auto registered = registry_.GetDefinitions();
    ASSERT_EQ(listed.size(), registered.size());
    for (std::size_t i = 0; i < listed.size(); ++i) {
        EXPECT_EQ(listed[i].name, registered[i].name);
        EXPECT_EQ(listed[i].description, registered[i].description);
        EXPECT_EQ(listed[i].parameters_json, registered[i].parameters_json);
    }
    EXPECT_EQ(runtime_->ping_calls, 1);
}

TEST_F(SandboxToolsTest, MissingParameters) {
    Build();
    EXPECT_EQ(registry_.Execute("execute_python", {}), "Error: missing code");
    EXPECT_EQ(registry_.Execute("execute_bash", {}), "Error: missing commands");
    EXPECT_TRUE(runtime_->created.empty());
}

TEST_F(SandboxToolsTest, ExecutesBash) {
    Build();
    runtime_->exec_results["./script.sh"] = ExecOutput{0, "done\n", ""};
    EXPECT_EQ(registry_.Execute("execute_bash", {{"commands", "echo done"}}), "done\n");
}

TEST_F(SandboxToolsTest, PythonRequirementsNeedNetwork) {
    Build();
    const auto text = registry_.Execute("execute_python", {
        {"code", "import numpy"},
        {"requirements", R"(["numpy"])"}
    });
    EXPECT_EQ(text, "Error: Cannot install requirements without network access");
    EXPECT_TRUE(runtime_->created.empty());
}

}  // namespace
