#include "sandbox/sandbox_engine.hpp"

#include <map>
#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/fake_container_runtime.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

using boxrun::config::Config;
using boxrun::config::ConfigError;
using boxrun::runtime::ExecOutput;
using boxrun::runtime::FakeContainerRuntime;
using boxrun::runtime::RuntimeError;
using boxrun::sandbox::ConnectivityError;
using boxrun::sandbox::ReportStatus;
using boxrun::sandbox::SandboxEngine;

class SandboxEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<SandboxEngine> MakeEngine() {
        auto runtime = std::make_unique<FakeContainerRuntime>();
        runtime_ = runtime.get();
        runtime_->exec_results = scripted_;
        return std::make_unique<SandboxEngine>(config_, std::move(runtime), [this] { return now_; });
    }

    Config config_;
    std::map<std::string, ExecOutput> scripted_;
    FakeContainerRuntime* runtime_ = nullptr;
    std::chrono::steady_clock::time_point now_{};
};

TEST_F(SandboxEngineTest, RejectsNullRuntime) {
    EXPECT_THROW({ SandboxEngine engine(config_, nullptr); }, std::invalid_argument);
}

TEST_F(SandboxEngineTest, RejectsInvalidConfig) {
    config_.sandbox.cpu_limit = 0.0;
    EXPECT_THROW(MakeEngine(), ConfigError);
}

TEST_F(SandboxEngineTest, UnreachableDaemonFailsConstruction) {
    auto runtime = std::make_unique<FakeContainerRuntime>();
    runtime->ping_fails = true;
    try {
        SandboxEngine engine(config_, std::move(runtime));
        FAIL() << "expected ConnectivityError";
    } catch (const ConnectivityError& ex) {
        EXPECT_THAT(ex.what(), StartsWith("Failed to connect to Docker daemon: "));
    }
}

TEST_F(SandboxEngineTest, PullsEnabledImagesOnStart) {
    config_.sandbox.enable_bash = false;
    auto engine = MakeEngine();
    EXPECT_EQ(runtime_->ping_calls, 1);
    EXPECT_THAT(runtime_->pulled, ElementsAre("python:3.12-slim"));
}

TEST_F(SandboxEngineTest, SkipsPullWhenDisabled) {
    config_.sandbox.pull_on_start = false;
    auto engine = MakeEngine();
    EXPECT_TRUE(runtime_->pulled.empty());
}

TEST_F(SandboxEngineTest, RunsPythonProgram) {
    scripted_["python main.py"] = ExecOutput{0, "hello\n", ""};
    auto engine = MakeEngine();

    const auto report = engine->ExecutePython("print('hello')", {});
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.text, "hello\n");
    EXPECT_THAT(runtime_->ExecutedCommands(), ElementsAre("python main.py"));

    ASSERT_EQ(runtime_->created.size(), 1u);
    EXPECT_EQ(runtime_->created[0].image, "python:3.12-slim");
    EXPECT_EQ(runtime_->created[0].user, "1000");
    EXPECT_FALSE(runtime_->created[0].network_enabled);
    EXPECT_EQ(runtime_->created[0].memory_bytes, 512LL * 1024 * 1024);

    ASSERT_EQ(runtime_->archives.size(), 1u);
    EXPECT_EQ(runtime_->archives[0].path, "/");
    EXPECT_THAT(runtime_->archives[0].archive, HasSubstr("main.py"));
    EXPECT_THAT(runtime_->archives[0].archive, HasSubstr("print('hello')"));

    ASSERT_EQ(runtime_->stopped.size(), 1u);
    EXPECT_EQ(runtime_->stopped[0].first, runtime_->archives[0].container_id);
}

TEST_F(SandboxEngineTest, RequirementsNeedNetwork) {
    auto engine = MakeEngine();
    const auto report = engine->ExecutePython("import numpy", {"numpy"});
    EXPECT_EQ(report.status, ReportStatus::kRejected);
    EXPECT_THAT(report.text, HasSubstr("network"));
    EXPECT_TRUE(runtime_->created.empty());
    EXPECT_TRUE(runtime_->stopped.empty());
}

TEST_F(SandboxEngineTest, BlankRequirementsStillNeedNetwork) {
    auto engine = MakeEngine();
    const auto report = engine->ExecutePython("print(1)", {" "});
    EXPECT_EQ(report.status, ReportStatus::kRejected);
    EXPECT_THAT(report.text, HasSubstr("network"));
    EXPECT_TRUE(runtime_->created.empty());
    EXPECT_TRUE(runtime_->execs.empty());
}

TEST_F(SandboxEngineTest, BlankRequirementsSkipInstallWithNetwork) {
    config_.sandbox.network_access = true;
    auto engine = MakeEngine();
    const auto report = engine->ExecutePython("print(1)", {"  ", ""});
    EXPECT_TRUE(report.ok());
    EXPECT_THAT(runtime_->ExecutedCommands(), ElementsAre("python main.py"));
}

TEST_F(SandboxEngineTest, InstallsRequirementsWithNetwork) {
    config_.sandbox.network_access = true;
    auto engine = MakeEngine();
    const auto report = engine->ExecutePython("import numpy", {" numpy ", "requests"});
    EXPECT_TRUE(report.ok());
    EXPECT_THAT(runtime_->ExecutedCommands(),
                ElementsAre("pip install --no-cache-dir -r requirements.txt", "python main.py"));
    ASSERT_EQ(runtime_->archives.size(), 1u);
    EXPECT_THAT(runtime_->archives[0].archive, HasSubstr("requirements.txt"));
    EXPECT_THAT(runtime_->archives[0].archive, HasSubstr("numpy\nrequests"));
    EXPECT_TRUE(runtime_->created[0].network_enabled);
}

TEST_F(SandboxEngineTest, RunsBashScript) {
    scripted_["./script.sh"] = ExecOutput{0, "hi\n", ""};
    auto engine = MakeEngine();
    const auto report = engine->ExecuteBash("echo hi");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.text, "hi\n");
    EXPECT_THAT(runtime_->ExecutedCommands(), ElementsAre("chmod +x script.sh", "./script.sh"));
    EXPECT_EQ(runtime_->created[0].image, "alpine:latest");
    EXPECT_EQ(runtime_->created[0].user, "");
    EXPECT_THAT(runtime_->archives[0].archive, HasSubstr("script.sh"));
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, CommandFailureStillTearsDown) {
    scripted_["python main.py"] = ExecOutput{1, "", "Traceback\n"};
    auto engine = MakeEngine();
    const auto report = engine->ExecutePython("raise SystemExit(1)", {});
    EXPECT_EQ(report.status, ReportStatus::kCommandFailed);
    EXPECT_EQ(report.text, "Error: Traceback\n\nCommand failed: Unknown error (Exit code: 1)");
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, UploadFailureStillTearsDown) {
    auto engine = MakeEngine();
    runtime_->put_archive_fails = true;
    const auto report = engine->ExecuteBash("true");
    EXPECT_EQ(report.status, ReportStatus::kError);
    EXPECT_EQ(report.text, "Docker API error: upload archive: 500 disk full");
    EXPECT_TRUE(runtime_->execs.empty());
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, ExecFailureStillTearsDown) {
    auto engine = MakeEngine();
    runtime_->exec_throws = {"chmod +x script.sh"};
    const auto report = engine->ExecuteBash("true");
    EXPECT_EQ(report.status, ReportStatus::kCommandError);
    EXPECT_EQ(report.text, "Error executing command: exec start: connection reset");
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, StopFailureDoesNotChangeReport) {
    scripted_["./script.sh"] = ExecOutput{0, "ok\n", ""};
    auto engine = MakeEngine();
    runtime_->stop_fails = true;
    const auto report = engine->ExecuteBash("echo ok");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.text, "ok\n");
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, LaunchFailureSkipsTeardown) {
    auto engine = MakeEngine();
    runtime_->create_error = RuntimeError::Kind::kUnreachable;
    const auto report = engine->ExecuteBash("true");
    EXPECT_EQ(report.status, ReportStatus::kLaunchFailed);
    EXPECT_THAT(report.text, StartsWith("Docker daemon unreachable: "));
    EXPECT_TRUE(runtime_->archives.empty());
    EXPECT_TRUE(runtime_->stopped.empty());
}

TEST_F(SandboxEngineTest, RejectedLaunchIsApiError) {
    auto engine = MakeEngine();
    runtime_->create_error = RuntimeError::Kind::kNotFound;
    const auto report = engine->ExecutePython("print(1)", {});
    EXPECT_EQ(report.status, ReportStatus::kLaunchFailed);
    EXPECT_THAT(report.text, StartsWith("Docker API error: "));
}

TEST_F(SandboxEngineTest, UnencodableLaunchIsReportedNotThrown) {
    auto engine = MakeEngine();
    runtime_->create_encoding_fails = true;
    boxrun::sandbox::ExecutionReport report;
    EXPECT_NO_THROW(report = engine->ExecuteBash("true"));
    EXPECT_EQ(report.status, ReportStatus::kLaunchFailed);
    EXPECT_THAT(report.text, StartsWith("Docker API error: "));
    EXPECT_TRUE(runtime_->stopped.empty());
}

TEST_F(SandboxEngineTest, OverallDeadlineStopsPipeline) {
    config_.sandbox.timeout_s = 10;
    auto engine = MakeEngine();
    runtime_->on_exec = [this](const std::string&) { now_ += std::chrono::seconds(11); };
    const auto report = engine->ExecuteBash("sleep 60");
    EXPECT_EQ(report.status, ReportStatus::kDeadlineExceeded);
    EXPECT_EQ(report.text, "Operation timed out after 10 seconds");
    EXPECT_THAT(runtime_->ExecutedCommands(), ElementsAre("chmod +x script.sh"));
    EXPECT_EQ(runtime_->stopped.size(), 1u);
}

TEST_F(SandboxEngineTest, PassesCommandBudgetToRuntime) {
    auto engine = MakeEngine();
    engine->ExecuteBash("true");
    ASSERT_EQ(runtime_->execs.size(), 2u);
    ASSERT_TRUE(runtime_->execs[0].timeout.has_value());
    EXPECT_EQ(*runtime_->execs[0].timeout, std::chrono::milliseconds(25000));
}

TEST_F(SandboxEngineTest, CooperativeTimeoutLeavesExecUnbounded) {
    config_.sandbox.enforce_command_timeout = false;
    auto engine = MakeEngine();
    engine->ExecuteBash("true");
    ASSERT_EQ(runtime_->execs.size(), 2u);
    EXPECT_FALSE(runtime_->execs[0].timeout.has_value());
}

TEST_F(SandboxEngineTest, TruncatesLongOutput) {
    config_.sandbox.max_output_size = 16;
    scripted_["./script.sh"] = ExecOutput{0, std::string(100, 'x'), ""};
    auto engine = MakeEngine();
    const auto report = engine->ExecuteBash("yes x");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.text, std::string(16, 'x') + "\n... Output truncated (exceeded 16 bytes)");
}

TEST_F(SandboxEngineTest, RootUserWhenNonRootDisabled) {
    config_.sandbox.use_non_root_user = false;
    auto engine = MakeEngine();
    engine->ExecutePython("print(1)", {});
    ASSERT_EQ(runtime_->created.size(), 1u);
    EXPECT_EQ(runtime_->created[0].user, "");
}

}  // namespace
