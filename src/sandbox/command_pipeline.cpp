#include "sandbox/command_pipeline.hpp"

#include <algorithm>
#include <optional>

#include "sandbox/text_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace boxrun::sandbox {
namespace {

constexpr int kTimedOutStatus = 124;

std::string CommandFailedLine(int exit_status) {
    return std::string("Command failed: ") + ClassifyExitStatus(exit_status) +
        " (Exit code: " + std::to_string(exit_status) + ")";
}

}  // namespace

const char* ClassifyExitStatus(int exit_status) {
    switch (exit_status) {
        case 127: return "Command not found";
        case 126: return "Permission denied";
        case 124: return "Command timed out";
        default: return "Unknown error";
    }
}

CommandPipeline::CommandPipeline(runtime::ContainerRuntime& runtime, Clock clock)
    : runtime_(runtime)
    , clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point CommandPipeline::Now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

PipelineResult CommandPipeline::Run(const SandboxEnvironment& environment,
                                    const std::vector<std::string>& commands,
                                    const PipelineOptions& options) const {
    return Run(environment, commands, options, Now());
}

PipelineResult CommandPipeline::Run(const SandboxEnvironment& environment,
                                    const std::vector<std::string>& commands,
                                    const PipelineOptions& options,
                                    std::chrono::steady_clock::time_point start) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    PipelineResult result{};
    std::vector<std::string> log;
    const auto overall = duration_cast<milliseconds>(options.overall);
    const auto per_command = duration_cast<milliseconds>(options.per_command);

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const auto& command = commands[i];
        const auto elapsed = duration_cast<milliseconds>(Now() - start);
        if (elapsed >= overall) {
            utils::LogWarn("pipeline", "overall timeout reached", {{"completed", std::to_string(i)}});
            log.push_back("Operation timed out after " +
                          std::to_string(options.overall.count()) + " seconds");
            result.stop = PipelineStop::kDeadlineExceeded;
            break;
        }
        const auto budget = std::min(per_command, overall - elapsed);
        if (budget <= milliseconds::zero()) {
            utils::LogWarn("pipeline", "no time remaining for command execution");
            log.push_back("Operation timed out");
            result.stop = PipelineStop::kDeadlineExceeded;
            break;
        }

        utils::LogInfo("pipeline", "executing command", {
            {"command", command},
            {"budget_ms", std::to_string(budget.count())}
        });
        CommandOutcome outcome{};
        try {
            const auto timeout = options.enforce_command_timeout
                ? std::optional<milliseconds>(budget)
                : std::nullopt;
            const auto output = runtime_.Exec(environment.id, {"sh", "-c", command}, timeout);
            outcome.exit_status = output.exit_code;
            outcome.stdout_text = DecodeOutput(output.stdout_bytes, options.output_encoding);
            outcome.stderr_text = DecodeOutput(output.stderr_bytes, options.output_encoding);
        } catch (const runtime::RuntimeError& ex) {
            if (ex.kind() != runtime::RuntimeError::Kind::kTimeout) {
                utils::LogError("pipeline", "error executing command", {
                    {"command", command},
                    {"error", ex.what()}
                });
                log.push_back(std::string("Error executing command: ") + ex.what());
                result.stop = PipelineStop::kCommandError;
                break;
            }
            outcome.exit_status = kTimedOutStatus;
        } catch (const std::exception& ex) {
            utils::LogError("pipeline", "error executing command", {
                {"command", command},
                {"error", ex.what()}
            });
            log.push_back(std::string("Error executing command: ") + ex.what());
            result.stop = PipelineStop::kCommandError;
            break;
        }

        if (!outcome.stdout_text.empty()) {
            log.push_back(outcome.stdout_text);
        }
        if (!outcome.stderr_text.empty()) {
            log.push_back("Error: " + outcome.stderr_text);
        }
        const int exit_status = outcome.exit_status;
        result.outcomes.push_back(std::move(outcome));

        if (exit_status != 0) {
            utils::LogWarn("pipeline", "command failed", {
                {"command", command},
                {"exit_code", std::to_string(exit_status)},
                {"reason", ClassifyExitStatus(exit_status)}
            });
            log.push_back(CommandFailedLine(exit_status));
            result.stop = PipelineStop::kCommandFailed;
            break;
        }
    }

    result.log = utils::Join(log, "\n");
    return result;
}

}  // namespace boxrun::sandbox
