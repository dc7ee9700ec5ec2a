#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace boxrun::runtime {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    // Set when the process could not be started at all.
    std::string spawn_error;
};

class ProcessRunner {
public:
    // Runs argv[0] (looked up on PATH unless it contains a slash) with
    // stdout and stderr captured separately. |stdin_data| is fed on standard
    // input. Past |timeout| the child gets SIGTERM, then SIGKILL.
    static ProcessResult Run(const std::vector<std::string>& argv,
                             const std::string& stdin_data,
                             std::optional<std::chrono::milliseconds> timeout);
};

}  // namespace boxrun::runtime
