#include "runtime/process_runner.hpp"

#include <boost/version.hpp>
// The v1 API is used throughout. From 1.86 it lives under process/v1 and
// <boost/process.hpp> becomes v2.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace boxrun::runtime {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::atomic<unsigned long long> g_sequence{0};

std::filesystem::path TempPath(const std::string& stamp, const char* stream) {
    return std::filesystem::temp_directory_path() /
        ("boxrun_" + std::string(stream) + "_" + stamp + ".tmp");
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream target;
    target << input.rdbuf();
    return target.str();
}

bool WaitUntil(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds poll) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(poll);
    }
    return false;
}

}  // namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 const std::string& stdin_data,
                                 std::optional<std::chrono::milliseconds> timeout) {
    ProcessResult result{};
    if (argv.empty()) {
        result.spawn_error = "empty command";
        return result;
    }

    std::string executable = argv.front();
    if (executable.find('/') == std::string::npos) {
        const auto found = bp::search_path(executable);
        if (found.empty()) {
            result.spawn_error = executable + ": not found on PATH";
            return result;
        }
        executable = found.string();
    }

    const auto stamp = std::to_string(::getpid()) + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
        std::to_string(g_sequence.fetch_add(1));
    const auto stdin_path = TempPath(stamp, "stdin");
    const auto stdout_path = TempPath(stamp, "stdout");
    const auto stderr_path = TempPath(stamp, "stderr");
    {
        std::ofstream input(stdin_path, std::ios::binary | std::ios::trunc);
        input.write(stdin_data.data(), static_cast<std::streamsize>(stdin_data.size()));
    }

    try {
        const std::vector<std::string> args(argv.begin() + 1, argv.end());
        bp::child child_process(
            executable,
            bp::args(args),
            bp::std_in < stdin_path.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        const auto deadline = timeout
            ? std::chrono::steady_clock::now() + *timeout
            : std::chrono::steady_clock::time_point::max();
        int status = 0;
        const pid_t pid = child_process.id();
        bool finished = WaitUntil(pid, status, deadline, std::chrono::milliseconds(50));
        if (!finished && std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, status,
                                 std::chrono::steady_clock::now() + std::chrono::seconds(2),
                                 std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        // Reaped above; the child object must not wait on or signal the pid.
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        } else if (result.timed_out) {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.spawn_error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadFile(stdout_path);
    result.error = ReadFile(stderr_path);

    std::error_code ec;
    std::filesystem::remove(stdin_path, ec);
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace boxrun::runtime
