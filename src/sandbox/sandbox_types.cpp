#include "sandbox/sandbox_types.hpp"

namespace boxrun::sandbox {

std::string LaunchError::Describe() const {
    switch (kind) {
        case Kind::kDaemonUnreachable:
            return "Docker daemon unreachable: " + message;
        case Kind::kImageNotFound:
        case Kind::kRejected:
            return "Docker API error: " + message;
    }
    return "Error: " + message;
}

const char* ToString(ReportStatus status) {
    switch (status) {
        case ReportStatus::kSuccess: return "success";
        case ReportStatus::kCommandFailed: return "command_failed";
        case ReportStatus::kDeadlineExceeded: return "deadline_exceeded";
        case ReportStatus::kCommandError: return "command_error";
        case ReportStatus::kLaunchFailed: return "launch_failed";
        case ReportStatus::kRejected: return "rejected";
        case ReportStatus::kError: return "error";
    }
    return "unknown";
}

}  // namespace boxrun::sandbox
