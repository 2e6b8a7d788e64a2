#include "rdzv_launch/include/errors.h"

#include <format>

namespace rdzv_launch {

const char *ErrorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::kMissingAllocationData:
        return "MissingAllocationData";
    case ErrorCode::kEmptyHostList:
        return "EmptyHostList";
    case ErrorCode::kInvalidNodeCount:
        return "InvalidNodeCount";
    case ErrorCode::kInvalidTaskCount:
        return "InvalidTaskCount";
    case ErrorCode::kInconsistentAllocation:
        return "InconsistentAllocation";
    case ErrorCode::kMalformedHostList:
        return "MalformedHostList";
    case ErrorCode::kInvalidJobId:
        return "InvalidJobId";
    case ErrorCode::kInvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorCode::kUsage:
        return "Usage";
    case ErrorCode::kSpawnFailure:
        return "SpawnFailure";
    case ErrorCode::kSupervisionFailure:
        return "SupervisionFailure";
    }
    return "Unknown";
}

LaunchError::LaunchError(ErrorCode code, const std::string &message)
    : std::runtime_error(std::format("{}: {}", ErrorCodeName(code), message)), code_(code) {}

ErrorCode LaunchError::code() const { return code_; }

int LaunchError::exit_code() const { return static_cast<int>(code_); }

ConfigurationError::ConfigurationError(ErrorCode code, const std::string &message) : LaunchError(code, message) {}

SpawnError::SpawnError(const std::string &message) : LaunchError(ErrorCode::kSpawnFailure, message) {}

} // namespace rdzv_launch
