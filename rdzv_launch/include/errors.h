#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rdzv_launch {

// Launcher failures exit with codes in [200, 210] so that job accounting can
// tell them apart from the workload's own exit status.
enum class ErrorCode : uint8_t {
    kMissingAllocationData = 200,
    kEmptyHostList = 201,
    kInvalidNodeCount = 202,
    kInvalidTaskCount = 203,
    kInconsistentAllocation = 204,
    kMalformedHostList = 205,
    kInvalidJobId = 206,
    kInvalidConfiguration = 207,
    kUsage = 208,
    kSpawnFailure = 209,
    kSupervisionFailure = 210,
};

const char *ErrorCodeName(ErrorCode code);

class LaunchError : public std::runtime_error {
public:
    LaunchError(ErrorCode code, const std::string &message);

    ErrorCode code() const;

    int exit_code() const;

private:
    ErrorCode code_;
};

// Missing or invalid allocation data and bad launcher flags. Raised before anything is spawned.
class ConfigurationError : public LaunchError {
public:
    ConfigurationError(ErrorCode code, const std::string &message);
};

// The workload could not be started.
class SpawnError : public LaunchError {
public:
    explicit SpawnError(const std::string &message);
};

} // namespace rdzv_launch
