#pragma once

#include <string>

#include "rdzv_launch/include/slurm/allocation.h"

namespace rdzv_launch {

// Number of trailing job id digits that select the port offset.
constexpr int kJobIdPortDigits = 4;

struct PortPolicy {
    int base = 10000;
    int range = 10000;
};

struct RendezvousParameters {
    int coordination_port = 0;
    int world_size = 0;
    std::string coordination_address;
};

bool operator==(const RendezvousParameters &lhs, const RendezvousParameters &rhs);

/**
 * @brief Map a job id to its coordination port.
 *
 * port = policy.base + (last kJobIdPortDigits digits of the trailing digit run
 * of job_id) % policy.range. Stable for a job, different across jobs that run
 * concurrently with the same base. Every host computes it on its own, so it
 * must stay a pure function of the job id.
 *
 * @throws ConfigurationError(kInvalidJobId) if job_id does not end in a digit.
 * @throws ConfigurationError(kInvalidConfiguration) if the policy leaves [1, 65535].
 */
int DeriveCoordinationPort(const std::string &job_id, const PortPolicy &policy = {});

/**
 * @brief Derive (port, world size, address) from the allocation.
 *
 * Deterministic: identical input gives identical output on every host.
 */
RendezvousParameters DeriveRendezvousParameters(const slurm::AllocationContext &ctx, const PortPolicy &policy = {});

} // namespace rdzv_launch
