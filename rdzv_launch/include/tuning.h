#pragma once

#include <map>
#include <string>

#include "rdzv_launch/include/slurm/allocation.h"

namespace rdzv_launch {

// Fixed operational knobs exported next to the rendezvous variables. Empty or zero means "do not export".
struct TuningConfig {
    // -1: use SLURM_CPUS_PER_TASK when the allocation has it.
    int omp_num_threads = -1;
    std::string nccl_socket_ifname = "hsn";
    int nccl_nsocks_perthread = 4;
    int nccl_socket_nthreads = 2;
    int nccl_min_channels = 32;
};

std::map<std::string, std::string> BuildTuningVariables(const TuningConfig &config,
                                                        const slurm::AllocationContext &ctx);

// Parse "K1=V1,K2=V2". Values may contain '='; empty input yields an empty map.
std::map<std::string, std::string> ParseEnvAssignments(const std::string &assignments);

} // namespace rdzv_launch
