#include "rdzv_launch/include/tuning.h"

#include <format>
#include <string>

#include "rdzv_launch/include/errors.h"

namespace rdzv_launch {

std::map<std::string, std::string> BuildTuningVariables(const TuningConfig &config,
                                                        const slurm::AllocationContext &ctx) {
    std::map<std::string, std::string> vars;

    int omp_num_threads = config.omp_num_threads;
    if (omp_num_threads < 0) {
        omp_num_threads = ctx.cpus_per_task.value_or(0);
    }
    if (omp_num_threads > 0) {
        vars["OMP_NUM_THREADS"] = std::to_string(omp_num_threads);
    }

    if (!config.nccl_socket_ifname.empty()) {
        vars["NCCL_SOCKET_IFNAME"] = config.nccl_socket_ifname;
    }
    if (config.nccl_nsocks_perthread > 0) {
        vars["NCCL_NSOCKS_PERTHREAD"] = std::to_string(config.nccl_nsocks_perthread);
    }
    if (config.nccl_socket_nthreads > 0) {
        vars["NCCL_SOCKET_NTHREADS"] = std::to_string(config.nccl_socket_nthreads);
    }
    if (config.nccl_min_channels > 0) {
        vars["NCCL_MIN_CHANNELS"] = std::to_string(config.nccl_min_channels);
    }
    return vars;
}

std::map<std::string, std::string> ParseEnvAssignments(const std::string &assignments) {
    std::map<std::string, std::string> vars;
    size_t start = 0;
    while (start < assignments.size()) {
        size_t end = assignments.find(',', start);
        if (end == std::string::npos) {
            end = assignments.size();
        }
        const std::string item = assignments.substr(start, end - start);
        start = end + 1;
        if (item.empty()) {
            continue;
        }

        const size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigurationError(ErrorCode::kInvalidConfiguration,
                                     std::format("expected NAME=VALUE in --env, got \"{}\"", item));
        }
        vars[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return vars;
}

} // namespace rdzv_launch
