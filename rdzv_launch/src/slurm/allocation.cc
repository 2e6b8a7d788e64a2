#include "rdzv_launch/include/slurm/allocation.h"

#include <charconv>
#include <cstdlib>
#include <format>
#include <string>

#include "glog/logging.h"

#include "rdzv_launch/include/errors.h"
#include "rdzv_launch/include/slurm/hostlist.h"

namespace rdzv_launch::slurm {

namespace {

std::string JoinNames(std::initializer_list<const char *> names) {
    std::string joined;
    for (const char *name : names) {
        if (!joined.empty()) {
            joined += "/";
        }
        joined += name;
    }
    return joined;
}

std::optional<int> ParseInt(const std::string &raw) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

EnvLookup ProcessEnvLookup() {
    return [](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        return value ? std::optional<std::string>(value) : std::nullopt;
    };
}

AllocationReader::AllocationReader(EnvLookup lookup) : lookup_(std::move(lookup)) {}

std::optional<std::string> AllocationReader::FirstOf(std::initializer_list<const char *> names) const {
    for (const char *name : names) {
        auto value = lookup_(name);
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<int> AllocationReader::ReadInt(std::initializer_list<const char *> names) const {
    const auto raw = FirstOf(names);
    if (!raw) {
        return std::nullopt;
    }
    const auto value = ParseInt(*raw);
    if (!value) {
        throw ConfigurationError(ErrorCode::kMissingAllocationData,
                                 std::format("{} is not an integer: \"{}\"", JoinNames(names), *raw));
    }
    return value;
}

AllocationContext AllocationReader::Read() const {
    const auto job_id = FirstOf({"SLURM_JOB_ID", "SLURM_JOBID"});
    if (!job_id) {
        throw ConfigurationError(ErrorCode::kMissingAllocationData, "SLURM_JOB_ID is not set");
    }
    const auto nodelist = FirstOf({"SLURM_JOB_NODELIST", "SLURM_NODELIST"});
    if (!nodelist) {
        throw ConfigurationError(ErrorCode::kMissingAllocationData, "SLURM_JOB_NODELIST is not set");
    }
    const auto node_count = ReadInt({"SLURM_JOB_NUM_NODES", "SLURM_NNODES"});
    if (!node_count) {
        throw ConfigurationError(ErrorCode::kMissingAllocationData, "SLURM_JOB_NUM_NODES is not set");
    }
    const auto tasks_per_node = ReadInt({"SLURM_NTASKS_PER_NODE"});
    const auto total_tasks = ReadInt({"SLURM_NTASKS"});
    if (!tasks_per_node && !total_tasks) {
        throw ConfigurationError(ErrorCode::kMissingAllocationData,
                                 "neither SLURM_NTASKS_PER_NODE nor SLURM_NTASKS is set");
    }

    AllocationContext ctx;
    ctx.job_id = *job_id;
    ctx.host_list = ExpandHostList(*nodelist);
    ctx.node_count = *node_count;
    ctx.total_tasks = total_tasks;
    // Thread-count hint only; an unusable value is dropped
    if (const auto cpus = FirstOf({"SLURM_CPUS_PER_TASK"})) {
        ctx.cpus_per_task = ParseInt(*cpus);
        if (!ctx.cpus_per_task) {
            LOG(WARNING) << "Ignoring SLURM_CPUS_PER_TASK=\"" << *cpus << "\", it is not an integer";
        }
    }

    if (tasks_per_node) {
        ctx.tasks_per_node = *tasks_per_node;
    } else {
        if (ctx.node_count <= 0) {
            throw ConfigurationError(ErrorCode::kInvalidNodeCount,
                                     std::format("node count must be >= 1, got {}", ctx.node_count));
        }
        if (*total_tasks % ctx.node_count != 0) {
            throw ConfigurationError(
                ErrorCode::kInconsistentAllocation,
                std::format("SLURM_NTASKS={} does not divide evenly over {} nodes", *total_tasks, ctx.node_count));
        }
        ctx.tasks_per_node = *total_tasks / ctx.node_count;
        LOG(INFO) << "SLURM_NTASKS_PER_NODE not set, using SLURM_NTASKS / nodes = " << ctx.tasks_per_node;
    }

    // Slurm keeps the node list and the node count in step; a mismatch means a hand-edited environment.
    // Empty lists and non-positive counts are reported by DeriveRendezvousParameters.
    if (!ctx.host_list.empty() && ctx.node_count > 0 && ctx.host_list.size() != static_cast<size_t>(ctx.node_count)) {
        throw ConfigurationError(ErrorCode::kInconsistentAllocation,
                                 std::format("node list has {} hosts, but the node count is {}", ctx.host_list.size(),
                                             ctx.node_count));
    }
    return ctx;
}

} // namespace rdzv_launch::slurm
