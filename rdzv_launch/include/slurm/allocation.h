#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace rdzv_launch::slurm {

// Allocation metadata as granted by the scheduler. Immutable for the lifetime of a launch.
struct AllocationContext {
    std::string job_id;
    // Scheduler order; the first host is the rendezvous host.
    std::vector<std::string> host_list;
    int node_count = 0;
    int tasks_per_node = 0;
    // Set only when the scheduler supplied a total task count directly.
    std::optional<int> total_tasks;
    std::optional<int> cpus_per_task;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads from the launcher's own process environment.
EnvLookup ProcessEnvLookup();

class AllocationReader {
public:
    explicit AllocationReader(EnvLookup lookup = ProcessEnvLookup());

    /**
     * @brief Read the complete allocation context from the Slurm variables.
     *
     * Either the full context is returned or nothing: a missing job id, node
     * list, node count or task count raises ConfigurationError with
     * kMissingAllocationData. When only SLURM_NTASKS is set, tasks per node is
     * derived from it and must divide evenly over the nodes. A node list whose
     * length differs from the node count raises kInconsistentAllocation. An
     * unparsable SLURM_CPUS_PER_TASK is logged and left unset.
     */
    AllocationContext Read() const;

private:
    std::optional<std::string> FirstOf(std::initializer_list<const char *> names) const;
    std::optional<int> ReadInt(std::initializer_list<const char *> names) const;

    EnvLookup lookup_;
};

} // namespace rdzv_launch::slurm
