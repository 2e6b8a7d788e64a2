#include "rdzv_launch/include/rendezvous.h"

#include <cctype>
#include <cstdint>
#include <format>

#include "rdzv_launch/include/errors.h"

namespace rdzv_launch {

namespace {

constexpr int kMaxPort = 65535;

void ValidatePortPolicy(const PortPolicy &policy) {
    if (policy.base < 1 || policy.range < 1 || static_cast<int64_t>(policy.base) + policy.range - 1 > kMaxPort) {
        throw ConfigurationError(
            ErrorCode::kInvalidConfiguration,
            std::format("port range [{}, {}) does not fit in [1, {}]", policy.base,
                        static_cast<int64_t>(policy.base) + policy.range, kMaxPort));
    }
}

} // namespace

bool operator==(const RendezvousParameters &lhs, const RendezvousParameters &rhs) {
    return lhs.coordination_port == rhs.coordination_port && lhs.world_size == rhs.world_size
        && lhs.coordination_address == rhs.coordination_address;
}

int DeriveCoordinationPort(const std::string &job_id, const PortPolicy &policy) {
    ValidatePortPolicy(policy);

    // Trailing digit run, e.g. "123456" or the array index in "4242_17"
    size_t begin = job_id.size();
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(job_id[begin - 1]))) { --begin; }
    if (begin == job_id.size()) {
        throw ConfigurationError(ErrorCode::kInvalidJobId,
                                 std::format("job id \"{}\" does not end in a digit", job_id));
    }
    if (job_id.size() - begin > kJobIdPortDigits) {
        begin = job_id.size() - kJobIdPortDigits;
    }

    int offset = 0;
    for (size_t i = begin; i < job_id.size(); ++i) { offset = offset * 10 + (job_id[i] - '0'); }
    return policy.base + offset % policy.range;
}

RendezvousParameters DeriveRendezvousParameters(const slurm::AllocationContext &ctx, const PortPolicy &policy) {
    if (ctx.host_list.empty()) {
        throw ConfigurationError(ErrorCode::kEmptyHostList, "allocation has no hosts");
    }
    if (ctx.node_count <= 0) {
        throw ConfigurationError(ErrorCode::kInvalidNodeCount,
                                 std::format("node count must be >= 1, got {}", ctx.node_count));
    }
    if (ctx.tasks_per_node <= 0) {
        throw ConfigurationError(ErrorCode::kInvalidTaskCount,
                                 std::format("tasks per node must be >= 1, got {}", ctx.tasks_per_node));
    }

    const int64_t world_size = static_cast<int64_t>(ctx.node_count) * ctx.tasks_per_node;
    if (world_size > INT32_MAX) {
        throw ConfigurationError(ErrorCode::kInconsistentAllocation,
                                 std::format("{} nodes x {} tasks overflows the world size", ctx.node_count,
                                             ctx.tasks_per_node));
    }
    if (ctx.total_tasks && *ctx.total_tasks != world_size) {
        throw ConfigurationError(ErrorCode::kInconsistentAllocation,
                                 std::format("{} nodes x {} tasks per node = {}, but the scheduler reports {} tasks",
                                             ctx.node_count, ctx.tasks_per_node, world_size, *ctx.total_tasks));
    }

    RendezvousParameters params;
    params.coordination_port = DeriveCoordinationPort(ctx.job_id, policy);
    params.world_size = static_cast<int>(world_size);
    params.coordination_address = ctx.host_list.front();
    return params;
}

} // namespace rdzv_launch
