#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "rdzv_launch/include/errors.h"
#include "rdzv_launch/include/rendezvous.h"

using namespace rdzv_launch;
using rdzv_launch::slurm::AllocationContext;

namespace {

AllocationContext TwoNodeJob() {
    AllocationContext ctx;
    ctx.job_id = "123456";
    ctx.host_list = {"nodeA", "nodeB"};
    ctx.node_count = 2;
    ctx.tasks_per_node = 4;
    return ctx;
}

ErrorCode DeriveError(const AllocationContext &ctx, const PortPolicy &policy = {}) {
    try {
        DeriveRendezvousParameters(ctx, policy);
    } catch (const ConfigurationError &e) {
        return e.code();
    }
    ADD_FAILURE() << "DeriveRendezvousParameters succeeded";
    return ErrorCode::kUsage;
}

} // namespace

TEST(RendezvousTest, TwoNodeScenario) {
    const RendezvousParameters params = DeriveRendezvousParameters(TwoNodeJob());
    EXPECT_EQ(params.world_size, 8);
    EXPECT_EQ(params.coordination_address, "nodeA");
    EXPECT_EQ(params.coordination_port, 10000 + 3456);
}

TEST(RendezvousTest, DerivationIsDeterministic) {
    const AllocationContext ctx = TwoNodeJob();
    EXPECT_EQ(DeriveRendezvousParameters(ctx), DeriveRendezvousParameters(ctx));
}

TEST(RendezvousTest, AddressIsFirstHostVerbatim) {
    AllocationContext ctx = TwoNodeJob();
    ctx.host_list = {"zeta", "alpha"};
    EXPECT_EQ(DeriveRendezvousParameters(ctx).coordination_address, "zeta");

    ctx.host_list = {"only-host"};
    ctx.node_count = 1;
    EXPECT_EQ(DeriveRendezvousParameters(ctx).coordination_address, "only-host");
}

TEST(RendezvousTest, PortUsesLastFourDigits) {
    EXPECT_EQ(DeriveCoordinationPort("123456"), 13456);
    EXPECT_EQ(DeriveCoordinationPort("7"), 10007);
    EXPECT_EQ(DeriveCoordinationPort("10000"), 10000);
    EXPECT_EQ(DeriveCoordinationPort("4242_0017"), 10017);
}

TEST(RendezvousTest, PortStaysInRange) {
    const PortPolicy policy{.base = 20000, .range = 500};
    for (const std::string job_id : {"0", "9", "499", "500", "9999", "123456789", "31337", "42_9998"}) {
        const int port = DeriveCoordinationPort(job_id, policy);
        EXPECT_GE(port, policy.base) << job_id;
        EXPECT_LT(port, policy.base + policy.range) << job_id;
    }
    for (int id = 0; id < 20000; id += 37) {
        const int port = DeriveCoordinationPort(std::to_string(id));
        EXPECT_GE(port, 10000);
        EXPECT_LT(port, 20000);
    }
}

TEST(RendezvousTest, ConcurrentJobsGetDifferentPorts) {
    EXPECT_NE(DeriveCoordinationPort("5001"), DeriveCoordinationPort("5002"));
}

TEST(RendezvousTest, JobIdWithoutTrailingDigitFails) {
    AllocationContext ctx = TwoNodeJob();
    ctx.job_id = "job";
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidJobId);
    ctx.job_id = "123_[1-4]";
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidJobId);
}

TEST(RendezvousTest, InvalidPortPolicyFails) {
    EXPECT_EQ(DeriveError(TwoNodeJob(), {.base = 60000, .range = 10000}), ErrorCode::kInvalidConfiguration);
    EXPECT_EQ(DeriveError(TwoNodeJob(), {.base = 10000, .range = 0}), ErrorCode::kInvalidConfiguration);
    EXPECT_EQ(DeriveError(TwoNodeJob(), {.base = 0, .range = 10}), ErrorCode::kInvalidConfiguration);
}

TEST(RendezvousTest, EmptyHostListFails) {
    AllocationContext ctx = TwoNodeJob();
    ctx.host_list.clear();
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kEmptyHostList);
}

TEST(RendezvousTest, NonPositiveCountsFail) {
    AllocationContext ctx = TwoNodeJob();
    ctx.node_count = 0;
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidNodeCount);
    ctx.node_count = -2;
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidNodeCount);

    ctx = TwoNodeJob();
    ctx.tasks_per_node = 0;
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidTaskCount);
    ctx.tasks_per_node = -1;
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInvalidTaskCount);
}

TEST(RendezvousTest, MatchingTotalIsAccepted) {
    AllocationContext ctx = TwoNodeJob();
    ctx.total_tasks = 8;
    EXPECT_EQ(DeriveRendezvousParameters(ctx).world_size, 8);
}

TEST(RendezvousTest, MismatchedTotalIsInconsistent) {
    AllocationContext ctx = TwoNodeJob();
    ctx.total_tasks = 6;
    EXPECT_EQ(DeriveError(ctx), ErrorCode::kInconsistentAllocation);
}

TEST(RendezvousTest, AddressIsFirstHostWhateverTheNodeCount) {
    AllocationContext ctx = TwoNodeJob();
    ctx.host_list = {"nodeA"};
    const RendezvousParameters params = DeriveRendezvousParameters(ctx);
    EXPECT_EQ(params.coordination_address, "nodeA");
    EXPECT_EQ(params.world_size, 8);

    ctx.host_list = {"nodeA", "nodeB", "nodeC"};
    EXPECT_EQ(DeriveRendezvousParameters(ctx).coordination_address, "nodeA");
}

TEST(RendezvousTest, ErrorsMapToDistinctExitCodes) {
    const std::vector<ErrorCode> codes = {
        ErrorCode::kMissingAllocationData, ErrorCode::kEmptyHostList,         ErrorCode::kInvalidNodeCount,
        ErrorCode::kInvalidTaskCount,      ErrorCode::kInconsistentAllocation, ErrorCode::kMalformedHostList,
        ErrorCode::kInvalidJobId,          ErrorCode::kInvalidConfiguration,  ErrorCode::kUsage,
        ErrorCode::kSpawnFailure,          ErrorCode::kSupervisionFailure,
    };
    for (size_t i = 0; i < codes.size(); ++i) {
        const int exit_code = LaunchError(codes[i], "x").exit_code();
        EXPECT_NE(exit_code, 0);
        for (size_t j = i + 1; j < codes.size(); ++j) { EXPECT_NE(exit_code, LaunchError(codes[j], "x").exit_code()); }
    }
}
