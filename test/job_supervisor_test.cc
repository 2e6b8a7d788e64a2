#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include "gtest/gtest.h"

#include "rdzv_launch/include/environment.h"
#include "rdzv_launch/include/errors.h"
#include "rdzv_launch/include/supervisor/job_supervisor.h"

using namespace rdzv_launch;
using namespace rdzv_launch::supervisor;

namespace {

// Sends `signo` to this process after `delay`. The sender blocks the termination signals itself, so the
// process-directed signal can only be consumed by the supervising thread.
std::thread SignalLauncherAfter(int signo, std::chrono::milliseconds delay) {
    return std::thread([signo, delay] {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::this_thread::sleep_for(delay);
        kill(getpid(), signo);
    });
}

class JobSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        supervisor_.SetStateObserver([this](const SupervisedProcess &p) { trace_.push_back(p.state); });
    }

    JobSupervisor supervisor_;
    std::vector<SupervisorState> trace_;
    Environment env_ = Environment::FromProcess();
};

bool ProcessExists(pid_t pid) { return kill(pid, 0) == 0 || errno != ESRCH; }

} // namespace

TEST_F(JobSupervisorTest, PropagatesChildExitCode) {
    EXPECT_EQ(supervisor_.Run("sh", {"-c", "exit 3"}, env_), 3);

    EXPECT_EQ(trace_, (std::vector<SupervisorState>{SupervisorState::kRunning, SupervisorState::kExited}));
    EXPECT_EQ(supervisor_.process().exit_code, 3);
    EXPECT_EQ(supervisor_.process().forwarded_signal, 0);
}

TEST_F(JobSupervisorTest, SuccessfulChildSeesPublishedEnvironment) {
    RendezvousParameters params;
    params.coordination_port = 13456;
    params.world_size = 8;
    params.coordination_address = "nodeA";
    EnvironmentPublisher(&env_).Publish(params, {{"NCCL_SOCKET_IFNAME", "hsn"}});

    const int code = supervisor_.Run(
        "sh",
        {"-c", R"(test "$MASTER_ADDR" = nodeA && test "$MASTER_PORT" = 13456 && test "$WORLD_SIZE" = 8 )"
               R"(&& test "$NCCL_SOCKET_IFNAME" = hsn)"},
        env_);
    EXPECT_EQ(code, 0);
}

TEST_F(JobSupervisorTest, ForwardsTerminationSignalAndWaitsForChild) {
    std::thread sender = SignalLauncherAfter(SIGTERM, std::chrono::milliseconds(300));
    const int code = supervisor_.Run("sleep", {"1000"}, env_);
    sender.join();

    EXPECT_NE(code, 0);
    EXPECT_EQ(code, SignalExitCode(SIGTERM));
    EXPECT_EQ(trace_, (std::vector<SupervisorState>{SupervisorState::kRunning, SupervisorState::kSignalForwarded,
                                                    SupervisorState::kExited}));
    EXPECT_EQ(supervisor_.process().forwarded_signal, SIGTERM);
    // Run() returned only after the child was reaped
    EXPECT_FALSE(ProcessExists(supervisor_.process().pid));
}

TEST_F(JobSupervisorTest, InterruptIsForwardedAsTerminate) {
    std::thread sender = SignalLauncherAfter(SIGINT, std::chrono::milliseconds(300));
    const int code = supervisor_.Run("sleep", {"1000"}, env_);
    sender.join();

    EXPECT_EQ(code, SignalExitCode(SIGTERM));
    EXPECT_EQ(supervisor_.process().forwarded_signal, SIGTERM);
}

TEST(JobSupervisorOptionsTest, ForwardsReceivedSignalUnchanged) {
    SupervisorOptions options;
    options.forward_as = 0;
    JobSupervisor supervisor(options);

    std::thread sender = SignalLauncherAfter(SIGINT, std::chrono::milliseconds(300));
    const int code = supervisor.Run("sleep", {"1000"}, Environment::FromProcess());
    sender.join();

    EXPECT_EQ(code, SignalExitCode(SIGINT));
    EXPECT_EQ(supervisor.process().forwarded_signal, SIGINT);
}

TEST_F(JobSupervisorTest, ChildHandlingSignalReportsItsOwnCode) {
    std::thread sender = SignalLauncherAfter(SIGTERM, std::chrono::milliseconds(500));
    const int code = supervisor_.Run("sh", {"-c", "trap 'kill $!; exit 7' TERM; sleep 1000 & wait"}, env_);
    sender.join();

    EXPECT_EQ(code, 7);
    EXPECT_EQ(trace_.back(), SupervisorState::kExited);
    EXPECT_EQ(supervisor_.process().forwarded_signal, SIGTERM);
}

TEST_F(JobSupervisorTest, ChildKilledWithoutForwardGetsSynthesizedCode) {
    EXPECT_EQ(supervisor_.Run("sh", {"-c", "kill -9 $$"}, env_), SignalExitCode(SIGKILL));
    EXPECT_EQ(trace_, (std::vector<SupervisorState>{SupervisorState::kRunning, SupervisorState::kExited}));
}

TEST_F(JobSupervisorTest, MissingCommandIsSpawnFailure) {
    try {
        supervisor_.Run("rdzv-launch-no-such-command", {}, env_);
        FAIL() << "Run() spawned a missing command";
    } catch (const SpawnError &e) {
        EXPECT_EQ(e.code(), ErrorCode::kSpawnFailure);
        EXPECT_EQ(e.exit_code(), 209);
    }
    EXPECT_EQ(supervisor_.state(), SupervisorState::kIdle);
    EXPECT_TRUE(trace_.empty());
}

TEST_F(JobSupervisorTest, FailureAfterSpawnTerminatesAndReapsChild) {
    JobSupervisor supervisor;
    supervisor.SetStateObserver([](const SupervisedProcess &p) {
        if (p.state == SupervisorState::kRunning) {
            throw std::runtime_error("observer failed");
        }
    });

    EXPECT_THROW(supervisor.Run("sleep", {"1000"}, env_), std::runtime_error);
    ASSERT_GT(supervisor.process().pid, 0);
    EXPECT_FALSE(ProcessExists(supervisor.process().pid));
}

TEST_F(JobSupervisorTest, SignalAfterChildExitDoesNotKillLauncher) {
    struct sigaction before {};
    ASSERT_EQ(sigaction(SIGTERM, nullptr, &before), 0);

    JobSupervisor supervisor;
    supervisor.SetStateObserver([](const SupervisedProcess &p) {
        if (p.state == SupervisorState::kExited) {
            raise(SIGTERM);
        }
    });
    EXPECT_EQ(supervisor.Run("sh", {"-c", "exit 5"}, env_), 5);
    EXPECT_EQ(supervisor.process().forwarded_signal, 0);

    struct sigaction after {};
    ASSERT_EQ(sigaction(SIGTERM, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST_F(JobSupervisorTest, RestoresSignalMask) {
    ASSERT_EQ(supervisor_.Run("true", {}, env_), 0);

    sigset_t current;
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, nullptr, &current), 0);
    EXPECT_FALSE(sigismember(&current, SIGTERM));
    EXPECT_FALSE(sigismember(&current, SIGINT));
    EXPECT_FALSE(sigismember(&current, SIGCHLD));
}

TEST_F(JobSupervisorTest, RunIsSingleUse) {
    ASSERT_EQ(supervisor_.Run("true", {}, env_), 0);
    EXPECT_DEATH(supervisor_.Run("true", {}, env_), "may only be called once");
}
