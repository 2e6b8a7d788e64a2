#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/types.h>

#include "rdzv_launch/include/environment.h"

namespace rdzv_launch::supervisor {

enum class SupervisorState : uint8_t {
    kIdle = 0,
    kRunning = 1,
    kSignalForwarded = 2,
    kExited = 3,
};

const char *StateName(SupervisorState state);

struct SupervisedProcess {
    pid_t pid = -1;
    SupervisorState state = SupervisorState::kIdle;
    // Valid once state is kExited.
    int exit_code = 0;
    // Last signal forwarded to the child, 0 if none.
    int forwarded_signal = 0;
};

// Exit code reported for a child killed by signal `signo`, following the shell convention.
constexpr int SignalExitCode(int signo) { return 128 + signo; }

struct SupervisorOptions {
    // Signals that, delivered to the launcher, are passed on to the child.
    std::vector<int> termination_signals{SIGINT, SIGTERM};
    // Signal sent to the child; 0 forwards the received signal unchanged.
    int forward_as = SIGTERM;
};

/**
 * @brief Spawns one workload process and supervises it until it exits.
 *
 * State machine: Idle -> Running -> {SignalForwarded -> Exited, Exited}.
 *
 * Termination signals delivered to the launcher while the child runs are
 * forwarded to the child; Run() keeps waiting and returns only after the
 * child has been reaped. The signals are blocked in the calling thread for
 * the duration of Run() and consumed synchronously, so the launcher must not
 * have other threads that leave them unblocked.
 */
class JobSupervisor {
public:
    using StateObserver = std::function<void(const SupervisedProcess &)>;

    explicit JobSupervisor(SupervisorOptions options = {});

    JobSupervisor(const JobSupervisor &) = delete;
    JobSupervisor &operator=(const JobSupervisor &) = delete;

    // Called on the supervising thread after every state transition.
    void SetStateObserver(StateObserver observer);

    /**
     * @brief Spawn `command args...` with `env` and block until it exits.
     *
     * `command` is resolved through PATH. Returns the child's exit code, or
     * SignalExitCode(signo) if the child was killed by a signal.
     *
     * @throws SpawnError if the command cannot be executed; nothing is left running.
     * @throws LaunchError(kSupervisionFailure) if waiting on the child fails.
     * Whatever fails after the spawn, the child is sent SIGTERM and reaped
     * before the exception leaves Run().
     */
    int Run(const std::string &command, const std::vector<std::string> &args, const Environment &env);

    SupervisorState state() const;

    const SupervisedProcess &process() const;

private:
    pid_t Spawn(const std::string &command, const std::vector<std::string> &args, const Environment &env,
                const sigset_t &original_mask);
    int WaitForExit(const sigset_t &wait_set);
    void ForwardSignal(int signo);
    // SIGTERM and a blocking wait, for when supervision fails with the child still running.
    void TerminateAndReap();
    void Transition(SupervisorState next);

    SupervisorOptions options_;
    StateObserver observer_;
    SupervisedProcess process_;
};

} // namespace rdzv_launch::supervisor
