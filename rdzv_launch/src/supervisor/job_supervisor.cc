#include "rdzv_launch/include/supervisor/job_supervisor.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

#include "rdzv_launch/include/errors.h"

namespace rdzv_launch::supervisor {

namespace {

// Blocks a signal set in the calling thread and restores the previous mask on scope exit.
class ScopedSignalBlock {
public:
    explicit ScopedSignalBlock(const sigset_t &set) {
        const int rc = pthread_sigmask(SIG_BLOCK, &set, &original_);
        CHECK_EQ(rc, 0) << "pthread_sigmask: " << std::strerror(rc);
    }

    ~ScopedSignalBlock() { pthread_sigmask(SIG_SETMASK, &original_, nullptr); }

    ScopedSignalBlock(const ScopedSignalBlock &) = delete;
    ScopedSignalBlock &operator=(const ScopedSignalBlock &) = delete;

    const sigset_t &original() const { return original_; }

private:
    sigset_t original_;
};

// SIGCHLD set to SIG_IGN by whoever started us would make the kernel reap the child behind our back.
class ScopedDefaultAction {
public:
    explicit ScopedDefaultAction(int signo) : signo_(signo) {
        struct sigaction action {};
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        PCHECK(sigaction(signo_, &action, &original_) == 0) << "sigaction(" << signo_ << ")";
    }

    ~ScopedDefaultAction() { sigaction(signo_, &original_, nullptr); }

    ScopedDefaultAction(const ScopedDefaultAction &) = delete;
    ScopedDefaultAction &operator=(const ScopedDefaultAction &) = delete;

private:
    int signo_;
    struct sigaction original_ {};
};

// Ignores a set of signals and restores their previous dispositions on scope exit.
class ScopedIgnoredSignals {
public:
    explicit ScopedIgnoredSignals(const std::vector<int> &signals) {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        for (int signo : signals) {
            struct sigaction original {};
            PCHECK(sigaction(signo, &action, &original) == 0) << "sigaction(" << signo << ")";
            originals_.emplace_back(signo, original);
        }
    }

    ~ScopedIgnoredSignals() {
        for (const auto &[signo, original] : originals_) { sigaction(signo, &original, nullptr); }
    }

    ScopedIgnoredSignals(const ScopedIgnoredSignals &) = delete;
    ScopedIgnoredSignals &operator=(const ScopedIgnoredSignals &) = delete;

private:
    std::vector<std::pair<int, struct sigaction>> originals_;
};

std::string ErrnoString(int err) { return std::strerror(err); }

std::string CommandLine(const std::string &command, const std::vector<std::string> &args) {
    std::string line = command;
    for (const auto &arg : args) { line += " " + arg; }
    return line;
}

} // namespace

const char *StateName(SupervisorState state) {
    switch (state) {
    case SupervisorState::kIdle:
        return "Idle";
    case SupervisorState::kRunning:
        return "Running";
    case SupervisorState::kSignalForwarded:
        return "SignalForwarded";
    case SupervisorState::kExited:
        return "Exited";
    }
    return "Unknown";
}

JobSupervisor::JobSupervisor(SupervisorOptions options) : options_(std::move(options)) {
    CHECK(!options_.termination_signals.empty()) << "JobSupervisor needs at least one termination signal";
    for (int signo : options_.termination_signals) {
        CHECK(signo != SIGCHLD && signo != SIGKILL && signo != SIGSTOP) << "Signal " << signo << " cannot be forwarded";
    }
}

void JobSupervisor::SetStateObserver(StateObserver observer) { observer_ = std::move(observer); }

SupervisorState JobSupervisor::state() const { return process_.state; }

const SupervisedProcess &JobSupervisor::process() const { return process_; }

void JobSupervisor::Transition(SupervisorState next) {
    VLOG(1) << "Supervisor state " << StateName(process_.state) << " -> " << StateName(next);
    process_.state = next;
    if (observer_) {
        observer_(process_);
    }
}

int JobSupervisor::Run(const std::string &command, const std::vector<std::string> &args, const Environment &env) {
    CHECK(process_.state == SupervisorState::kIdle) << "JobSupervisor::Run may only be called once";

    // Block before fork so a signal arriving between spawn and wait stays pending instead of killing us.
    sigset_t wait_set;
    sigemptyset(&wait_set);
    for (int signo : options_.termination_signals) { sigaddset(&wait_set, signo); }
    sigaddset(&wait_set, SIGCHLD);

    // Destroyed after `block`, so a termination signal arriving while the mask is restored is discarded.
    std::optional<ScopedIgnoredSignals> ignore_after_exit;
    ScopedSignalBlock block(wait_set);
    ScopedDefaultAction default_sigchld(SIGCHLD);

    process_.pid = Spawn(command, args, env, block.original());
    LOG(INFO) << "Spawned pid " << process_.pid << ": " << CommandLine(command, args);
    try {
        Transition(SupervisorState::kRunning);
        process_.exit_code = WaitForExit(wait_set);
    } catch (...) {
        // The launcher never returns while the child it started is still alive
        TerminateAndReap();
        throw;
    }
    Transition(SupervisorState::kExited);

    // Termination signals that raced with the child's exit have nothing left to act on
    const timespec no_wait{0, 0};
    for (;;) {
        const int signo = sigtimedwait(&wait_set, nullptr, &no_wait);
        if (signo < 0) {
            break;
        }
        if (signo != SIGCHLD) {
            LOG(WARNING) << "Received " << strsignal(signo) << " after pid " << process_.pid << " exited, ignoring";
        }
    }
    ignore_after_exit.emplace(options_.termination_signals);

    LOG(INFO) << "Job pid " << process_.pid << " exited with code " << process_.exit_code;
    return process_.exit_code;
}

pid_t JobSupervisor::Spawn(const std::string &command, const std::vector<std::string> &args, const Environment &env,
                           const sigset_t &original_mask) {
    // Everything the child touches is prepared before fork.
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(command.c_str()));
    for (const auto &arg : args) { argv.push_back(const_cast<char *>(arg.c_str())); }
    argv.push_back(nullptr);

    const std::vector<std::string> envp_storage = env.ToEnvp();
    std::vector<char *> envp;
    envp.reserve(envp_storage.size() + 1);
    for (const auto &entry : envp_storage) { envp.push_back(const_cast<char *>(entry.c_str())); }
    envp.push_back(nullptr);

    // The workload must receive the forwarded signals even if our caller had them blocked.
    sigset_t child_mask = original_mask;
    for (int signo : options_.termination_signals) { sigdelset(&child_mask, signo); }
    sigdelset(&child_mask, SIGCHLD);

    // Close-on-exec pipe: stays silent on a successful exec, carries errno otherwise.
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        throw SpawnError(std::format("pipe2: {}", ErrnoString(errno)));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        throw SpawnError(std::format("fork: {}", ErrnoString(err)));
    }

    if (pid == 0) {
        close(exec_pipe[0]);
        for (int signo : options_.termination_signals) { signal(signo, SIG_DFL); }
        pthread_sigmask(SIG_SETMASK, &child_mask, nullptr);

        execvpe(argv[0], argv.data(), envp.data());

        const int err = errno;
        std::ignore = write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw SpawnError(std::format("cannot execute \"{}\": {}", command, ErrnoString(child_errno)));
    }
    return pid;
}

int JobSupervisor::WaitForExit(const sigset_t &wait_set) {
    for (;;) {
        siginfo_t info{};
        const int signo = sigwaitinfo(&wait_set, &info);
        if (signo < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw LaunchError(ErrorCode::kSupervisionFailure, std::format("sigwaitinfo: {}", ErrnoString(errno)));
        }

        if (signo != SIGCHLD) {
            ForwardSignal(signo);
            continue;
        }

        // SIGCHLD coalesces, so poll the child rather than trusting info.si_pid
        int status = 0;
        pid_t rc = 0;
        do {
            rc = waitpid(process_.pid, &status, WNOHANG);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            throw LaunchError(ErrorCode::kSupervisionFailure,
                              std::format("waitpid({}): {}", process_.pid, ErrnoString(errno)));
        }
        if (rc == 0) {
            continue;
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        CHECK(WIFSIGNALED(status)) << "Unexpected wait status " << status << " for pid " << process_.pid;
        const int term_signal = WTERMSIG(status);
        LOG(WARNING) << "Job pid " << process_.pid << " was terminated by " << strsignal(term_signal);
        return SignalExitCode(term_signal);
    }
}

void JobSupervisor::TerminateAndReap() {
    LOG(ERROR) << "Supervision of pid " << process_.pid << " failed, terminating it";
    if (kill(process_.pid, SIGTERM) != 0) {
        PLOG(WARNING) << "kill(" << process_.pid << ", SIGTERM)";
    }
    int status = 0;
    pid_t rc = 0;
    do {
        rc = waitpid(process_.pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        PLOG(WARNING) << "waitpid(" << process_.pid << ")";
    }
}

void JobSupervisor::ForwardSignal(int signo) {
    const int forwarded = options_.forward_as == 0 ? signo : options_.forward_as;
    LOG(WARNING) << "Received " << strsignal(signo) << ", forwarding " << strsignal(forwarded) << " to pid "
                 << process_.pid;

    process_.forwarded_signal = forwarded;
    if (process_.state == SupervisorState::kRunning) {
        Transition(SupervisorState::kSignalForwarded);
    }
    if (kill(process_.pid, forwarded) != 0) {
        PLOG(WARNING) << "kill(" << process_.pid << ", " << forwarded << ")";
    }
}

} // namespace rdzv_launch::supervisor
