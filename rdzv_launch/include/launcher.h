#pragma once

#include <map>
#include <string>
#include <vector>

#include "rdzv_launch/include/environment.h"
#include "rdzv_launch/include/rendezvous.h"
#include "rdzv_launch/include/slurm/allocation.h"
#include "rdzv_launch/include/tuning.h"

namespace rdzv_launch {

struct LaunchOptions {
    PortPolicy port_policy;
    // Start the program through srun so it runs on every allocated task.
    bool use_srun = true;
    // Space separated options placed between "srun" and the program.
    std::string srun_args = "-W 0";
    bool forward_received_signal = false;
    bool dry_run = false;
    TuningConfig tuning;
    // "K1=V1,K2=V2", applied over the tuning variables.
    std::string env_assignments;
};

// Everything decided before the program is spawned.
struct LaunchPlan {
    slurm::AllocationContext allocation;
    RendezvousParameters params;
    // Tuning variables merged with the --env assignments.
    std::map<std::string, std::string> extra;
    Environment env;
    std::string command;
    std::vector<std::string> args;
};

class Launcher {
public:
    explicit Launcher(LaunchOptions options, slurm::EnvLookup lookup = slurm::ProcessEnvLookup());

    /**
     * @brief Read the allocation, derive and publish the job environment and build the command line.
     *
     * `program` is the workload argv, program name first. `base_env` is the
     * environment the workload inherits before the published variables are
     * applied on top.
     *
     * @throws ConfigurationError(kUsage) if `program` is empty, and any error of
     * the allocation reader, the deriver or the publisher.
     */
    LaunchPlan Prepare(const std::vector<std::string> &program, Environment base_env) const;

    /**
     * @brief Prepare and run the workload under a JobSupervisor.
     *
     * Returns the workload's exit code, or 0 for a dry run. Launcher failures
     * are thrown as LaunchError.
     */
    int Run(const std::vector<std::string> &program, Environment base_env = Environment::FromProcess()) const;

private:
    LaunchOptions options_;
    slurm::EnvLookup lookup_;
};

// Runs the launcher and turns its failures into the process exit code.
int RunAndReportExitCode(const Launcher &launcher, const std::vector<std::string> &program,
                         Environment base_env = Environment::FromProcess());

} // namespace rdzv_launch
