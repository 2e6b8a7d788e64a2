#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "rdzv_launch/include/launcher.h"

// rendezvous
DEFINE_int32(port_base, 10000, "Lowest coordination port; the job id selects an offset above it");
DEFINE_int32(port_range, 10000, "Number of ports the job id offset is reduced into");
// launch
DEFINE_bool(use_srun, true, "Start the program through srun so it runs on every allocated task");
DEFINE_string(srun_args, "-W 0", "Space separated options passed to srun before the program");
DEFINE_bool(forward_received_signal, false,
            "Forward SIGINT/SIGTERM unchanged instead of always sending SIGTERM to the job");
DEFINE_bool(dry_run, false, "Derive and log the job environment, then exit without spawning");
// tuning
DEFINE_int32(omp_num_threads, -1, "OMP_NUM_THREADS; -1 uses SLURM_CPUS_PER_TASK, 0 leaves it unset");
DEFINE_string(nccl_socket_ifname, "hsn", "NCCL_SOCKET_IFNAME, empty leaves it unset");
DEFINE_int32(nccl_nsocks_perthread, 4, "NCCL_NSOCKS_PERTHREAD, 0 leaves it unset");
DEFINE_int32(nccl_socket_nthreads, 2, "NCCL_SOCKET_NTHREADS, 0 leaves it unset");
DEFINE_int32(nccl_min_channels, 32, "NCCL_MIN_CHANNELS, 0 leaves it unset");
DEFINE_string(env, "", "Extra variables for the job, as NAME=VALUE[,NAME=VALUE...]");

using namespace rdzv_launch;

int main(int argc, char **argv) {
    gflags::SetUsageMessage("rdzv_run [flags] -- <program> [args...]\n"
                            "Derives MASTER_ADDR/MASTER_PORT/WORLD_SIZE from the Slurm allocation, "
                            "runs the program and forwards SIGINT/SIGTERM to it.");
    // Scheduler output files should capture the launcher log.
    FLAGS_logtostderr = true;
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);

    LaunchOptions options;
    options.port_policy = {.base = FLAGS_port_base, .range = FLAGS_port_range};
    options.use_srun = FLAGS_use_srun;
    options.srun_args = FLAGS_srun_args;
    options.forward_received_signal = FLAGS_forward_received_signal;
    options.dry_run = FLAGS_dry_run;
    options.tuning.omp_num_threads = FLAGS_omp_num_threads;
    options.tuning.nccl_socket_ifname = FLAGS_nccl_socket_ifname;
    options.tuning.nccl_nsocks_perthread = FLAGS_nccl_nsocks_perthread;
    options.tuning.nccl_socket_nthreads = FLAGS_nccl_socket_nthreads;
    options.tuning.nccl_min_channels = FLAGS_nccl_min_channels;
    options.env_assignments = FLAGS_env;

    const std::vector<std::string> program(argv + 1, argv + argc);
    return RunAndReportExitCode(Launcher(options), program);
}
