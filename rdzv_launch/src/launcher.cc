#include "rdzv_launch/include/launcher.h"

#include <exception>
#include <sstream>
#include <utility>

#include "glog/logging.h"

#include "rdzv_launch/include/errors.h"
#include "rdzv_launch/include/supervisor/job_supervisor.h"

namespace rdzv_launch {

namespace {

std::vector<std::string> SplitWords(const std::string &text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) { words.push_back(word); }
    return words;
}

} // namespace

Launcher::Launcher(LaunchOptions options, slurm::EnvLookup lookup)
    : options_(std::move(options)), lookup_(std::move(lookup)) {}

LaunchPlan Launcher::Prepare(const std::vector<std::string> &program, Environment base_env) const {
    if (program.empty()) {
        throw ConfigurationError(ErrorCode::kUsage, "no training program specified");
    }

    LaunchPlan plan;
    plan.allocation = slurm::AllocationReader(lookup_).Read();
    const auto &ctx = plan.allocation;

    std::string nodelist;
    for (const auto &host : ctx.host_list) { nodelist += (nodelist.empty() ? "" : ",") + host; }
    LOG(INFO) << "Job id := " << ctx.job_id;
    LOG(INFO) << "Nodelist := " << nodelist;
    LOG(INFO) << "Number of nodes := " << ctx.node_count;
    LOG(INFO) << "Ntasks per node := " << ctx.tasks_per_node;

    plan.params = DeriveRendezvousParameters(ctx, options_.port_policy);

    plan.extra = BuildTuningVariables(options_.tuning, ctx);
    for (auto &[name, value] : ParseEnvAssignments(options_.env_assignments)) { plan.extra[name] = std::move(value); }

    plan.env = std::move(base_env);
    EnvironmentPublisher(&plan.env).Publish(plan.params, plan.extra);

    LOG(INFO) << kMasterPortVar << " := " << plan.params.coordination_port;
    LOG(INFO) << kWorldSizeVar << " := " << plan.params.world_size;
    LOG(INFO) << kMasterAddrVar << " := " << plan.params.coordination_address;
    for (const auto &[name, value] : plan.extra) { LOG(INFO) << name << " := " << value; }

    if (options_.use_srun) {
        plan.command = "srun";
        plan.args = SplitWords(options_.srun_args);
        plan.args.push_back(program.front());
    } else {
        plan.command = program.front();
    }
    plan.args.insert(plan.args.end(), program.begin() + 1, program.end());
    return plan;
}

int Launcher::Run(const std::vector<std::string> &program, Environment base_env) const {
    const LaunchPlan plan = Prepare(program, std::move(base_env));

    if (options_.dry_run) {
        std::string line = plan.command;
        for (const auto &arg : plan.args) { line += " " + arg; }
        LOG(INFO) << "Dry run, not spawning: " << line;
        return 0;
    }

    supervisor::SupervisorOptions supervisor_options;
    if (options_.forward_received_signal) {
        supervisor_options.forward_as = 0;
    }
    supervisor::JobSupervisor job_supervisor(supervisor_options);
    return job_supervisor.Run(plan.command, plan.args, plan.env);
}

int RunAndReportExitCode(const Launcher &launcher, const std::vector<std::string> &program, Environment base_env) {
    try {
        return launcher.Run(program, std::move(base_env));
    } catch (const LaunchError &e) {
        LOG(ERROR) << ErrorCodeName(e.code()) << ": " << e.what();
        return e.exit_code();
    } catch (const std::exception &e) {
        LOG(ERROR) << "Unexpected launcher failure: " << e.what();
        return static_cast<int>(ErrorCode::kSupervisionFailure);
    }
}

} // namespace rdzv_launch
