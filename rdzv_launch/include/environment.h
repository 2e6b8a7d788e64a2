#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rdzv_launch/include/rendezvous.h"

namespace rdzv_launch {

constexpr char kMasterPortVar[] = "MASTER_PORT";
constexpr char kWorldSizeVar[] = "WORLD_SIZE";
constexpr char kMasterAddrVar[] = "MASTER_ADDR";

// Environment handed to the workload. Built completely before spawn, read-only afterwards.
class Environment {
public:
    Environment() = default;

    // Snapshot of the launcher's own environment, so PATH and SLURM_* still reach the workload.
    static Environment FromProcess();

    void Set(const std::string &name, const std::string &value);

    std::optional<std::string> Get(const std::string &name) const;

    bool Contains(const std::string &name) const;

    size_t size() const;

    const std::map<std::string, std::string> &variables() const;

    // "NAME=value" entries in name order, suitable for execvpe.
    std::vector<std::string> ToEnvp() const;

private:
    std::map<std::string, std::string> variables_;
};

class EnvironmentPublisher {
public:
    explicit EnvironmentPublisher(Environment *env);

    /**
     * @brief Write MASTER_PORT, WORLD_SIZE, MASTER_ADDR and every extra entry.
     *
     * Each key is set exactly once; publishing the same values again leaves
     * the environment unchanged. Extra values are forwarded verbatim.
     *
     * @throws ConfigurationError(kInvalidConfiguration) if extra names one of
     *         the rendezvous variables.
     */
    void Publish(const RendezvousParameters &params, const std::map<std::string, std::string> &extra = {});

private:
    Environment *env_ = nullptr;
};

} // namespace rdzv_launch
