#include "rdzv_launch/include/environment.h"

#include <format>
#include <string>

#include <unistd.h>

#include "glog/logging.h"

#include "rdzv_launch/include/errors.h"

extern char **environ;

namespace rdzv_launch {

Environment Environment::FromProcess() {
    Environment env;
    for (char **entry = environ; entry && *entry; ++entry) {
        const std::string kv(*entry);
        const size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.Set(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return env;
}

void Environment::Set(const std::string &name, const std::string &value) {
    CHECK(!name.empty() && name.find('=') == std::string::npos) << "Invalid environment variable name: " << name;
    variables_[name] = value;
}

std::optional<std::string> Environment::Get(const std::string &name) const {
    auto it = variables_.find(name);
    return it == variables_.end() ? std::nullopt : std::optional<std::string>(it->second);
}

bool Environment::Contains(const std::string &name) const { return variables_.contains(name); }

size_t Environment::size() const { return variables_.size(); }

const std::map<std::string, std::string> &Environment::variables() const { return variables_; }

std::vector<std::string> Environment::ToEnvp() const {
    std::vector<std::string> envp;
    envp.reserve(variables_.size());
    for (const auto &[name, value] : variables_) { envp.push_back(name + "=" + value); }
    return envp;
}

EnvironmentPublisher::EnvironmentPublisher(Environment *env) : env_(env) { CHECK(env_ != nullptr); }

void EnvironmentPublisher::Publish(const RendezvousParameters &params,
                                   const std::map<std::string, std::string> &extra) {
    for (const char *reserved : {kMasterPortVar, kWorldSizeVar, kMasterAddrVar}) {
        if (extra.contains(reserved)) {
            throw ConfigurationError(ErrorCode::kInvalidConfiguration,
                                     std::format("{} is derived by the launcher and cannot be overridden", reserved));
        }
    }
    for (const auto &[name, value] : extra) {
        if (name.empty() || name.find('=') != std::string::npos) {
            throw ConfigurationError(ErrorCode::kInvalidConfiguration,
                                     std::format("invalid environment variable name \"{}\"", name));
        }
    }

    env_->Set(kMasterPortVar, std::to_string(params.coordination_port));
    env_->Set(kWorldSizeVar, std::to_string(params.world_size));
    env_->Set(kMasterAddrVar, params.coordination_address);
    for (const auto &[name, value] : extra) { env_->Set(name, value); }
}

} // namespace rdzv_launch
