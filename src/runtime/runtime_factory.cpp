#include "runtime/runtime_factory.hpp"

#include <string>
#include <utility>

#include "runtime/docker_runtime.hpp"
#include "runtime/local_runtime.hpp"
#include "utils/logging.hpp"

namespace warden::runtime {

std::shared_ptr<ContainerRuntime> CreateRuntime(const config::SandboxConfig& config,
                                                std::shared_ptr<sandbox::ProcessRunner> runner) {
    if (!runner) {
        runner = std::make_shared<sandbox::SubprocessRunner>();
    }
    switch (config.sandbox_type) {
        case config::SandboxType::kContainer:
            return std::make_shared<DockerRuntime>(config, std::move(runner));
        case config::SandboxType::kLocal:
            return std::make_shared<LocalRuntime>(config, std::move(runner));
        case config::SandboxType::kCluster:
        case config::SandboxType::kRemote:
            break;
    }
    const std::string type = config::ToString(config.sandbox_type);
    utils::LogError("runtime", "unsupported sandbox type", {{"type", type}});
    throw config::ConfigError("sandbox type '" + type + "' has no runtime on this host");
}

}  // namespace warden::runtime
