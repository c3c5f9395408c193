#pragma once

#include <memory>

#include "config/sandbox_config.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/process_runner.hpp"

namespace warden::runtime {

// Builds the runtime for config.sandbox_type. A null runner means a real
// SubprocessRunner. Cluster and remote sandboxes throw ConfigError.
std::shared_ptr<ContainerRuntime> CreateRuntime(const config::SandboxConfig& config,
                                                std::shared_ptr<sandbox::ProcessRunner> runner = nullptr);

}  // namespace warden::runtime
