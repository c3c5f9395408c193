#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/container_runtime.hpp"
#include "runtime/container_table.hpp"
#include "sandbox/process_runner.hpp"

namespace warden::runtime {

// Drives a container engine through its command-line interface
// (`docker create/start/exec/cp/inspect/stats/stop/rm`).
class DockerRuntime : public ContainerRuntime {
public:
    DockerRuntime(config::SandboxConfig config, std::shared_ptr<sandbox::ProcessRunner> runner);

    std::string Name() const override { return "docker"; }
    void Initialize() override;
    std::string CreateContainer(const config::RuntimeOptions& options) override;
    CommandResult ExecuteCommand(const std::string& container_id,
                                 const std::string& command,
                                 double timeout_s,
                                 std::shared_ptr<const sandbox::CancelToken> cancel = nullptr) override;
    bool CopyToContainer(const std::string& container_id,
                         const std::string& host_path,
                         const std::string& container_path) override;
    bool CopyFromContainer(const std::string& container_id,
                           const std::string& container_path,
                           const std::string& host_path) override;
    ContainerStatus GetContainerStatus(const std::string& container_id) override;
    bool StopContainer(const std::string& container_id) override;
    void RemoveContainer(const std::string& container_id, bool force = true) override;
    std::vector<ContainerStatus> GetAllContainers() override;
    void CleanupAll() override;
    void Shutdown() override;

    // Arguments of the engine `create` call, without the engine binary.
    static std::vector<std::string> BuildCreateArgs(const config::RuntimeOptions& options,
                                                    const std::string& name);

    // Maps engine states (created, exited, dead, ...) onto running/stopped/paused/unknown.
    static std::string NormalizeState(const std::string& engine_state);

private:
    sandbox::ProcessResult RunEngineRaw(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout,
                                        std::shared_ptr<const sandbox::CancelToken> cancel = nullptr);
    // Returns trimmed stdout. Throws EngineError when the engine cannot be
    // started, times out, or (with check) exits non-zero.
    std::string RunEngine(const std::vector<std::string>& args, bool check = true);
    void KillExecProcess(const std::string& container_id, const std::string& pid_file);
    void ReadUsage(const std::string& container_id, ContainerStatus& status);

    config::SandboxConfig config_;
    std::shared_ptr<sandbox::ProcessRunner> runner_;
    ContainerTable containers_;
    std::mutex init_mutex_;
    bool initialized_ = false;
};

}  // namespace warden::runtime
