#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/container_runtime.hpp"
#include "runtime/container_table.hpp"
#include "sandbox/process_runner.hpp"

namespace warden::runtime {

// Sandboxes backed by private host directories. Commands run as host
// processes in their own process group under RLIMIT_DATA / RLIMIT_FSIZE.
class LocalRuntime : public ContainerRuntime {
public:
    LocalRuntime(config::SandboxConfig config, std::shared_ptr<sandbox::ProcessRunner> runner);

    std::string Name() const override { return "local"; }
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

    const std::filesystem::path& BaseDir() const { return base_dir_; }

    // Host directory backing the container. Throws ContainerNotFoundError.
    std::filesystem::path RootOf(const std::string& container_id) const;

    // Maps a path as seen inside the container onto the host. Relative paths
    // are taken from the working directory. Throws RuntimeError when the
    // result would leave the container root.
    std::filesystem::path ResolvePath(const std::string& container_id, const std::string& container_path) const;

private:
    config::SandboxConfig config_;
    std::shared_ptr<sandbox::ProcessRunner> runner_;
    std::filesystem::path base_dir_;
    ContainerTable containers_;
    std::mutex init_mutex_;
    bool initialized_ = false;
};

}  // namespace warden::runtime
