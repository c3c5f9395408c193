#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/sandbox_config.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/cancel_token.hpp"

namespace warden::runtime {

class RuntimeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The backend (engine CLI, filesystem) refused or failed an operation.
class EngineError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

class ContainerNotFoundError : public RuntimeError {
public:
    explicit ContainerNotFoundError(const std::string& container_id)
        : RuntimeError("container not found: " + container_id)
        , container_id_(container_id) {}

    const std::string& ContainerId() const { return container_id_; }

private:
    std::string container_id_;
};

struct CommandResult {
    bool success = false;
    std::string output;
    int return_code = -1;
    std::string error;
};

struct ContainerStatus {
    std::string container_id;
    std::string name;
    // running, stopped, paused or unknown
    std::string status = "unknown";
    double cpu_usage = 0.0;
    std::int64_t memory_usage = 0;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::string> error;
};

nlohmann::json ToJson(const CommandResult& result);
nlohmann::json ToJson(const ContainerStatus& status);

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual std::string Name() const = 0;

    // Probes the backend. Idempotent; throws EngineError when unusable.
    virtual void Initialize() = 0;

    // Returns the new container id. Nothing is registered on failure.
    virtual std::string CreateContainer(const config::RuntimeOptions& options) = 0;

    // Day-to-day failures (non-zero exit, timeout, cancellation, backend
    // errors) come back as a failed CommandResult. Only an unknown id throws.
    // A non-positive timeout uses the runtime's configured default.
    virtual CommandResult ExecuteCommand(const std::string& container_id,
                                         const std::string& command,
                                         double timeout_s,
                                         std::shared_ptr<const sandbox::CancelToken> cancel = nullptr) = 0;

    virtual bool CopyToContainer(const std::string& container_id,
                                 const std::string& host_path,
                                 const std::string& container_path) = 0;
    virtual bool CopyFromContainer(const std::string& container_id,
                                   const std::string& container_path,
                                   const std::string& host_path) = 0;

    virtual ContainerStatus GetContainerStatus(const std::string& container_id) = 0;
    virtual bool StopContainer(const std::string& container_id) = 0;

    // Stops the container first when it is still running. The table entry is
    // erased only after the backend removal succeeded.
    virtual void RemoveContainer(const std::string& container_id, bool force = true) = 0;

    virtual std::vector<ContainerStatus> GetAllContainers() = 0;
    virtual void CleanupAll() = 0;

    // Runs CleanupAll() when the runtime was configured with cleanup=true.
    virtual void Shutdown() = 0;
};

}  // namespace warden::runtime
