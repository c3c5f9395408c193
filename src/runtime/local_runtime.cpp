#include "runtime/local_runtime.hpp"

#include <cmath>
#include <iterator>
#include <system_error>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::runtime {
namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "local";

fs::path DefaultBaseDir() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "warden-sandboxes";
}

// True when `path` equals `root` or lies below it. Both must be normalized.
bool IsWithin(const fs::path& root, const fs::path& path) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        if (root_it->empty() && std::next(root_it) == root.end()) {
            // Trailing separator.
            return true;
        }
        if (path_it == path.end() || *root_it != *path_it) {
            return false;
        }
    }
    return true;
}

void CopyPath(const fs::path& source, fs::path target) {
    if (!fs::exists(source)) {
        throw RuntimeError("no such file or directory: " + source.string());
    }
    if (fs::is_directory(target)) {
        target /= source.filename();
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }
    fs::copy(source, target, fs::copy_options::overwrite_existing | fs::copy_options::recursive);
}

}  // namespace

LocalRuntime::LocalRuntime(config::SandboxConfig config, std::shared_ptr<sandbox::ProcessRunner> runner)
    : config_(std::move(config))
    , runner_(std::move(runner))
    , base_dir_(config_.local.base_dir.empty() ? DefaultBaseDir() : fs::path(config_.local.base_dir)) {
    base_dir_ = fs::absolute(base_dir_).lexically_normal();
}

void LocalRuntime::Initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return;
    }
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        utils::LogError(kTag, "cannot create base directory", {{"path", base_dir_.string()}, {"error", ec.message()}});
        throw EngineError("cannot create " + base_dir_.string() + ": " + ec.message());
    }
    utils::LogInfo(kTag, "initialized runtime", {{"base_dir", base_dir_.string()}});
    initialized_ = true;
}

std::string LocalRuntime::CreateContainer(const config::RuntimeOptions& options) {
    Initialize();

    const auto container_id = utils::GenerateHexId(12);
    const auto name = options.container.name_prefix + "-" + container_id;
    const auto root = base_dir_ / name;
    const auto workdir = (root / fs::path(options.working_dir).relative_path()).lexically_normal();
    if (!IsWithin(root, workdir)) {
        throw EngineError("working directory escapes the sandbox: " + options.working_dir);
    }

    std::error_code ec;
    fs::create_directories(workdir, ec);
    if (ec) {
        throw EngineError("cannot create " + workdir.string() + ": " + ec.message());
    }

    ContainerRecord record{};
    record.container_id = container_id;
    record.name = name;
    record.options = std::make_shared<const config::RuntimeOptions>(options);
    record.status = "running";
    record.created_at = utils::Now();
    containers_.Insert(std::move(record));

    utils::LogInfo(kTag, "container created", {{"id", container_id}, {"root", root.string()}});
    return container_id;
}

fs::path LocalRuntime::RootOf(const std::string& container_id) const {
    return base_dir_ / containers_.Get(container_id).name;
}

fs::path LocalRuntime::ResolvePath(const std::string& container_id, const std::string& container_path) const {
    const auto record = containers_.Get(container_id);
    const auto root = base_dir_ / record.name;
    const fs::path inner(container_path);
    fs::path resolved;
    if (inner.is_absolute()) {
        resolved = root / inner.relative_path();
    } else {
        // Same mapping CreateContainer used for the working directory.
        resolved = root / fs::path(record.options->working_dir).relative_path() / inner;
    }
    resolved = resolved.lexically_normal();
    if (!IsWithin(root, resolved)) {
        throw RuntimeError("path escapes the sandbox: " + container_path);
    }
    return resolved;
}

CommandResult LocalRuntime::ExecuteCommand(const std::string& container_id,
                                           const std::string& command,
                                           double timeout_s,
                                           std::shared_ptr<const sandbox::CancelToken> cancel) {
    const auto record = containers_.Get(container_id);
    CommandResult result{};
    if (record.status != "running") {
        result.success = false;
        result.output = "container is " + record.status;
        result.error = "container " + container_id + " is not running";
        return result;
    }

    const double effective_timeout = timeout_s > 0.0 ? timeout_s : config_.resource_limits.TimeoutSeconds();
    const auto& limits = record.options->resource_limits;

    sandbox::ProcessRequest request{};
    request.argv = {"/bin/sh", "-c", command};
    request.working_dir =
        (base_dir_ / record.name / fs::path(record.options->working_dir).relative_path()).lexically_normal().string();
    request.environment = record.options->container.environment;
    request.environment["WARDEN_SANDBOX_ROOT"] = (base_dir_ / record.name).string();
    request.timeout = std::chrono::milliseconds(static_cast<long long>(std::ceil(effective_timeout * 1000.0)));
    request.cancel = std::move(cancel);
    request.memory_limit_bytes = limits.MemoryBytes();
    request.file_size_limit_bytes = limits.DiskBytes();

    utils::LogDebug(kTag, "exec", {{"id", container_id}, {"command", command}});

    try {
        const auto process = runner_->Run(request);
        containers_.AddUsage(container_id, process.cpu_time_s, process.max_rss_kb);
        if (process.timed_out || process.cancelled) {
            result.success = false;
            result.return_code = -1;
            result.output = process.timed_out ? "command timed out" : "command cancelled";
            result.error = process.timed_out ? "timeout" : "cancelled";
            utils::LogWarn(kTag, "exec stopped early", {{"id", container_id}, {"reason", result.error}});
            return result;
        }
        result.return_code = process.exit_code;
        result.success = process.exit_code == 0;
        result.output = utils::Trim(process.output);
        if (!result.success) {
            result.error = utils::Trim(process.error);
            if (result.error.empty()) {
                result.error = "command exited with code " + std::to_string(process.exit_code);
            }
        }
    } catch (const sandbox::ProcessError& ex) {
        utils::LogError(kTag, "exec failed", {{"id", container_id}, {"error", ex.what()}});
        result.success = false;
        result.return_code = -1;
        result.output = ex.what();
        result.error = ex.what();
    }
    return result;
}

bool LocalRuntime::CopyToContainer(const std::string& container_id,
                                   const std::string& host_path,
                                   const std::string& container_path) {
    containers_.Get(container_id);
    try {
        CopyPath(fs::path(host_path), ResolvePath(container_id, container_path));
        utils::LogDebug(kTag, "copied into container", {{"id", container_id}, {"from", host_path}, {"to", container_path}});
        return true;
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "copy into container failed", {{"id", container_id}, {"error", ex.what()}});
        return false;
    }
}

bool LocalRuntime::CopyFromContainer(const std::string& container_id,
                                     const std::string& container_path,
                                     const std::string& host_path) {
    containers_.Get(container_id);
    try {
        CopyPath(ResolvePath(container_id, container_path), fs::path(host_path));
        utils::LogDebug(kTag, "copied from container", {{"id", container_id}, {"from", container_path}, {"to", host_path}});
        return true;
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "copy from container failed", {{"id", container_id}, {"error", ex.what()}});
        return false;
    }
}

ContainerStatus LocalRuntime::GetContainerStatus(const std::string& container_id) {
    const auto record = containers_.Get(container_id);

    ContainerStatus status{};
    status.container_id = container_id;
    status.name = record.name;
    status.created_at = record.created_at;
    status.status = record.status;
    if (record.options && record.options->enable_monitoring) {
        status.cpu_usage = record.cpu_time_s;
        status.memory_usage = record.max_rss_kb * 1024;
    }

    std::error_code ec;
    if (!fs::is_directory(base_dir_ / record.name, ec)) {
        status.status = "unknown";
        status.error = "sandbox directory is missing: " + (base_dir_ / record.name).string();
    }
    return status;
}

bool LocalRuntime::StopContainer(const std::string& container_id) {
    if (!containers_.SetStatus(container_id, "stopped")) {
        throw ContainerNotFoundError(container_id);
    }
    utils::LogInfo(kTag, "container stopped", {{"id", container_id}});
    return true;
}

void LocalRuntime::RemoveContainer(const std::string& container_id, bool force) {
    const auto record = containers_.Get(container_id);
    if (record.status == "running") {
        StopContainer(container_id);
    }

    const auto root = base_dir_ / record.name;
    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec) {
        if (!force) {
            throw EngineError("cannot remove " + root.string() + ": " + ec.message());
        }
        // Retry once after making everything writable again.
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::add, ec);
        for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code perm_ec;
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
        }
        ec.clear();
        fs::remove_all(root, ec);
        if (ec) {
            throw EngineError("cannot remove " + root.string() + ": " + ec.message());
        }
    }

    containers_.Erase(container_id);
    utils::LogInfo(kTag, "container removed", {{"id", container_id}});
}

std::vector<ContainerStatus> LocalRuntime::GetAllContainers() {
    std::vector<ContainerStatus> statuses;
    for (const auto& id : containers_.Ids()) {
        try {
            statuses.push_back(GetContainerStatus(id));
        } catch (const ContainerNotFoundError&) {
            // Removed while we were listing.
        }
    }
    return statuses;
}

void LocalRuntime::CleanupAll() {
    utils::LogInfo(kTag, "cleaning up all containers", {{"count", std::to_string(containers_.Size())}});
    for (const auto& id : containers_.Ids()) {
        try {
            RemoveContainer(id);
        } catch (const std::exception& ex) {
            utils::LogError(kTag, "cleanup failed", {{"id", id}, {"error", ex.what()}});
        }
    }
}

void LocalRuntime::Shutdown() {
    if (config_.cleanup) {
        CleanupAll();
    }
}

}  // namespace warden::runtime
