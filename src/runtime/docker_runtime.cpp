#include "runtime/docker_runtime.hpp"

#include <cctype>
#include <cmath>
#include <utility>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::runtime {
namespace {

constexpr auto kEngineTimeout = std::chrono::minutes(5);
constexpr auto kKillTimeout = std::chrono::seconds(10);
constexpr const char* kTag = "docker";

std::chrono::milliseconds ToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

std::string FirstLine(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    const auto pos = trimmed.find('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(0, pos);
}

// "12.5MiB", "1.2GB", "512kB" -> bytes. Returns 0 when unparsable.
std::int64_t ParseEngineSize(const std::string& text) {
    const auto value = utils::Trim(text);
    std::size_t pos = 0;
    while (pos < value.size() && (std::isdigit(static_cast<unsigned char>(value[pos])) || value[pos] == '.')) {
        ++pos;
    }
    if (pos == 0) {
        return 0;
    }
    double magnitude = 0.0;
    try {
        magnitude = std::stod(value.substr(0, pos));
    } catch (const std::exception&) {
        return 0;
    }
    const auto unit = utils::ToLower(utils::Trim(value.substr(pos)));
    double multiplier = 1.0;
    if (unit == "kib") {
        multiplier = 1024.0;
    } else if (unit == "mib") {
        multiplier = 1024.0 * 1024.0;
    } else if (unit == "gib") {
        multiplier = 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "tib") {
        multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "kb") {
        multiplier = 1e3;
    } else if (unit == "mb") {
        multiplier = 1e6;
    } else if (unit == "gb") {
        multiplier = 1e9;
    } else if (unit == "tb") {
        multiplier = 1e12;
    }
    return static_cast<std::int64_t>(magnitude * multiplier);
}

}  // namespace

DockerRuntime::DockerRuntime(config::SandboxConfig config, std::shared_ptr<sandbox::ProcessRunner> runner)
    : config_(std::move(config))
    , runner_(std::move(runner)) {}

void DockerRuntime::Initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        return;
    }
    utils::LogInfo(kTag, "initializing runtime", {{"engine", config_.container.engine_binary}});
    try {
        RunEngine({"version"});
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "engine is not usable", {{"error", ex.what()}});
        throw;
    }
    initialized_ = true;
}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const config::RuntimeOptions& options,
                                                        const std::string& name) {
    const auto& limits = options.resource_limits;
    const auto& container = options.container;
    std::vector<std::string> args = {
        "create",
        "--name", name,
        "--workdir", options.working_dir,
        "--network", container.network_mode,
        "--cpus", limits.Cpu(),
        "--memory", limits.Memory(),
        "--pids-limit", std::to_string(limits.MaxProcesses()),
        "--label", "warden.managed=true"
    };
    for (const auto& [host_path, container_path] : container.volumes) {
        args.push_back("-v");
        args.push_back(host_path + ":" + container_path);
    }
    for (const auto& [key, value] : container.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    if (container.privileged) {
        args.push_back("--privileged");
    }
    if (container.entrypoint) {
        args.push_back("--entrypoint");
        args.push_back(*container.entrypoint);
    }
    args.push_back(container.image);
    if (container.command) {
        args.push_back("sh");
        args.push_back("-c");
        args.push_back(*container.command);
    } else if (!container.entrypoint) {
        // Keep the container alive so that exec has something to attach to.
        args.push_back("sleep");
        args.push_back("infinity");
    }
    return args;
}

std::string DockerRuntime::NormalizeState(const std::string& engine_state) {
    const auto state = utils::ToLower(utils::Trim(engine_state));
    if (state == "running" || state == "restarting") {
        return "running";
    }
    if (state == "exited" || state == "created" || state == "dead" || state == "removing" || state == "stopped") {
        return "stopped";
    }
    if (state == "paused") {
        return "paused";
    }
    return "unknown";
}

std::string DockerRuntime::CreateContainer(const config::RuntimeOptions& options) {
    Initialize();

    const auto name = options.container.name_prefix + "-" + utils::GenerateHexId(12);
    const auto container_id = RunEngine(BuildCreateArgs(options, name));
    if (container_id.empty()) {
        throw EngineError("engine returned no container id for " + name);
    }

    try {
        RunEngine({"start", container_id});
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "start failed, discarding container", {{"id", container_id}, {"error", ex.what()}});
        try {
            RunEngine({"rm", "-f", container_id}, false);
        } catch (const EngineError& cleanup_ex) {
            utils::LogWarn(kTag, "discard failed", {{"id", container_id}, {"error", cleanup_ex.what()}});
        }
        throw;
    }

    ContainerRecord record{};
    record.container_id = container_id;
    record.name = name;
    record.options = std::make_shared<const config::RuntimeOptions>(options);
    record.status = "running";
    record.created_at = utils::Now();
    containers_.Insert(std::move(record));

    utils::LogInfo(kTag, "container created", {{"id", container_id}, {"name", name}, {"image", options.container.image}});
    return container_id;
}

CommandResult DockerRuntime::ExecuteCommand(const std::string& container_id,
                                            const std::string& command,
                                            double timeout_s,
                                            std::shared_ptr<const sandbox::CancelToken> cancel) {
    containers_.Get(container_id);
    const double effective_timeout = timeout_s > 0.0 ? timeout_s : config_.resource_limits.TimeoutSeconds();

    // The exec'd shell records its pid so that a timed-out command can be
    // killed inside the container, not just the local engine client. It
    // removes the file itself whenever the command ends on its own.
    const auto pid_file = "/tmp/.warden-exec-" + utils::GenerateHexId(12) + ".pid";
    const auto wrapped = "echo $$ > " + pid_file + " 2>/dev/null; sh -c " + utils::ShellQuote(command) +
                         "; status=$?; rm -f " + pid_file + "; exit $status";

    utils::LogDebug(kTag, "exec", {{"id", container_id}, {"command", command}});

    CommandResult result{};
    try {
        const auto process = RunEngineRaw({"exec", container_id, "sh", "-c", wrapped},
                                          ToMillis(effective_timeout), std::move(cancel));
        if (process.timed_out || process.cancelled) {
            KillExecProcess(container_id, pid_file);
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
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "exec failed", {{"id", container_id}, {"error", ex.what()}});
        result.success = false;
        result.return_code = -1;
        result.output = ex.what();
        result.error = ex.what();
    }
    return result;
}

bool DockerRuntime::CopyToContainer(const std::string& container_id,
                                    const std::string& host_path,
                                    const std::string& container_path) {
    containers_.Get(container_id);
    try {
        RunEngine({"cp", host_path, container_id + ":" + container_path});
        utils::LogDebug(kTag, "copied into container", {{"id", container_id}, {"from", host_path}, {"to", container_path}});
        return true;
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "copy into container failed", {{"id", container_id}, {"error", ex.what()}});
        return false;
    }
}

bool DockerRuntime::CopyFromContainer(const std::string& container_id,
                                      const std::string& container_path,
                                      const std::string& host_path) {
    containers_.Get(container_id);
    try {
        RunEngine({"cp", container_id + ":" + container_path, host_path});
        utils::LogDebug(kTag, "copied from container", {{"id", container_id}, {"from", container_path}, {"to", host_path}});
        return true;
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "copy from container failed", {{"id", container_id}, {"error", ex.what()}});
        return false;
    }
}

ContainerStatus DockerRuntime::GetContainerStatus(const std::string& container_id) {
    const auto record = containers_.Get(container_id);

    ContainerStatus status{};
    status.container_id = container_id;
    status.name = record.name;
    status.created_at = record.created_at;
    try {
        const auto inspect = nlohmann::json::parse(RunEngine({"inspect", container_id}));
        if (!inspect.is_array() || inspect.empty()) {
            throw EngineError("unexpected inspect output for " + container_id);
        }
        status.status = NormalizeState(inspect.at(0).at("State").at("Status").get<std::string>());
        containers_.SetStatus(container_id, status.status);
        if (status.status == "running" && record.options && record.options->enable_monitoring) {
            ReadUsage(container_id, status);
        }
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "inspect failed", {{"id", container_id}, {"error", ex.what()}});
        status.status = "unknown";
        status.error = ex.what();
    }
    return status;
}

void DockerRuntime::ReadUsage(const std::string& container_id, ContainerStatus& status) {
    try {
        const auto stats = nlohmann::json::parse(
            RunEngine({"stats", "--no-stream", "--format", "{{json .}}", container_id}));
        if (stats.contains("CPUPerc") && stats["CPUPerc"].is_string()) {
            auto cpu = stats["CPUPerc"].get<std::string>();
            if (!cpu.empty() && cpu.back() == '%') {
                cpu.pop_back();
            }
            status.cpu_usage = std::stod(cpu);
        }
        if (stats.contains("MemUsage") && stats["MemUsage"].is_string()) {
            const auto mem = stats["MemUsage"].get<std::string>();
            status.memory_usage = ParseEngineSize(mem.substr(0, mem.find('/')));
        }
    } catch (const std::exception& ex) {
        utils::LogDebug(kTag, "usage unavailable", {{"id", container_id}, {"error", ex.what()}});
    }
}

bool DockerRuntime::StopContainer(const std::string& container_id) {
    containers_.Get(container_id);
    try {
        RunEngine({"stop", container_id});
    } catch (const EngineError& ex) {
        utils::LogError(kTag, "stop failed", {{"id", container_id}, {"error", ex.what()}});
        return false;
    }
    containers_.SetStatus(container_id, "stopped");
    utils::LogInfo(kTag, "container stopped", {{"id", container_id}});
    return true;
}

void DockerRuntime::RemoveContainer(const std::string& container_id, bool force) {
    containers_.Get(container_id);
    const auto status = GetContainerStatus(container_id);
    if (status.status == "running" && !StopContainer(container_id)) {
        utils::LogWarn(kTag, "removing a container that did not stop", {{"id", container_id}});
    }

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(container_id);
    RunEngine(args);

    containers_.Erase(container_id);
    utils::LogInfo(kTag, "container removed", {{"id", container_id}});
}

std::vector<ContainerStatus> DockerRuntime::GetAllContainers() {
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

void DockerRuntime::CleanupAll() {
    utils::LogInfo(kTag, "cleaning up all containers", {{"count", std::to_string(containers_.Size())}});
    for (const auto& id : containers_.Ids()) {
        try {
            RemoveContainer(id);
        } catch (const std::exception& ex) {
            utils::LogError(kTag, "cleanup failed", {{"id", id}, {"error", ex.what()}});
        }
    }
}

void DockerRuntime::Shutdown() {
    if (config_.cleanup) {
        CleanupAll();
    }
}

sandbox::ProcessResult DockerRuntime::RunEngineRaw(const std::vector<std::string>& args,
                                                   std::chrono::milliseconds timeout,
                                                   std::shared_ptr<const sandbox::CancelToken> cancel) {
    sandbox::ProcessRequest request{};
    request.argv.reserve(args.size() + 1);
    request.argv.push_back(config_.container.engine_binary);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.timeout = timeout;
    request.cancel = std::move(cancel);
    try {
        return runner_->Run(request);
    } catch (const sandbox::ProcessError& ex) {
        throw EngineError(ex.what());
    }
}

std::string DockerRuntime::RunEngine(const std::vector<std::string>& args, bool check) {
    const auto verb = args.empty() ? std::string() : args.front();
    const auto result = RunEngineRaw(args, kEngineTimeout);
    if (result.timed_out) {
        throw EngineError(config_.container.engine_binary + " " + verb + " timed out");
    }
    if (check && result.exit_code != 0) {
        auto message = FirstLine(result.error);
        if (message.empty()) {
            message = "exit code " + std::to_string(result.exit_code);
        }
        throw EngineError(config_.container.engine_binary + " " + verb + " failed: " + message);
    }
    return utils::Trim(result.output);
}

void DockerRuntime::KillExecProcess(const std::string& container_id, const std::string& pid_file) {
    // The recorded shell waits on the command, so its children go first when
    // it does not lead a process group of its own.
    const auto script = "pid=$(cat " + pid_file + " 2>/dev/null) && "
                        "{ kill -KILL -\"$pid\" 2>/dev/null || { "
                        "for child in $(cat /proc/\"$pid\"/task/*/children 2>/dev/null); do kill -KILL \"$child\"; done; "
                        "kill -KILL \"$pid\"; }; }; rm -f " + pid_file;
    try {
        const auto result = RunEngineRaw({"exec", container_id, "sh", "-c", script}, kKillTimeout);
        if (result.exit_code != 0) {
            utils::LogWarn(kTag, "could not kill exec process", {{"id", container_id}, {"error", utils::Trim(result.error)}});
        }
    } catch (const EngineError& ex) {
        utils::LogWarn(kTag, "could not kill exec process", {{"id", container_id}, {"error", ex.what()}});
    }
}

}  // namespace warden::runtime
