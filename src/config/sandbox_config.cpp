#include "config/sandbox_config.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

#include "utils/common.hpp"

namespace warden::config {
namespace {

bool IsDecimal(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    int dots = 0;
    int digits = 0;
    for (char c : value) {
        if (c == '.') {
            ++dots;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            ++digits;
        } else {
            return false;
        }
    }
    return dots < 2 && digits > 0;
}

double ParseDecimal(const std::string& value) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigError("'" + value + "' is not a representable number");
    }
}

void ValidateCpu(const std::string& cpu) {
    if (!IsDecimal(cpu) || ParseDecimal(cpu) <= 0.0) {
        throw ConfigError("cpu limit must be a positive number such as '1' or '0.5', got '" + cpu + "'");
    }
}

void ValidateSize(const char* field, const std::string& value) {
    try {
        ParseByteSize(value);
    } catch (const ConfigError& ex) {
        throw ConfigError(std::string(field) + " limit is invalid: " + ex.what());
    }
}

std::string NumberToString(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    std::ostringstream oss;
    oss << value.get<double>();
    return oss.str();
}

std::string ReadString(const nlohmann::json& object, const char* key, const std::string& fallback) {
    if (!object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    if (!object[key].is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return object[key].get<std::string>();
}

bool ReadBool(const nlohmann::json& object, const char* key, bool fallback) {
    if (!object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    if (!object[key].is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    return object[key].get<bool>();
}

double ReadNumber(const nlohmann::json& object, const char* key, double fallback) {
    if (!object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    if (!object[key].is_number()) {
        throw ConfigError(std::string("'") + key + "' must be a number");
    }
    return object[key].get<double>();
}

std::string ValueToString(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::map<std::string, std::string> ReadStringMap(const nlohmann::json& object,
                                                 const char* key,
                                                 const std::map<std::string, std::string>& fallback) {
    if (!object.contains(key) || object[key].is_null()) {
        return fallback;
    }
    if (!object[key].is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    std::map<std::string, std::string> result;
    for (const auto& [name, value] : object[key].items()) {
        result[name] = ValueToString(value);
    }
    return result;
}

const nlohmann::json* Section(const nlohmann::json& data, const char* key) {
    if (!data.contains(key) || data[key].is_null()) {
        return nullptr;
    }
    if (!data[key].is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return &data[key];
}

ResourceLimits ApplyLimits(const ResourceLimits& base, const nlohmann::json& section) {
    std::string cpu = base.Cpu();
    if (section.contains("cpu") && !section["cpu"].is_null()) {
        const auto& value = section["cpu"];
        if (value.is_number()) {
            cpu = NumberToString(value);
        } else if (value.is_string()) {
            cpu = value.get<std::string>();
        } else {
            throw ConfigError("'cpu' must be a string or a number");
        }
    }
    std::string memory = base.Memory();
    if (section.contains("memory") && section["memory"].is_number_integer()) {
        memory = NumberToString(section["memory"]);
    } else {
        memory = ReadString(section, "memory", memory);
    }
    std::string disk = base.Disk();
    if (section.contains("disk") && section["disk"].is_number_integer()) {
        disk = NumberToString(section["disk"]);
    } else {
        disk = ReadString(section, "disk", disk);
    }
    const double timeout = ReadNumber(section, "timeout", base.TimeoutSeconds());
    const double max_processes = ReadNumber(section, "max_processes", base.MaxProcesses());
    if (max_processes != std::floor(max_processes) ||
        std::fabs(max_processes) > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ConfigError("'max_processes' must be an integer");
    }
    return ResourceLimits(cpu, memory, disk, timeout, static_cast<int>(max_processes));
}

void ApplyContainerConfig(ContainerEngineConfig& target, const nlohmann::json& section) {
    target.engine_binary = ReadString(section, "engine_binary", target.engine_binary);
    target.image = ReadString(section, "image", target.image);
    target.network_mode = ReadString(section, "network_mode", target.network_mode);
    target.privileged = ReadBool(section, "privileged", target.privileged);
    target.volumes = ReadStringMap(section, "volumes", target.volumes);
    target.environment = ReadStringMap(section, "environment", target.environment);
    target.name_prefix = ReadString(section, "name_prefix", target.name_prefix);
    if (section.contains("entrypoint")) {
        if (section["entrypoint"].is_null()) {
            target.entrypoint.reset();
        } else {
            target.entrypoint = ReadString(section, "entrypoint", "");
        }
    }
    if (section.contains("command")) {
        if (section["command"].is_null()) {
            target.command.reset();
        } else {
            target.command = ReadString(section, "command", "");
        }
    }
    if (target.engine_binary.empty()) {
        throw ConfigError("'engine_binary' must not be empty");
    }
    if (target.image.empty()) {
        throw ConfigError("'image' must not be empty");
    }
}

void ApplyClusterConfig(ClusterConfig& target, const nlohmann::json& section) {
    target.namespace_name = ReadString(section, "namespace", target.namespace_name);
    target.service_account = ReadString(section, "service_account", target.service_account);
    target.node_selector = ReadStringMap(section, "node_selector", target.node_selector);
}

void ApplyConfigFromJson(SandboxConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("sandbox config must be a JSON object");
    }
    if (data.contains("sandbox_type") && !data["sandbox_type"].is_null()) {
        if (!data["sandbox_type"].is_string()) {
            throw ConfigError("'sandbox_type' must be a string");
        }
        config.sandbox_type = ParseSandboxType(data["sandbox_type"].get<std::string>());
    }
    if (const auto* limits = Section(data, "resource_limits")) {
        config.resource_limits = ApplyLimits(config.resource_limits, *limits);
    }
    if (const auto* container = Section(data, "docker_config")) {
        ApplyContainerConfig(config.container, *container);
    }
    if (const auto* cluster = Section(data, "kubernetes_config")) {
        ApplyClusterConfig(config.cluster, *cluster);
    }
    if (const auto* local = Section(data, "local_config")) {
        config.local.base_dir = ReadString(*local, "base_dir", config.local.base_dir);
    }
    config.working_dir = ReadString(data, "working_dir", config.working_dir);
    config.cleanup = ReadBool(data, "cleanup", config.cleanup);
    config.enable_monitoring = ReadBool(data, "enable_monitoring", config.enable_monitoring);
    if (data.contains("metadata") && !data["metadata"].is_null()) {
        if (!data["metadata"].is_object()) {
            throw ConfigError("'metadata' must be an object");
        }
        for (const auto& [key, value] : data["metadata"].items()) {
            config.metadata[key] = ValueToString(value);
        }
    }
    if (config.working_dir.empty()) {
        throw ConfigError("'working_dir' must not be empty");
    }
}

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json ToJson(const ContainerEngineConfig& container) {
    return {
        {"engine_binary", container.engine_binary},
        {"image", container.image},
        {"network_mode", container.network_mode},
        {"privileged", container.privileged},
        {"volumes", container.volumes},
        {"environment", container.environment},
        {"entrypoint", OptionalToJson(container.entrypoint)},
        {"command", OptionalToJson(container.command)},
        {"name_prefix", container.name_prefix}
    };
}

}  // namespace

const char* ToString(SandboxType type) {
    switch (type) {
        case SandboxType::kContainer: return "container";
        case SandboxType::kLocal: return "local";
        case SandboxType::kCluster: return "cluster";
        case SandboxType::kRemote: return "remote";
    }
    return "unknown";
}

SandboxType ParseSandboxType(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered == "container" || lowered == "docker") {
        return SandboxType::kContainer;
    }
    if (lowered == "local") {
        return SandboxType::kLocal;
    }
    if (lowered == "cluster" || lowered == "kubernetes") {
        return SandboxType::kCluster;
    }
    if (lowered == "remote") {
        return SandboxType::kRemote;
    }
    throw ConfigError("unsupported sandbox type: '" + value + "'");
}

std::uint64_t ParseByteSize(const std::string& value) {
    if (value.empty()) {
        throw ConfigError("size must not be empty");
    }
    std::string magnitude = value;
    std::uint64_t multiplier = 1;
    const char suffix = value.back();
    if (!std::isdigit(static_cast<unsigned char>(suffix)) && suffix != '.') {
        switch (suffix) {
            case 'K': multiplier = 1ULL << 10; break;
            case 'M': multiplier = 1ULL << 20; break;
            case 'G': multiplier = 1ULL << 30; break;
            case 'T': multiplier = 1ULL << 40; break;
            default:
                throw ConfigError("size '" + value + "' must end with K, M, G or T or be a byte count");
        }
        magnitude.pop_back();
    }
    if (!IsDecimal(magnitude) || (multiplier == 1 && magnitude.find('.') != std::string::npos)) {
        throw ConfigError("size '" + value + "' has an invalid magnitude");
    }
    const double bytes = ParseDecimal(magnitude) * static_cast<double>(multiplier);
    if (bytes < 1.0 || bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        throw ConfigError("size '" + value + "' is out of range");
    }
    return static_cast<std::uint64_t>(bytes);
}

ResourceLimits::ResourceLimits()
    : ResourceLimits("1", "1G", "10G", 300.0, 10) {}

ResourceLimits::ResourceLimits(std::string cpu,
                               std::string memory,
                               std::string disk,
                               double timeout_seconds,
                               int max_processes)
    : cpu_(std::move(cpu))
    , memory_(std::move(memory))
    , disk_(std::move(disk))
    , timeout_seconds_(timeout_seconds)
    , max_processes_(max_processes) {
    ValidateCpu(cpu_);
    ValidateSize("memory", memory_);
    ValidateSize("disk", disk_);
    if (!(timeout_seconds_ > 0.0) || !std::isfinite(timeout_seconds_)) {
        throw ConfigError("timeout must be a positive number of seconds");
    }
    if (max_processes_ <= 0) {
        throw ConfigError("max_processes must be positive");
    }
}

double ResourceLimits::CpuCount() const {
    return ParseDecimal(cpu_);
}

std::uint64_t ResourceLimits::MemoryBytes() const {
    return ParseByteSize(memory_);
}

std::uint64_t ResourceLimits::DiskBytes() const {
    return ParseByteSize(disk_);
}

RuntimeOptions RuntimeOptions::FromConfig(const SandboxConfig& config) {
    RuntimeOptions options{};
    options.sandbox_type = config.sandbox_type;
    options.resource_limits = config.resource_limits;
    options.container = config.container;
    options.working_dir = config.working_dir;
    options.cleanup = config.cleanup;
    options.enable_monitoring = config.enable_monitoring;
    options.metadata = config.metadata;
    return options;
}

SandboxConfig ParseSandboxConfig(const nlohmann::json& data) {
    SandboxConfig config{};
    ApplyConfigFromJson(config, data);
    return config;
}

SandboxConfig MergeConfig(const SandboxConfig& base, const nlohmann::json& overrides) {
    SandboxConfig merged = base;
    ApplyConfigFromJson(merged, overrides);
    return merged;
}

RuntimeOptions ParseRuntimeOptions(const nlohmann::json& data, const SandboxConfig& base) {
    return RuntimeOptions::FromConfig(MergeConfig(base, data));
}

nlohmann::json ToJson(const ResourceLimits& limits) {
    return {
        {"cpu", limits.Cpu()},
        {"memory", limits.Memory()},
        {"disk", limits.Disk()},
        {"timeout", limits.TimeoutSeconds()},
        {"max_processes", limits.MaxProcesses()}
    };
}

nlohmann::json ToJson(const SandboxConfig& config) {
    return {
        {"sandbox_type", ToString(config.sandbox_type)},
        {"resource_limits", ToJson(config.resource_limits)},
        {"docker_config", ToJson(config.container)},
        {"kubernetes_config", {
            {"namespace", config.cluster.namespace_name},
            {"service_account", config.cluster.service_account},
            {"node_selector", config.cluster.node_selector}
        }},
        {"local_config", {{"base_dir", config.local.base_dir}}},
        {"working_dir", config.working_dir},
        {"cleanup", config.cleanup},
        {"enable_monitoring", config.enable_monitoring},
        {"metadata", config.metadata}
    };
}

nlohmann::json ToJson(const RuntimeOptions& options) {
    return {
        {"sandbox_type", ToString(options.sandbox_type)},
        {"resource_limits", ToJson(options.resource_limits)},
        {"docker_config", ToJson(options.container)},
        {"working_dir", options.working_dir},
        {"cleanup", options.cleanup},
        {"enable_monitoring", options.enable_monitoring},
        {"metadata", options.metadata}
    };
}

SandboxConfig ContainerPreset() {
    SandboxConfig config{};
    config.sandbox_type = SandboxType::kContainer;
    config.resource_limits = ResourceLimits("2", "2G", "20G", 600.0, 10);
    config.container.image = "python:3.12-slim";
    return config;
}

SandboxConfig LocalPreset() {
    SandboxConfig config{};
    config.sandbox_type = SandboxType::kLocal;
    config.resource_limits = ResourceLimits("1", "512M", "5G", 120.0, 10);
    return config;
}

SandboxConfig ClusterPreset() {
    SandboxConfig config{};
    config.sandbox_type = SandboxType::kCluster;
    config.resource_limits = ResourceLimits("4", "4G", "50G", 1800.0, 10);
    return config;
}

}  // namespace warden::config
