#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "nlohmann/json.hpp"

namespace warden::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class SandboxType {
    kContainer,
    kLocal,
    kCluster,
    kRemote
};

const char* ToString(SandboxType type);

// Accepts the canonical names plus "docker" and "kubernetes". Throws
// ConfigError on anything else.
SandboxType ParseSandboxType(const std::string& value);

// Parses "512M", "1G", "1.5G" or a raw byte count. Suffixes are upper-case
// K, M, G or T. Throws ConfigError.
std::uint64_t ParseByteSize(const std::string& value);

class ResourceLimits {
public:
    ResourceLimits();
    ResourceLimits(std::string cpu,
                   std::string memory,
                   std::string disk,
                   double timeout_seconds,
                   int max_processes);

    const std::string& Cpu() const { return cpu_; }
    const std::string& Memory() const { return memory_; }
    const std::string& Disk() const { return disk_; }
    double TimeoutSeconds() const { return timeout_seconds_; }
    int MaxProcesses() const { return max_processes_; }

    double CpuCount() const;
    std::uint64_t MemoryBytes() const;
    std::uint64_t DiskBytes() const;

private:
    std::string cpu_;
    std::string memory_;
    std::string disk_;
    double timeout_seconds_;
    int max_processes_;
};

struct ContainerEngineConfig {
    std::string engine_binary = "docker";
    std::string image = "python:3.12-slim";
    std::string network_mode = "bridge";
    bool privileged = false;
    // host path -> container path
    std::map<std::string, std::string> volumes;
    std::map<std::string, std::string> environment;
    std::optional<std::string> entrypoint;
    std::optional<std::string> command;
    std::string name_prefix = "warden";
};

struct ClusterConfig {
    std::string namespace_name = "warden";
    std::string service_account = "warden";
    std::map<std::string, std::string> node_selector;
};

struct LocalConfig {
    // Empty means <temp dir>/warden-sandboxes.
    std::string base_dir;
};

struct SandboxConfig {
    SandboxType sandbox_type = SandboxType::kContainer;
    ResourceLimits resource_limits;
    ContainerEngineConfig container;
    ClusterConfig cluster;
    LocalConfig local;
    std::string working_dir = "/workspace";
    bool cleanup = true;
    bool enable_monitoring = true;
    std::unordered_map<std::string, std::string> metadata;
};

// Snapshot of the options a single container is created with.
struct RuntimeOptions {
    SandboxType sandbox_type = SandboxType::kContainer;
    ResourceLimits resource_limits;
    ContainerEngineConfig container;
    std::string working_dir = "/workspace";
    bool cleanup = true;
    bool enable_monitoring = true;
    std::unordered_map<std::string, std::string> metadata;

    static RuntimeOptions FromConfig(const SandboxConfig& config);
};

// Builds a validated config from its JSON form. Missing keys keep their
// defaults; present keys with a wrong type or invalid value throw ConfigError.
SandboxConfig ParseSandboxConfig(const nlohmann::json& data);

// Applies the keys present in `overrides` on top of `base` and re-validates.
SandboxConfig MergeConfig(const SandboxConfig& base, const nlohmann::json& overrides);

RuntimeOptions ParseRuntimeOptions(const nlohmann::json& data, const SandboxConfig& base);

nlohmann::json ToJson(const ResourceLimits& limits);
nlohmann::json ToJson(const SandboxConfig& config);
nlohmann::json ToJson(const RuntimeOptions& options);

SandboxConfig ContainerPreset();
SandboxConfig LocalPreset();
SandboxConfig ClusterPreset();

}  // namespace warden::config
