#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

#include "utils/common.hpp"

namespace warden::config {
namespace {

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

double ParsePositiveSeconds(const std::string& name, const std::string& value) {
    double seconds = 0.0;
    try {
        std::size_t consumed = 0;
        seconds = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigError(name + " must be a number of seconds");
        }
    } catch (const std::logic_error&) {
        throw ConfigError(name + " must be a number of seconds");
    }
    if (!(seconds > 0.0)) {
        throw ConfigError(name + " must be positive");
    }
    return seconds;
}

SandboxConfig PresetByName(const std::string& name) {
    const auto lowered = utils::ToLower(name);
    if (lowered == "container" || lowered == "docker") {
        return ContainerPreset();
    }
    if (lowered == "local") {
        return LocalPreset();
    }
    if (lowered == "cluster" || lowered == "kubernetes") {
        return ClusterPreset();
    }
    throw ConfigError("unknown sandbox preset: '" + name + "'");
}

void ApplyLogLevel(Config& config, const std::string& value) {
    const auto level = utils::ParseLogLevel(value);
    if (!level) {
        throw ConfigError("unknown log level: '" + value + "'");
    }
    config.logging.min_level = *level;
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto override_path = utils::GetEnv("WARDEN_CONFIG");
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return GetHomePath() / ".warden" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }
    if (data.contains("sandbox")) {
        const auto& sandbox = data["sandbox"];
        // "preset" picks the starting profile; the other keys refine it.
        if (sandbox.is_object() && sandbox.contains("preset")) {
            if (!sandbox["preset"].is_string()) {
                throw ConfigError("'sandbox.preset' must be a string");
            }
            config.sandbox = PresetByName(sandbox["preset"].get<std::string>());
        }
        config.sandbox = MergeConfig(config.sandbox, sandbox);
    }
    if (data.contains("actions") && data["actions"].is_object()) {
        const auto& actions = data["actions"];
        if (actions.contains("defaultTimeoutS")) {
            if (!actions["defaultTimeoutS"].is_number() || actions["defaultTimeoutS"].get<double>() <= 0.0) {
                throw ConfigError("'actions.defaultTimeoutS' must be a positive number");
            }
            config.actions.timeout_s = actions["defaultTimeoutS"].get<double>();
        }
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level")) {
            if (!logging["level"].is_string()) {
                throw ConfigError("'logging.level' must be a string");
            }
            ApplyLogLevel(config, logging["level"].get<std::string>());
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto sandbox_type = utils::GetEnv("WARDEN_SANDBOX_TYPE");
    if (!sandbox_type.empty()) {
        config.sandbox.sandbox_type = ParseSandboxType(sandbox_type);
    }

    const auto image = utils::GetEnv("WARDEN_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.container.image = image;
    }

    const auto engine = utils::GetEnv("WARDEN_ENGINE_BINARY");
    if (!engine.empty()) {
        config.sandbox.container.engine_binary = engine;
    }

    const auto working_dir = utils::GetEnv("WARDEN_WORKING_DIR");
    if (!working_dir.empty()) {
        config.sandbox.working_dir = working_dir;
    }

    const auto base_dir = utils::GetEnv("WARDEN_LOCAL_BASE_DIR");
    if (!base_dir.empty()) {
        config.sandbox.local.base_dir = base_dir;
    }

    const auto default_timeout = utils::GetEnv("WARDEN_DEFAULT_TIMEOUT");
    if (!default_timeout.empty()) {
        config.actions.timeout_s = ParsePositiveSeconds("WARDEN_DEFAULT_TIMEOUT", default_timeout);
    }

    const auto log_level = utils::GetEnv("WARDEN_LOG_LEVEL");
    if (!log_level.empty()) {
        ApplyLogLevel(config, log_level);
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw ConfigError("cannot open config file " + path.string());
        }
        nlohmann::json data;
        try {
            input >> data;
        } catch (const nlohmann::json::parse_error& ex) {
            throw ConfigError("invalid JSON in " + path.string() + ": " + ex.what());
        }
        ApplyConfigFromJson(config, data);
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace warden::config
