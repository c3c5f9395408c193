#include "action/action_types.hpp"

#include <cmath>
#include <type_traits>

#include "utils/common.hpp"

namespace warden::action {
namespace {

struct TypeName {
    ActionType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {ActionType::kExecuteCommand, "execute_command"},
    {ActionType::kRunCode, "run_code"},
    {ActionType::kTransferFile, "transfer_file"},
    {ActionType::kGetFile, "get_file"},
    {ActionType::kPutFile, "put_file"},
    {ActionType::kDeleteFile, "delete_file"},
    {ActionType::kListDirectory, "list_directory"},
    {ActionType::kCheckStatus, "check_status"},
    {ActionType::kCustom, "custom"},
};

std::optional<std::string> GetString(const nlohmann::json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) {
        return std::nullopt;
    }
    if (!params[key].is_string()) {
        throw ValidationError(std::string("parameter '") + key + "' must be a string");
    }
    return params[key].get<std::string>();
}

std::string GetStringOr(const nlohmann::json& params, const char* key, const std::string& fallback = {}) {
    auto value = GetString(params, key);
    return value ? *value : fallback;
}

void Require(const std::string& value, const char* key) {
    if (value.empty()) {
        throw ValidationError(std::string("missing required parameter: ") + key);
    }
}

ActionParams ParseParams(ActionType type, const nlohmann::json& params) {
    switch (type) {
        case ActionType::kExecuteCommand:
            return ExecuteCommandParams{GetStringOr(params, "command"), GetString(params, "container_id")};
        case ActionType::kRunCode:
            return RunCodeParams{GetStringOr(params, "code"),
                                 GetStringOr(params, "language", "python"),
                                 GetString(params, "container_id")};
        case ActionType::kTransferFile:
        case ActionType::kPutFile:
            return TransferFileParams{GetStringOr(params, "source_path"),
                                      GetStringOr(params, "destination_path"),
                                      GetStringOr(params, "container_id")};
        case ActionType::kGetFile:
            return GetFileParams{GetStringOr(params, "container_path"),
                                 GetStringOr(params, "host_path"),
                                 GetStringOr(params, "container_id")};
        case ActionType::kDeleteFile:
            return DeleteFileParams{GetStringOr(params, "file_path"), GetStringOr(params, "container_id")};
        case ActionType::kListDirectory:
            return ListDirectoryParams{GetStringOr(params, "directory_path"), GetStringOr(params, "container_id")};
        case ActionType::kCheckStatus:
            return CheckStatusParams{GetStringOr(params, "container_id")};
        case ActionType::kCustom: {
            CustomParams custom{};
            custom.name = GetStringOr(params, "name");
            if (params.contains("arguments") && !params["arguments"].is_null()) {
                custom.arguments = params["arguments"];
            }
            return custom;
        }
    }
    throw ValidationError("unhandled action type");
}

template <typename T>
const T& Expect(const ActionRequest& request) {
    const auto* params = std::get_if<T>(&request.parameters);
    if (!params) {
        throw ValidationError(std::string("parameters do not match action type ") + ToString(request.action_type));
    }
    return *params;
}

}  // namespace

const char* ToString(ActionType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ActionType> ParseActionType(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    for (const auto& entry : kTypeNames) {
        if (lowered == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

const char* ToString(ActionStatus status) {
    switch (status) {
        case ActionStatus::kPending: return "pending";
        case ActionStatus::kRunning: return "running";
        case ActionStatus::kCompleted: return "completed";
        case ActionStatus::kFailed: return "failed";
        case ActionStatus::kTimedOut: return "timed_out";
        case ActionStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

bool IsTerminal(ActionStatus status) {
    return status != ActionStatus::kPending && status != ActionStatus::kRunning;
}

void ValidateRequest(const ActionRequest& request) {
    if (!(request.timeout_seconds > 0.0) || !std::isfinite(request.timeout_seconds)) {
        throw ValidationError("timeout must be a positive number of seconds");
    }
    switch (request.action_type) {
        case ActionType::kExecuteCommand:
            Require(Expect<ExecuteCommandParams>(request).command, "command");
            return;
        case ActionType::kRunCode:
            Require(Expect<RunCodeParams>(request).code, "code");
            Require(Expect<RunCodeParams>(request).language, "language");
            return;
        case ActionType::kTransferFile:
        case ActionType::kPutFile: {
            const auto& params = Expect<TransferFileParams>(request);
            Require(params.source_path, "source_path");
            Require(params.destination_path, "destination_path");
            Require(params.container_id, "container_id");
            return;
        }
        case ActionType::kGetFile: {
            const auto& params = Expect<GetFileParams>(request);
            Require(params.container_path, "container_path");
            Require(params.host_path, "host_path");
            Require(params.container_id, "container_id");
            return;
        }
        case ActionType::kDeleteFile: {
            const auto& params = Expect<DeleteFileParams>(request);
            Require(params.file_path, "file_path");
            Require(params.container_id, "container_id");
            return;
        }
        case ActionType::kListDirectory: {
            const auto& params = Expect<ListDirectoryParams>(request);
            Require(params.directory_path, "directory_path");
            Require(params.container_id, "container_id");
            return;
        }
        case ActionType::kCheckStatus:
            Require(Expect<CheckStatusParams>(request).container_id, "container_id");
            return;
        case ActionType::kCustom:
            Require(Expect<CustomParams>(request).name, "name");
            return;
    }
}

ActionRequest ParseActionRequest(const nlohmann::json& data, const config::SandboxConfig& base) {
    if (!data.is_object()) {
        throw ValidationError("action request must be a JSON object");
    }
    if (!data.contains("action_type") || !data["action_type"].is_string()) {
        throw ValidationError("action_type must be a string");
    }
    const auto type_name = data["action_type"].get<std::string>();
    const auto type = ParseActionType(type_name);
    if (!type) {
        throw ValidationError("unknown action type: " + type_name);
    }

    ActionRequest request{};
    request.action_type = *type;

    auto params = nlohmann::json::object();
    if (data.contains("parameters") && !data["parameters"].is_null()) {
        if (!data["parameters"].is_object()) {
            throw ValidationError("parameters must be an object");
        }
        params = data["parameters"];
    }
    request.parameters = ParseParams(*type, params);

    if (data.contains("sandbox_options") && !data["sandbox_options"].is_null()) {
        request.sandbox_options = config::ParseRuntimeOptions(data["sandbox_options"], base);
    }

    if (data.contains("timeout") && !data["timeout"].is_null()) {
        if (!data["timeout"].is_number()) {
            throw ValidationError("timeout must be a number");
        }
        request.timeout_seconds = data["timeout"].get<double>();
        if (!(request.timeout_seconds > 0.0) || !std::isfinite(request.timeout_seconds)) {
            throw ValidationError("timeout must be a positive number of seconds");
        }
    }

    if (data.contains("metadata") && !data["metadata"].is_null()) {
        if (!data["metadata"].is_object()) {
            throw ValidationError("metadata must be an object");
        }
        for (const auto& [key, value] : data["metadata"].items()) {
            request.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return request;
}

nlohmann::json ToJson(const ActionRequest& request) {
    auto params = std::visit([](const auto& value) -> nlohmann::json {
        using T = std::decay_t<decltype(value)>;
        nlohmann::json json = nlohmann::json::object();
        if constexpr (std::is_same_v<T, ExecuteCommandParams>) {
            json["command"] = value.command;
            if (value.container_id) {
                json["container_id"] = *value.container_id;
            }
        } else if constexpr (std::is_same_v<T, RunCodeParams>) {
            json["code"] = value.code;
            json["language"] = value.language;
            if (value.container_id) {
                json["container_id"] = *value.container_id;
            }
        } else if constexpr (std::is_same_v<T, TransferFileParams>) {
            json["source_path"] = value.source_path;
            json["destination_path"] = value.destination_path;
            json["container_id"] = value.container_id;
        } else if constexpr (std::is_same_v<T, GetFileParams>) {
            json["container_path"] = value.container_path;
            json["host_path"] = value.host_path;
            json["container_id"] = value.container_id;
        } else if constexpr (std::is_same_v<T, DeleteFileParams>) {
            json["file_path"] = value.file_path;
            json["container_id"] = value.container_id;
        } else if constexpr (std::is_same_v<T, ListDirectoryParams>) {
            json["directory_path"] = value.directory_path;
            json["container_id"] = value.container_id;
        } else if constexpr (std::is_same_v<T, CheckStatusParams>) {
            json["container_id"] = value.container_id;
        } else {
            json["name"] = value.name;
            json["arguments"] = value.arguments;
        }
        return json;
    }, request.parameters);

    nlohmann::json json = {
        {"action_type", ToString(request.action_type)},
        {"parameters", params},
        {"timeout", request.timeout_seconds},
        {"metadata", request.metadata}
    };
    if (request.sandbox_options) {
        json["sandbox_options"] = config::ToJson(*request.sandbox_options);
    }
    return json;
}

nlohmann::json ToJson(const ActionResponse& response) {
    return {
        {"action_id", response.action_id},
        {"status", ToString(response.status)},
        {"result", response.result ? *response.result : nlohmann::json(nullptr)},
        {"error", response.error ? nlohmann::json(*response.error) : nlohmann::json(nullptr)},
        {"execution_time", response.execution_time_seconds},
        {"metadata", response.metadata}
    };
}

}  // namespace warden::action
