#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "config/sandbox_config.hpp"
#include "nlohmann/json.hpp"

namespace warden::action {

enum class ActionType {
    kExecuteCommand,
    kRunCode,
    kTransferFile,
    kGetFile,
    kPutFile,
    kDeleteFile,
    kListDirectory,
    kCheckStatus,
    kCustom
};

// "execute_command", "run_code", ...
const char* ToString(ActionType type);
// Case-insensitive; returns nullopt for unknown names.
std::optional<ActionType> ParseActionType(const std::string& value);

enum class ActionStatus {
    kPending,
    kRunning,
    kCompleted,
    kFailed,
    kTimedOut,
    kCancelled
};

const char* ToString(ActionStatus status);
bool IsTerminal(ActionStatus status);

// Missing or malformed action parameters.
class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExecuteCommandParams {
    std::string command;
    std::optional<std::string> container_id;
};

struct RunCodeParams {
    std::string code;
    std::string language = "python";
    std::optional<std::string> container_id;
};

// Host to container. Used by both TRANSFER_FILE and PUT_FILE.
struct TransferFileParams {
    std::string source_path;
    std::string destination_path;
    std::string container_id;
};

struct GetFileParams {
    std::string container_path;
    std::string host_path;
    std::string container_id;
};

struct DeleteFileParams {
    std::string file_path;
    std::string container_id;
};

struct ListDirectoryParams {
    std::string directory_path;
    std::string container_id;
};

struct CheckStatusParams {
    std::string container_id;
};

struct CustomParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

using ActionParams = std::variant<ExecuteCommandParams,
                                  RunCodeParams,
                                  TransferFileParams,
                                  GetFileParams,
                                  DeleteFileParams,
                                  ListDirectoryParams,
                                  CheckStatusParams,
                                  CustomParams>;

struct ActionRequest {
    ActionType action_type = ActionType::kExecuteCommand;
    ActionParams parameters;
    // Options for a container created on behalf of this request.
    std::optional<config::RuntimeOptions> sandbox_options;
    double timeout_seconds = 300.0;
    std::map<std::string, std::string> metadata;
};

struct ActionResponse {
    std::string action_id;
    ActionStatus status = ActionStatus::kPending;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    double execution_time_seconds = 0.0;
    std::map<std::string, std::string> metadata;
};

// Throws ValidationError when the parameter alternative does not belong to
// the action type or a required field is empty.
void ValidateRequest(const ActionRequest& request);

// Parses {"action_type", "parameters", "sandbox_options", "timeout",
// "metadata"}. Sandbox options are merged over `base`. Throws
// ValidationError for malformed requests and ConfigError for bad options.
ActionRequest ParseActionRequest(const nlohmann::json& data, const config::SandboxConfig& base);

nlohmann::json ToJson(const ActionRequest& request);
nlohmann::json ToJson(const ActionResponse& response);

}  // namespace warden::action
