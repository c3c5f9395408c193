#include "action/builtin_handlers.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::action {
namespace {

constexpr const char* kTag = "executor";

// Uses the supplied container, or creates one for this action and records
// it as metadata["temp_container"] so the caller can reuse or remove it.
std::string AcquireContainer(const std::optional<std::string>& container_id,
                             const ActionRequest& request,
                             ActionContext& context) {
    if (container_id && !container_id->empty()) {
        return *container_id;
    }
    const auto& options = request.sandbox_options ? *request.sandbox_options : context.DefaultOptions();
    auto created = context.Runtime().CreateContainer(options);
    if (context.SetMetadataIfActive("temp_container", created)) {
        return created;
    }

    // Cancelled while creating: the response will not name this container.
    try {
        context.Runtime().RemoveContainer(created);
    } catch (const std::exception& ex) {
        utils::LogWarn(kTag, "could not remove container of cancelled action",
                       {{"container", created}, {"error", ex.what()}});
        context.SetMetadata("temp_container", created);
    }
    throw runtime::RuntimeError("action cancelled before the command started");
}

nlohmann::json CommandPayload(const runtime::CommandResult& result) {
    nlohmann::json payload = {
        {"output", result.output},
        {"return_code", result.return_code},
        {"success", result.success}
    };
    if (!result.error.empty()) {
        payload["error"] = result.error;
    }
    return payload;
}

}  // namespace

std::string BuildCodeCommand(const std::string& language, const std::string& code) {
    const auto lang = utils::ToLower(utils::Trim(language));
    if (lang == "python" || lang == "python3") {
        return "python3 -c " + utils::ShellQuote(code);
    }
    if (lang == "javascript" || lang == "js" || lang == "node") {
        return "node -e " + utils::ShellQuote(code);
    }
    if (lang == "bash") {
        return "bash -c " + utils::ShellQuote(code);
    }
    if (lang == "sh" || lang == "shell") {
        return "sh -c " + utils::ShellQuote(code);
    }
    throw ValidationError("unsupported language: " + language);
}

nlohmann::json ExecuteCommandHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<ExecuteCommandParams>(request.parameters);
    const auto container_id = AcquireContainer(params.container_id, request, context);
    const auto result = context.Runtime().ExecuteCommand(
        container_id, params.command, request.timeout_seconds, context.CancelToken());
    return CommandPayload(result);
}

nlohmann::json RunCodeHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<RunCodeParams>(request.parameters);
    // Rejects an unsupported language before any container is created.
    const auto command = BuildCodeCommand(params.language, params.code);
    const auto container_id = AcquireContainer(params.container_id, request, context);
    const auto result = context.Runtime().ExecuteCommand(
        container_id, command, request.timeout_seconds, context.CancelToken());
    auto payload = CommandPayload(result);
    payload["language"] = params.language;
    return payload;
}

nlohmann::json TransferFileHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<TransferFileParams>(request.parameters);
    const bool copied = context.Runtime().CopyToContainer(
        params.container_id, params.source_path, params.destination_path);
    return {
        {"success", copied},
        {"source", params.source_path},
        {"destination", params.destination_path}
    };
}

nlohmann::json GetFileHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<GetFileParams>(request.parameters);
    const bool copied = context.Runtime().CopyFromContainer(
        params.container_id, params.container_path, params.host_path);
    return {
        {"success", copied},
        {"container_path", params.container_path},
        {"host_path", params.host_path}
    };
}

nlohmann::json DeleteFileHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<DeleteFileParams>(request.parameters);
    const auto result = context.Runtime().ExecuteCommand(
        params.container_id, "rm -f -- " + utils::ShellQuote(params.file_path),
        request.timeout_seconds, context.CancelToken());
    nlohmann::json payload = {
        {"success", result.success},
        {"file_path", params.file_path}
    };
    if (!result.error.empty()) {
        payload["error"] = result.error;
    }
    return payload;
}

nlohmann::json ListDirectoryHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<ListDirectoryParams>(request.parameters);
    const auto result = context.Runtime().ExecuteCommand(
        params.container_id, "ls -la -- " + utils::ShellQuote(params.directory_path),
        request.timeout_seconds, context.CancelToken());
    nlohmann::json payload = {
        {"success", result.success},
        {"directory", params.directory_path},
        {"content", result.output}
    };
    if (!result.error.empty()) {
        payload["error"] = result.error;
    }
    return payload;
}

nlohmann::json CheckStatusHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<CheckStatusParams>(request.parameters);
    const auto status = context.Runtime().GetContainerStatus(params.container_id);
    return {
        {"success", true},
        {"container_status", runtime::ToJson(status)}
    };
}

void CustomActionHandler::Register(const std::string& name, Function function) {
    std::lock_guard<std::mutex> lock(mutex_);
    functions_[name] = std::move(function);
}

bool CustomActionHandler::Has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return functions_.find(name) != functions_.end();
}

nlohmann::json CustomActionHandler::Handle(const ActionRequest& request, ActionContext& context) {
    const auto& params = std::get<CustomParams>(request.parameters);
    Function function;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = functions_.find(params.name);
        if (it == functions_.end()) {
            throw ValidationError("unknown custom action: " + params.name);
        }
        function = it->second;
    }
    return function(params.arguments, context);
}

std::map<ActionType, std::shared_ptr<ActionHandler>> MakeBuiltinHandlers() {
    auto transfer = std::make_shared<TransferFileHandler>();
    return {
        {ActionType::kExecuteCommand, std::make_shared<ExecuteCommandHandler>()},
        {ActionType::kRunCode, std::make_shared<RunCodeHandler>()},
        {ActionType::kTransferFile, transfer},
        {ActionType::kPutFile, transfer},
        {ActionType::kGetFile, std::make_shared<GetFileHandler>()},
        {ActionType::kDeleteFile, std::make_shared<DeleteFileHandler>()},
        {ActionType::kListDirectory, std::make_shared<ListDirectoryHandler>()},
        {ActionType::kCheckStatus, std::make_shared<CheckStatusHandler>()},
    };
}

}  // namespace warden::action
