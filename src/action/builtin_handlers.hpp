#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "action/action_handler.hpp"

namespace warden::action {

// Shell command line that runs `code` with the interpreter for `language`
// (python, javascript, bash, sh). Throws ValidationError for anything else.
std::string BuildCodeCommand(const std::string& language, const std::string& code);

class ExecuteCommandHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

class RunCodeHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

// Host to container; serves TRANSFER_FILE and PUT_FILE.
class TransferFileHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

class GetFileHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

class DeleteFileHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

class ListDirectoryHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

class CheckStatusHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;
};

// Dispatches CUSTOM actions by name to caller-provided functions. Not
// installed by default; register one with ActionExecutor to enable CUSTOM.
class CustomActionHandler : public ActionHandler {
public:
    using Function = std::function<nlohmann::json(const nlohmann::json& arguments, ActionContext& context)>;

    void Register(const std::string& name, Function function);
    bool Has(const std::string& name) const;

    nlohmann::json Handle(const ActionRequest& request, ActionContext& context) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Function> functions_;
};

// Handlers for every built-in type except CUSTOM.
std::map<ActionType, std::shared_ptr<ActionHandler>> MakeBuiltinHandlers();

}  // namespace warden::action
