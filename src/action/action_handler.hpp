#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "action/action_types.hpp"
#include "config/sandbox_config.hpp"
#include "nlohmann/json.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/cancel_token.hpp"

namespace warden::action {

// What a handler gets to work with for one action. Shared between the
// handler thread and the executor, which may read the metadata after it
// stopped waiting for the handler.
class ActionContext {
public:
    ActionContext(std::shared_ptr<runtime::ContainerRuntime> runtime,
                  config::RuntimeOptions default_options,
                  std::shared_ptr<sandbox::CancelToken> cancel)
        : runtime_(std::move(runtime))
        , default_options_(std::move(default_options))
        , cancel_(std::move(cancel)) {}

    runtime::ContainerRuntime& Runtime() const { return *runtime_; }
    const config::RuntimeOptions& DefaultOptions() const { return default_options_; }
    std::shared_ptr<const sandbox::CancelToken> CancelToken() const { return cancel_; }
    bool IsCancelled() const { return cancel_->IsCancelled(); }

    void SetMetadata(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_[key] = value;
    }

    // Records the entry unless the action was already cancelled. Serialized
    // with Cancel(), so the snapshot Cancel() returns holds the entry exactly
    // when this returned true.
    bool SetMetadataIfActive(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_->IsCancelled()) {
            return false;
        }
        metadata_[key] = value;
        return true;
    }

    // Fires the cancel token and returns the metadata as of that moment.
    std::map<std::string, std::string> Cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_->Cancel();
        return metadata_;
    }

    void EraseMetadata(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_.erase(key);
    }

    std::map<std::string, std::string> Metadata() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_;
    }

private:
    std::shared_ptr<runtime::ContainerRuntime> runtime_;
    config::RuntimeOptions default_options_;
    std::shared_ptr<sandbox::CancelToken> cancel_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> metadata_;
};

class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    // Returns the result payload. Throwing marks the action FAILED with the
    // exception message.
    virtual nlohmann::json Handle(const ActionRequest& request, ActionContext& context) = 0;
};

}  // namespace warden::action
