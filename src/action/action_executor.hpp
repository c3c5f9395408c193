#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "action/action_handler.hpp"
#include "action/action_types.hpp"
#include "runtime/container_runtime.hpp"
#include "sandbox/cancel_token.hpp"

namespace warden::action {

using RuntimeProvider = std::function<std::shared_ptr<runtime::ContainerRuntime>()>;

// Turns one ActionRequest into one ActionResponse. Handlers run on a worker
// thread so the request deadline holds even when a handler blocks.
class ActionExecutor {
public:
    ActionExecutor(RuntimeProvider provider, config::RuntimeOptions default_options);
    ~ActionExecutor();

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    // Installs or replaces the handler for `type`.
    void RegisterActionHandler(ActionType type, std::shared_ptr<ActionHandler> handler);
    bool HasHandler(ActionType type) const;

    // Never throws. `cancel` is the caller's token; when it fires while the
    // handler is running the response is CANCELLED.
    ActionResponse Execute(const ActionRequest& request,
                           std::optional<std::string> action_id = std::nullopt,
                           std::shared_ptr<const sandbox::CancelToken> cancel = nullptr);

    // Handler threads that were given up on and have not finished yet.
    std::size_t PendingWorkers();

private:
    struct Worker {
        std::thread thread;
        std::shared_future<nlohmann::json> done;
    };

    std::shared_ptr<ActionHandler> FindHandler(ActionType type) const;
    std::shared_ptr<runtime::ContainerRuntime> AcquireRuntime();
    void Abandon(Worker worker);
    void ReapWorkers();

    RuntimeProvider provider_;
    config::RuntimeOptions default_options_;

    mutable std::mutex handlers_mutex_;
    std::map<ActionType, std::shared_ptr<ActionHandler>> handlers_;

    std::mutex runtime_mutex_;
    std::shared_ptr<runtime::ContainerRuntime> runtime_;

    std::mutex workers_mutex_;
    std::vector<Worker> abandoned_;
};

}  // namespace warden::action
