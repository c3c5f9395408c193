#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "action/action_executor.hpp"
#include "action/action_types.hpp"
#include "sandbox/cancel_token.hpp"

namespace warden::action {

enum class ResultState {
    kNotFound,
    kPending,
    kReady
};

struct ActionResult {
    ResultState state = ResultState::kNotFound;
    // Set only when state is kReady.
    std::optional<ActionResponse> response;
};

// Runs submitted actions in the background, one worker thread each, and
// keeps them by id until their result is collected or they are cancelled.
class ActionServer {
public:
    explicit ActionServer(std::shared_ptr<ActionExecutor> executor);
    // Cancels and joins every action still tracked.
    ~ActionServer();

    ActionServer(const ActionServer&) = delete;
    ActionServer& operator=(const ActionServer&) = delete;

    std::string SubmitAction(const ActionRequest& request);

    // Never blocks. A ready result is removed from the server.
    ActionResult GetActionResult(const std::string& action_id);

    // False when the id is unknown or the action already finished.
    bool CancelAction(const std::string& action_id);

    std::vector<std::string> GetRunningActions() const;

    // True once the action has finished; does not collect the result.
    bool WaitForAction(const std::string& action_id, std::chrono::milliseconds timeout) const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<sandbox::CancelToken> cancel;
        std::shared_future<ActionResponse> done;
    };

    std::shared_ptr<ActionExecutor> executor_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Task> tasks_;
};

}  // namespace warden::action
