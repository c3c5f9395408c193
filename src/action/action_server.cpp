#include "action/action_server.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::action {
namespace {

constexpr const char* kTag = "server";

bool IsReady(const std::shared_future<ActionResponse>& done) {
    return done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}  // namespace

ActionServer::ActionServer(std::shared_ptr<ActionExecutor> executor)
    : executor_(std::move(executor)) {}

ActionServer::~ActionServer() {
    std::unordered_map<std::string, Task> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& [id, task] : tasks) {
        if (!IsReady(task.done)) {
            utils::LogInfo(kTag, "cancelling action at shutdown", {{"id", id}});
        }
        task.cancel->Cancel();
    }
    for (auto& [id, task] : tasks) {
        if (task.thread.joinable()) {
            task.thread.join();
        }
    }
}

std::string ActionServer::SubmitAction(const ActionRequest& request) {
    const auto action_id = utils::GenerateUuid();

    Task task{};
    task.cancel = std::make_shared<sandbox::CancelToken>();
    std::packaged_task<ActionResponse()> work(
        [executor = executor_, request, action_id, cancel = task.cancel]() {
            return executor->Execute(request, action_id, cancel);
        });
    task.done = work.get_future().share();
    task.thread = std::thread(std::move(work));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.emplace(action_id, std::move(task));
    }
    utils::LogInfo(kTag, "action submitted", {{"id", action_id}, {"type", ToString(request.action_type)}});
    return action_id;
}

ActionResult ActionServer::GetActionResult(const std::string& action_id) {
    Task task{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(action_id);
        if (it == tasks_.end()) {
            return {ResultState::kNotFound, std::nullopt};
        }
        if (!IsReady(it->second.done)) {
            return {ResultState::kPending, std::nullopt};
        }
        task = std::move(it->second);
        tasks_.erase(it);
    }
    task.thread.join();
    return {ResultState::kReady, task.done.get()};
}

bool ActionServer::CancelAction(const std::string& action_id) {
    Task task{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(action_id);
        if (it == tasks_.end() || IsReady(it->second.done)) {
            return false;
        }
        task = std::move(it->second);
        tasks_.erase(it);
    }
    try {
        task.cancel->Cancel();
        task.thread.join();
        const auto& response = task.done.get();
        utils::LogInfo(kTag, "action cancelled", {{"id", action_id}, {"status", ToString(response.status)}});
        return true;
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "cancel failed", {{"id", action_id}, {"error", ex.what()}});
        if (task.thread.joinable()) {
            task.thread.detach();
        }
        return false;
    }
}

std::vector<std::string> ActionServer::GetRunningActions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, _] : tasks_) {
        ids.push_back(id);
    }
    return ids;
}

bool ActionServer::WaitForAction(const std::string& action_id, std::chrono::milliseconds timeout) const {
    std::shared_future<ActionResponse> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(action_id);
        if (it == tasks_.end()) {
            return false;
        }
        done = it->second.done;
    }
    return done.wait_for(timeout) == std::future_status::ready;
}

}  // namespace warden::action
