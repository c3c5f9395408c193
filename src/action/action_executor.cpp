#include "action/action_executor.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <sstream>
#include <utility>

#include "action/builtin_handlers.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::action {
namespace {

constexpr const char* kTag = "executor";
constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);
// Longer deadlines are treated as this one to keep the clock arithmetic finite.
constexpr double kMaxDeadlineSeconds = 30.0 * 24 * 3600;

std::string FormatSeconds(double seconds) {
    std::ostringstream oss;
    oss << seconds;
    return oss.str();
}

}  // namespace

ActionExecutor::ActionExecutor(RuntimeProvider provider, config::RuntimeOptions default_options)
    : provider_(std::move(provider))
    , default_options_(std::move(default_options))
    , handlers_(MakeBuiltinHandlers()) {}

ActionExecutor::~ActionExecutor() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(abandoned_);
    }
    if (!workers.empty()) {
        utils::LogDebug(kTag, "joining abandoned handlers", {{"count", std::to_string(workers.size())}});
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void ActionExecutor::RegisterActionHandler(ActionType type, std::shared_ptr<ActionHandler> handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (!handler) {
        handlers_.erase(type);
        return;
    }
    handlers_[type] = std::move(handler);
}

bool ActionExecutor::HasHandler(ActionType type) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_.find(type) != handlers_.end();
}

std::shared_ptr<ActionHandler> ActionExecutor::FindHandler(ActionType type) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(type);
    return it == handlers_.end() ? nullptr : it->second;
}

std::shared_ptr<runtime::ContainerRuntime> ActionExecutor::AcquireRuntime() {
    std::lock_guard<std::mutex> lock(runtime_mutex_);
    if (runtime_) {
        return runtime_;
    }
    if (!provider_) {
        throw runtime::RuntimeError("no runtime provider configured");
    }
    auto acquired = provider_();
    if (!acquired) {
        throw runtime::RuntimeError("runtime provider returned no runtime");
    }
    utils::LogInfo(kTag, "runtime acquired", {{"runtime", acquired->Name()}});
    runtime_ = std::move(acquired);
    return runtime_;
}

ActionResponse ActionExecutor::Execute(const ActionRequest& request,
                                       std::optional<std::string> action_id,
                                       std::shared_ptr<const sandbox::CancelToken> cancel) {
    const auto start = std::chrono::steady_clock::now();

    ActionResponse response{};
    response.action_id = action_id && !action_id->empty() ? *action_id : utils::GenerateUuid();
    response.status = ActionStatus::kRunning;
    response.metadata = request.metadata;

    const std::string type_name = ToString(request.action_type);
    auto fail = [&](ActionStatus status, const std::string& error) {
        response.status = status;
        response.error = error;
        response.execution_time_seconds = utils::SecondsSince(start);
        utils::LogWarn(kTag, "action did not complete", {
            {"id", response.action_id},
            {"type", type_name},
            {"status", ToString(status)},
            {"error", error}
        });
        return response;
    };

    auto handler = FindHandler(request.action_type);
    if (!handler) {
        return fail(ActionStatus::kFailed, "action type not supported: " + type_name);
    }
    try {
        ValidateRequest(request);
    } catch (const ValidationError& ex) {
        return fail(ActionStatus::kFailed, ex.what());
    }

    std::shared_ptr<runtime::ContainerRuntime> runtime;
    try {
        runtime = AcquireRuntime();
    } catch (const std::exception& ex) {
        return fail(ActionStatus::kFailed, std::string("runtime unavailable: ") + ex.what());
    }

    utils::LogInfo(kTag, "action started", {{"id", response.action_id}, {"type", type_name}});

    auto token = std::make_shared<sandbox::CancelToken>();
    auto context = std::make_shared<ActionContext>(runtime, default_options_, token);
    auto merge_metadata = [&response](const std::map<std::string, std::string>& recorded) {
        for (const auto& [key, value] : recorded) {
            response.metadata[key] = value;
        }
    };

    std::packaged_task<nlohmann::json()> task([handler, request, context]() {
        return handler->Handle(request, *context);
    });
    Worker worker{};
    worker.done = task.get_future().share();
    worker.thread = std::thread(std::move(task));

    const auto deadline = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(std::min(request.timeout_seconds, kMaxDeadlineSeconds)));

    std::optional<ActionStatus> stopped;
    while (true) {
        const auto slice = std::min(deadline, std::chrono::steady_clock::now() + kCancelPollInterval);
        if (worker.done.wait_until(slice) == std::future_status::ready) {
            break;
        }
        if (cancel && cancel->IsCancelled()) {
            stopped = ActionStatus::kCancelled;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            stopped = ActionStatus::kTimedOut;
            break;
        }
    }

    if (stopped) {
        // The handler's process runner sees this and kills its process group.
        const auto recorded = context->Cancel();
        Abandon(std::move(worker));
        merge_metadata(recorded);
        if (*stopped == ActionStatus::kTimedOut) {
            return fail(ActionStatus::kTimedOut,
                        "action timed out after " + FormatSeconds(request.timeout_seconds) + "s");
        }
        return fail(ActionStatus::kCancelled, "action cancelled");
    }

    worker.thread.join();
    merge_metadata(context->Metadata());
    ReapWorkers();
    try {
        response.result = worker.done.get();
    } catch (const std::exception& ex) {
        return fail(ActionStatus::kFailed, ex.what());
    } catch (...) {
        return fail(ActionStatus::kFailed, "handler failed with a non-standard exception");
    }

    response.status = ActionStatus::kCompleted;
    response.execution_time_seconds = utils::SecondsSince(start);
    utils::LogInfo(kTag, "action completed", {
        {"id", response.action_id},
        {"type", type_name},
        {"seconds", FormatSeconds(response.execution_time_seconds)}
    });
    return response;
}

std::size_t ActionExecutor::PendingWorkers() {
    ReapWorkers();
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return abandoned_.size();
}

void ActionExecutor::Abandon(Worker worker) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    abandoned_.push_back(std::move(worker));
}

void ActionExecutor::ReapWorkers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        auto it = std::partition(abandoned_.begin(), abandoned_.end(), [](const Worker& worker) {
            return worker.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        std::move(it, abandoned_.end(), std::back_inserter(finished));
        abandoned_.erase(it, abandoned_.end());
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

}  // namespace warden::action
