#include "action/action_server.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/local_runtime.hpp"
#include "runtime/mock_container_runtime.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

using namespace warden;
using namespace warden::action;

// Waits until its action is cancelled or released.
class GateHandler : public ActionHandler {
public:
    nlohmann::json Handle(const ActionRequest&, ActionContext& context) override {
        while (!context.IsCancelled() && !released) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return nlohmann::json{{"released", released.load()}};
    }

    std::atomic<bool> released{false};
};

ActionRequest Command(const std::string& command) {
    ActionRequest request{};
    request.action_type = ActionType::kExecuteCommand;
    request.parameters = ExecuteCommandParams{command, std::string("c1")};
    request.timeout_seconds = 30.0;
    return request;
}

class ActionServerTest : public ::testing::Test {
protected:
    ActionServerTest()
        : runtime_(std::make_shared<NiceMock<runtime::MockContainerRuntime>>())
        , gate_(std::make_shared<GateHandler>())
        , executor_(std::make_shared<ActionExecutor>(
              [this]() { return runtime_; }, config::RuntimeOptions{})) {
        ON_CALL(*runtime_, Name()).WillByDefault(Return("mock"));
        executor_->RegisterActionHandler(ActionType::kExecuteCommand, gate_);
    }

    ActionResult WaitForResult(ActionServer& server, const std::string& id) {
        EXPECT_TRUE(server.WaitForAction(id, std::chrono::seconds(5)));
        return server.GetActionResult(id);
    }

    std::shared_ptr<NiceMock<runtime::MockContainerRuntime>> runtime_;
    std::shared_ptr<GateHandler> gate_;
    std::shared_ptr<ActionExecutor> executor_;
};

TEST_F(ActionServerTest, TestPendingThenReadyThenGone) {
    ActionServer server(executor_);
    const auto id = server.SubmitAction(Command("work"));
    EXPECT_FALSE(id.empty());

    const auto pending = server.GetActionResult(id);
    EXPECT_EQ(pending.state, ResultState::kPending);
    EXPECT_FALSE(pending.response.has_value());

    gate_->released = true;
    const auto ready = WaitForResult(server, id);
    ASSERT_EQ(ready.state, ResultState::kReady);
    ASSERT_TRUE(ready.response.has_value());
    EXPECT_EQ(ready.response->action_id, id);
    EXPECT_EQ(ready.response->status, ActionStatus::kCompleted);
    EXPECT_TRUE((*ready.response->result)["released"].get<bool>());

    EXPECT_EQ(server.GetActionResult(id).state, ResultState::kNotFound);
}

TEST_F(ActionServerTest, TestUnknownAction) {
    ActionServer server(executor_);
    EXPECT_EQ(server.GetActionResult("missing").state, ResultState::kNotFound);
    EXPECT_FALSE(server.CancelAction("missing"));
    EXPECT_FALSE(server.WaitForAction("missing", std::chrono::milliseconds(1)));
}

TEST_F(ActionServerTest, TestCancelRunningAction) {
    ActionServer server(executor_);
    const auto id = server.SubmitAction(Command("work"));
    EXPECT_TRUE(server.CancelAction(id));
    EXPECT_EQ(server.GetActionResult(id).state, ResultState::kNotFound);
    EXPECT_FALSE(server.CancelAction(id));
    EXPECT_TRUE(server.GetRunningActions().empty());
}

TEST_F(ActionServerTest, TestCancelFinishedActionIsRejected) {
    gate_->released = true;
    ActionServer server(executor_);
    const auto id = server.SubmitAction(Command("work"));
    ASSERT_TRUE(server.WaitForAction(id, std::chrono::seconds(5)));
    EXPECT_FALSE(server.CancelAction(id));
    const auto result = server.GetActionResult(id);
    ASSERT_EQ(result.state, ResultState::kReady);
    EXPECT_EQ(result.response->status, ActionStatus::kCompleted);
}

TEST_F(ActionServerTest, TestRunningActionsListed) {
    ActionServer server(executor_);
    const auto first = server.SubmitAction(Command("a"));
    const auto second = server.SubmitAction(Command("b"));
    EXPECT_NE(first, second);

    auto running = server.GetRunningActions();
    std::sort(running.begin(), running.end());
    std::vector<std::string> expected{first, second};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(running, expected);

    EXPECT_FALSE(server.WaitForAction(first, std::chrono::milliseconds(20)));
    gate_->released = true;
    EXPECT_TRUE(server.WaitForAction(first, std::chrono::seconds(5)));
    EXPECT_TRUE(server.WaitForAction(second, std::chrono::seconds(5)));
    // Waiting does not collect.
    EXPECT_EQ(server.GetRunningActions().size(), 2u);
}

TEST_F(ActionServerTest, TestDestructorCancelsOutstandingActions) {
    {
        ActionServer server(executor_);
        server.SubmitAction(Command("a"));
        server.SubmitAction(Command("b"));
    }
    EXPECT_FALSE(gate_->released);
}

TEST_F(ActionServerTest, TestTimeoutReportedThroughServer) {
    ActionServer server(executor_);
    auto request = Command("stuck");
    request.timeout_seconds = 0.1;
    const auto id = server.SubmitAction(request);
    const auto result = WaitForResult(server, id);
    ASSERT_EQ(result.state, ResultState::kReady);
    EXPECT_EQ(result.response->status, ActionStatus::kTimedOut);
}

TEST(ActionServerLocalTest, TestEchoEndToEnd) {
    auto config = config::LocalPreset();
    config.local.base_dir = (std::filesystem::temp_directory_path() /
                             ("warden_server_test_" + utils::GenerateHexId(8))).string();
    auto runtime = std::make_shared<runtime::LocalRuntime>(config, std::make_shared<sandbox::SubprocessRunner>());
    {
        auto executor = std::make_shared<ActionExecutor>(
            [runtime]() { return runtime; }, config::RuntimeOptions::FromConfig(config));
        ActionServer server(executor);

        ActionRequest request{};
        request.action_type = ActionType::kExecuteCommand;
        request.parameters = ExecuteCommandParams{"echo hello", std::nullopt};
        request.timeout_seconds = 30.0;

        const auto id = server.SubmitAction(request);
        ASSERT_TRUE(server.WaitForAction(id, std::chrono::seconds(30)));
        const auto result = server.GetActionResult(id);
        ASSERT_EQ(result.state, ResultState::kReady);
        const auto& response = *result.response;
        EXPECT_EQ(response.status, ActionStatus::kCompleted);
        EXPECT_EQ((*response.result)["output"].get<std::string>(), "hello");
        EXPECT_EQ((*response.result)["return_code"].get<int>(), 0);
        EXPECT_TRUE((*response.result)["success"].get<bool>());
        EXPECT_GT(response.execution_time_seconds, 0.0);
        EXPECT_EQ(response.metadata.count("temp_container"), 1u);
    }
    runtime->CleanupAll();
    std::error_code ec;
    std::filesystem::remove_all(config.local.base_dir, ec);
}

}  // namespace
