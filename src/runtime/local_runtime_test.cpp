#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/local_runtime.hpp"
#include "runtime/runtime_factory.hpp"
#include "utils/common.hpp"

#include <filesystem>
#include <fstream>
#include <thread>

namespace {

using ::testing::HasSubstr;

using namespace warden;
using runtime::ContainerNotFoundError;
using runtime::LocalRuntime;

namespace fs = std::filesystem;

class LocalRuntimeTest : public ::testing::Test {
protected:
    LocalRuntimeTest()
        : base_(fs::temp_directory_path() / ("warden_local_test_" + utils::GenerateHexId(8))) {
        config_ = config::LocalPreset();
        config_.local.base_dir = base_.string();
        config_.resource_limits = config::ResourceLimits("1", "1G", "64M", 30.0, 10);
        runtime_ = std::make_unique<LocalRuntime>(config_, std::make_shared<sandbox::SubprocessRunner>());
    }

    ~LocalRuntimeTest() override {
        runtime_.reset();
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    std::string Create() {
        return runtime_->CreateContainer(config::RuntimeOptions::FromConfig(config_));
    }

    fs::path base_;
    config::SandboxConfig config_;
    std::unique_ptr<LocalRuntime> runtime_;
};

TEST_F(LocalRuntimeTest, TestCreateMakesDirectories) {
    const auto id = Create();
    EXPECT_EQ(id.size(), 12u);
    EXPECT_TRUE(fs::is_directory(runtime_->RootOf(id) / "workspace"));
    const auto status = runtime_->GetContainerStatus(id);
    EXPECT_EQ(status.status, "running");
    EXPECT_EQ(status.name, "warden-" + id);
}

TEST_F(LocalRuntimeTest, TestExecuteRunsInWorkingDir) {
    const auto id = Create();
    const auto result = runtime_->ExecuteCommand(id, "echo hello > greeting.txt && cat greeting.txt && pwd", 10.0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.return_code, 0);
    EXPECT_THAT(result.output, HasSubstr("hello"));
    EXPECT_THAT(result.output, HasSubstr("workspace"));
    EXPECT_TRUE(fs::exists(runtime_->RootOf(id) / "workspace" / "greeting.txt"));
}

TEST_F(LocalRuntimeTest, TestExecuteEnvironment) {
    config_.container.environment["GREETING"] = "hi there";
    const auto id = Create();
    const auto result = runtime_->ExecuteCommand(id, "printf '%s' \"$GREETING\"", 10.0);
    EXPECT_EQ(result.output, "hi there");
}

TEST_F(LocalRuntimeTest, TestExecuteFailure) {
    const auto id = Create();
    const auto result = runtime_->ExecuteCommand(id, "echo oops 1>&2; exit 7", 10.0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.return_code, 7);
    EXPECT_EQ(result.error, "oops");
}

TEST_F(LocalRuntimeTest, TestExecuteTimeout) {
    const auto id = Create();
    const auto start = std::chrono::steady_clock::now();
    const auto result = runtime_->ExecuteCommand(id, "sleep 5", 0.2);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "timeout");
    EXPECT_EQ(result.return_code, -1);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(LocalRuntimeTest, TestExecuteCancelled) {
    const auto id = Create();
    auto token = std::make_shared<sandbox::CancelToken>();
    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->Cancel();
    });
    const auto result = runtime_->ExecuteCommand(id, "sleep 5", 10.0, token);
    canceller.join();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "cancelled");
}

TEST_F(LocalRuntimeTest, TestUsageIsAccumulated) {
    const auto id = Create();
    ASSERT_TRUE(runtime_->ExecuteCommand(id, "true", 10.0).success);
    const auto status = runtime_->GetContainerStatus(id);
    EXPECT_GT(status.memory_usage, 0);
}

TEST_F(LocalRuntimeTest, TestStoppedContainerRejectsCommands) {
    const auto id = Create();
    EXPECT_TRUE(runtime_->StopContainer(id));
    EXPECT_TRUE(runtime_->StopContainer(id));
    EXPECT_EQ(runtime_->GetContainerStatus(id).status, "stopped");
    const auto result = runtime_->ExecuteCommand(id, "echo hi", 10.0);
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("not running"));
}

TEST_F(LocalRuntimeTest, TestCopyRoundTrip) {
    const auto id = Create();
    const auto host_file = base_ / "input.txt";
    fs::create_directories(base_);
    {
        std::ofstream output(host_file);
        output << "payload";
    }
    EXPECT_TRUE(runtime_->CopyToContainer(id, host_file.string(), "/workspace/in.txt"));
    const auto cat = runtime_->ExecuteCommand(id, "cat in.txt", 10.0);
    EXPECT_EQ(cat.output, "payload");

    const auto host_out = base_ / "out.txt";
    EXPECT_TRUE(runtime_->CopyFromContainer(id, "in.txt", host_out.string()));
    std::ifstream input(host_out);
    std::string content;
    input >> content;
    EXPECT_EQ(content, "payload");
}

TEST_F(LocalRuntimeTest, TestCopyIntoDirectory) {
    const auto id = Create();
    fs::create_directories(base_);
    const auto host_file = base_ / "note.txt";
    std::ofstream(host_file) << "x";
    EXPECT_TRUE(runtime_->CopyToContainer(id, host_file.string(), "/workspace"));
    EXPECT_TRUE(fs::exists(runtime_->RootOf(id) / "workspace" / "note.txt"));
}

TEST_F(LocalRuntimeTest, TestCopyFailures) {
    const auto id = Create();
    EXPECT_FALSE(runtime_->CopyToContainer(id, (base_ / "missing").string(), "/workspace/x"));
    EXPECT_FALSE(runtime_->CopyFromContainer(id, "../../../etc/passwd", (base_ / "stolen").string()));
    EXPECT_FALSE(fs::exists(base_ / "stolen"));
}

TEST_F(LocalRuntimeTest, TestResolvePathStaysInside) {
    const auto id = Create();
    const auto root = runtime_->RootOf(id);
    EXPECT_EQ(runtime_->ResolvePath(id, "/etc/hosts"), root / "etc" / "hosts");
    EXPECT_EQ(runtime_->ResolvePath(id, "a/b"), root / "workspace" / "a" / "b");
    EXPECT_THROW(runtime_->ResolvePath(id, "../../x"), runtime::RuntimeError);
}

TEST_F(LocalRuntimeTest, TestRemoveDeletesDirectory) {
    const auto id = Create();
    const auto root = runtime_->RootOf(id);
    runtime_->RemoveContainer(id);
    EXPECT_FALSE(fs::exists(root));
    EXPECT_THROW(runtime_->RemoveContainer(id), ContainerNotFoundError);
    EXPECT_THROW(runtime_->GetContainerStatus(id), ContainerNotFoundError);
}

TEST_F(LocalRuntimeTest, TestLifecycleRoundTrip) {
    const auto id = Create();
    EXPECT_EQ(runtime_->GetContainerStatus(id).status, "running");
    EXPECT_TRUE(runtime_->StopContainer(id));
    EXPECT_EQ(runtime_->GetContainerStatus(id).status, "stopped");
    runtime_->RemoveContainer(id);
    for (const auto& status : runtime_->GetAllContainers()) {
        EXPECT_NE(status.container_id, id);
    }
    EXPECT_THROW(runtime_->RemoveContainer(id), ContainerNotFoundError);
}

TEST_F(LocalRuntimeTest, TestBogusOptionsLeaveTableUntouched) {
    EXPECT_THROW(config::ParseRuntimeOptions({{"sandbox_type", "bogus"}}, config_), config::ConfigError);
    EXPECT_TRUE(runtime_->GetAllContainers().empty());
}

TEST_F(LocalRuntimeTest, TestCleanupAllAndShutdown) {
    Create();
    Create();
    EXPECT_EQ(runtime_->GetAllContainers().size(), 2u);
    runtime_->Shutdown();
    EXPECT_TRUE(runtime_->GetAllContainers().empty());
}

TEST_F(LocalRuntimeTest, TestUnknownContainer) {
    EXPECT_THROW(runtime_->ExecuteCommand("missing", "true", 1.0), ContainerNotFoundError);
    EXPECT_THROW(runtime_->StopContainer("missing"), ContainerNotFoundError);
    EXPECT_THROW(runtime_->CopyToContainer("missing", "/a", "/b"), ContainerNotFoundError);
}

TEST(RuntimeFactoryTest, TestSelectsBackend) {
    auto config = config::LocalPreset();
    EXPECT_EQ(runtime::CreateRuntime(config)->Name(), "local");
    config.sandbox_type = config::SandboxType::kContainer;
    EXPECT_EQ(runtime::CreateRuntime(config)->Name(), "docker");
    config.sandbox_type = config::SandboxType::kCluster;
    EXPECT_THROW(runtime::CreateRuntime(config), config::ConfigError);
    config.sandbox_type = config::SandboxType::kRemote;
    EXPECT_THROW(runtime::CreateRuntime(config), config::ConfigError);
}

}  // namespace
