#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/docker_runtime.hpp"
#include "sandbox/mock_process_runner.hpp"

#include <memory>

namespace {

using ::testing::AllOf;
using ::testing::Contains;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StartsWith;
using ::testing::Throw;

using namespace warden;
using runtime::ContainerNotFoundError;
using runtime::DockerRuntime;
using runtime::EngineError;
using sandbox::Exited;
using sandbox::MockProcessRunner;
using sandbox::ProcessRequest;
using sandbox::ProcessResult;

auto Argv(const std::vector<std::string>& argv) {
    return Field(&ProcessRequest::argv, ElementsAreArray(argv));
}

// Matches a request whose argv starts with the engine binary and `verb`.
MATCHER_P(EngineVerb, verb, "") {
    return arg.argv.size() >= 2 && arg.argv[0] == "docker" && arg.argv[1] == verb;
}

class DockerRuntimeTest : public ::testing::Test {
protected:
    DockerRuntimeTest()
        : runner_(std::make_shared<MockProcessRunner>())
        , runtime_(config::ContainerPreset(), runner_) {}

    // Drives a successful version/create/start sequence and returns the id.
    std::string Create() {
        EXPECT_CALL(*runner_, Run(EngineVerb("version"))).WillOnce(Return(Exited(0, "24.0\n")));
        EXPECT_CALL(*runner_, Run(EngineVerb("create"))).WillOnce(Return(Exited(0, "abc123\n")));
        EXPECT_CALL(*runner_, Run(Argv({"docker", "start", "abc123"}))).WillOnce(Return(Exited(0, "abc123\n")));
        return runtime_.CreateContainer(config::RuntimeOptions::FromConfig(config::ContainerPreset()));
    }

    std::shared_ptr<MockProcessRunner> runner_;
    DockerRuntime runtime_;
};

TEST(DockerCreateArgsTest, TestOrdering) {
    auto config = config::ContainerPreset();
    config.container.volumes["/host"] = "/data";
    config.container.environment["KEY"] = "VALUE";
    config.container.privileged = true;
    config.container.entrypoint = "/entry";
    config.container.command = "run it";
    const auto args = DockerRuntime::BuildCreateArgs(config::RuntimeOptions::FromConfig(config), "warden-0123456789ab");
    EXPECT_THAT(args, ElementsAre(
        "create",
        "--name", "warden-0123456789ab",
        "--workdir", "/workspace",
        "--network", "bridge",
        "--cpus", "2",
        "--memory", "2G",
        "--pids-limit", "10",
        "--label", "warden.managed=true",
        "-v", "/host:/data",
        "-e", "KEY=VALUE",
        "--privileged",
        "--entrypoint", "/entry",
        "python:3.12-slim",
        "sh", "-c", "run it"));
}

TEST(DockerCreateArgsTest, TestKeepAliveWithoutCommand) {
    const auto args = DockerRuntime::BuildCreateArgs(
        config::RuntimeOptions::FromConfig(config::ContainerPreset()), "warden-x");
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "python:3.12-slim");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args.back(), "infinity");
}

TEST(DockerStateTest, TestNormalize) {
    EXPECT_EQ(DockerRuntime::NormalizeState("running"), "running");
    EXPECT_EQ(DockerRuntime::NormalizeState("exited"), "stopped");
    EXPECT_EQ(DockerRuntime::NormalizeState("created"), "stopped");
    EXPECT_EQ(DockerRuntime::NormalizeState("paused"), "paused");
    EXPECT_EQ(DockerRuntime::NormalizeState("weird"), "unknown");
}

TEST_F(DockerRuntimeTest, TestCreateRegistersContainer) {
    const auto id = Create();
    EXPECT_EQ(id, "abc123");
    EXPECT_CALL(*runner_, Run(EngineVerb("inspect")))
        .WillOnce(Return(Exited(0, R"([{"State": {"Status": "running"}}])")));
    EXPECT_CALL(*runner_, Run(EngineVerb("stats")))
        .WillOnce(Return(Exited(0, R"({"CPUPerc": "12.5%", "MemUsage": "10MiB / 2GiB"})")));
    const auto status = runtime_.GetContainerStatus(id);
    EXPECT_EQ(status.status, "running");
    EXPECT_THAT(status.name, StartsWith("warden-"));
    EXPECT_DOUBLE_EQ(status.cpu_usage, 12.5);
    EXPECT_EQ(status.memory_usage, 10 * 1024 * 1024);
    EXPECT_FALSE(status.error.has_value());
}

TEST_F(DockerRuntimeTest, TestCreateFailureRegistersNothing) {
    EXPECT_CALL(*runner_, Run(EngineVerb("version"))).WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(EngineVerb("create"))).WillOnce(Return(Exited(125, "", "no such image\n")));
    try {
        runtime_.CreateContainer(config::RuntimeOptions::FromConfig(config::ContainerPreset()));
        FAIL() << "expected EngineError";
    } catch (const EngineError& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("no such image"));
    }
    EXPECT_TRUE(runtime_.GetAllContainers().empty());
}

TEST_F(DockerRuntimeTest, TestStartFailureRemovesContainer) {
    InSequence seq;
    EXPECT_CALL(*runner_, Run(EngineVerb("version"))).WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(EngineVerb("create"))).WillOnce(Return(Exited(0, "dead1\n")));
    EXPECT_CALL(*runner_, Run(EngineVerb("start"))).WillOnce(Return(Exited(1, "", "cannot start\n")));
    EXPECT_CALL(*runner_, Run(Argv({"docker", "rm", "-f", "dead1"}))).WillOnce(Return(Exited(0)));
    EXPECT_THROW(runtime_.CreateContainer(config::RuntimeOptions::FromConfig(config::ContainerPreset())),
                 EngineError);
    EXPECT_THROW(runtime_.GetContainerStatus("dead1"), ContainerNotFoundError);
}

TEST_F(DockerRuntimeTest, TestUnavailableEngine) {
    EXPECT_CALL(*runner_, Run(EngineVerb("version")))
        .WillOnce(Throw(sandbox::ProcessError("executable not found in PATH: docker")));
    EXPECT_THROW(runtime_.Initialize(), EngineError);
}

TEST_F(DockerRuntimeTest, TestExecuteCommand) {
    const auto id = Create();
    ProcessRequest exec{};
    EXPECT_CALL(*runner_, Run(AllOf(EngineVerb("exec"),
                                    Field(&ProcessRequest::argv, Contains(HasSubstr("'echo hello'"))))))
        .WillOnce(DoAll(SaveArg<0>(&exec), Return(Exited(0, "hello\n"))));
    const auto result = runtime_.ExecuteCommand(id, "echo hello", 10.0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "hello");
    EXPECT_EQ(result.return_code, 0);

    // The wrapper removes the pid file it wrote once the command returns.
    ASSERT_FALSE(exec.argv.empty());
    const auto& wrapped = exec.argv.back();
    const std::string marker = "echo $$ > ";
    const auto start = wrapped.find(marker);
    ASSERT_NE(start, std::string::npos);
    const auto pid_file = wrapped.substr(start + marker.size(), wrapped.find(' ', start + marker.size()) - start - marker.size());
    EXPECT_THAT(pid_file, StartsWith("/tmp/.warden-exec-"));
    const auto command_at = wrapped.find("'echo hello'");
    const auto removal_at = wrapped.find("rm -f " + pid_file);
    ASSERT_NE(removal_at, std::string::npos);
    EXPECT_GT(removal_at, command_at);
    EXPECT_THAT(wrapped, HasSubstr("exit $status"));
}

TEST_F(DockerRuntimeTest, TestExecuteNonZeroExit) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(EngineVerb("exec"))).WillOnce(Return(Exited(2, "", "boom\n")));
    const auto result = runtime_.ExecuteCommand(id, "false", 10.0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.return_code, 2);
    EXPECT_EQ(result.error, "boom");
}

TEST_F(DockerRuntimeTest, TestExecuteTimeoutKillsInContainer) {
    const auto id = Create();
    ProcessResult timed_out{};
    timed_out.timed_out = true;
    timed_out.exit_code = 124;
    {
        InSequence seq;
        EXPECT_CALL(*runner_, Run(AllOf(EngineVerb("exec"),
                                        Field(&ProcessRequest::timeout, std::chrono::milliseconds(1500)))))
            .WillOnce(Return(timed_out));
        EXPECT_CALL(*runner_, Run(AllOf(EngineVerb("exec"),
                                        Field(&ProcessRequest::argv, Contains(HasSubstr("kill -KILL"))))))
            .WillOnce(Return(Exited(0)));
    }
    const auto result = runtime_.ExecuteCommand(id, "sleep 60", 1.5);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "timeout");
    EXPECT_EQ(result.return_code, -1);
}

TEST_F(DockerRuntimeTest, TestExecuteUsesDefaultTimeout) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(AllOf(EngineVerb("exec"),
                                    Field(&ProcessRequest::timeout, std::chrono::milliseconds(600000)))))
        .WillOnce(Return(Exited(0)));
    EXPECT_TRUE(runtime_.ExecuteCommand(id, "true", 0.0).success);
}

TEST_F(DockerRuntimeTest, TestUnknownContainer) {
    EXPECT_THROW(runtime_.ExecuteCommand("nope", "ls", 1.0), ContainerNotFoundError);
    EXPECT_THROW(runtime_.CopyToContainer("nope", "/a", "/b"), ContainerNotFoundError);
    EXPECT_THROW(runtime_.GetContainerStatus("nope"), ContainerNotFoundError);
    EXPECT_THROW(runtime_.RemoveContainer("nope"), ContainerNotFoundError);
}

TEST_F(DockerRuntimeTest, TestCopyFailureIsFalse) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(Argv({"docker", "cp", "/host/file", "abc123:/workspace/file"})))
        .WillOnce(Return(Exited(1, "", "no such file\n")));
    EXPECT_FALSE(runtime_.CopyToContainer(id, "/host/file", "/workspace/file"));
    EXPECT_CALL(*runner_, Run(Argv({"docker", "cp", "abc123:/out.txt", "/tmp/out.txt"})))
        .WillOnce(Return(Exited(0)));
    EXPECT_TRUE(runtime_.CopyFromContainer(id, "/out.txt", "/tmp/out.txt"));
}

TEST_F(DockerRuntimeTest, TestInspectFailureReportsUnknown) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(EngineVerb("inspect"))).WillOnce(Return(Exited(1, "", "daemon gone\n")));
    const auto status = runtime_.GetContainerStatus(id);
    EXPECT_EQ(status.status, "unknown");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_THAT(*status.error, HasSubstr("daemon gone"));
}

TEST_F(DockerRuntimeTest, TestRemoveStopsThenRemoves) {
    const auto id = Create();
    {
        InSequence seq;
        EXPECT_CALL(*runner_, Run(EngineVerb("inspect")))
            .WillOnce(Return(Exited(0, R"([{"State": {"Status": "running"}}])")));
        EXPECT_CALL(*runner_, Run(EngineVerb("stats"))).WillOnce(Return(Exited(1)));
        EXPECT_CALL(*runner_, Run(Argv({"docker", "stop", "abc123"}))).WillOnce(Return(Exited(0)));
        EXPECT_CALL(*runner_, Run(Argv({"docker", "rm", "-f", "abc123"}))).WillOnce(Return(Exited(0)));
    }
    runtime_.RemoveContainer(id);
    EXPECT_THROW(runtime_.RemoveContainer(id), ContainerNotFoundError);
}

TEST_F(DockerRuntimeTest, TestRemoveFailureKeepsEntry) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(EngineVerb("inspect")))
        .WillRepeatedly(Return(Exited(0, R"([{"State": {"Status": "exited"}}])")));
    EXPECT_CALL(*runner_, Run(Argv({"docker", "rm", "abc123"}))).WillOnce(Return(Exited(1, "", "busy\n")));
    EXPECT_THROW(runtime_.RemoveContainer(id, false), EngineError);
    EXPECT_EQ(runtime_.GetContainerStatus(id).status, "stopped");
}

TEST_F(DockerRuntimeTest, TestStopFailureIsFalse) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(EngineVerb("stop"))).WillOnce(Return(Exited(1, "", "nope\n")));
    EXPECT_FALSE(runtime_.StopContainer(id));
}

TEST_F(DockerRuntimeTest, TestCleanupContinuesAfterFailure) {
    const auto id = Create();
    EXPECT_CALL(*runner_, Run(EngineVerb("inspect")))
        .WillRepeatedly(Return(Exited(0, R"([{"State": {"Status": "exited"}}])")));
    EXPECT_CALL(*runner_, Run(EngineVerb("rm"))).WillOnce(Return(Exited(1, "", "busy\n")));
    EXPECT_NO_THROW(runtime_.CleanupAll());
    EXPECT_EQ(runtime_.GetAllContainers().size(), 1u);
    EXPECT_EQ(runtime_.GetAllContainers().front().container_id, id);
}

}  // namespace
