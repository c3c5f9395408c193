#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/process_runner.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>

namespace {

using ::testing::HasSubstr;

using namespace warden::sandbox;

ProcessRequest Shell(const std::string& script) {
    ProcessRequest request{};
    request.argv = {"/bin/sh", "-c", script};
    return request;
}

TEST(SubprocessRunnerTest, TestCapturesOutput) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("echo out; echo err 1>&2; exit 3"));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "out\n");
    EXPECT_EQ(result.error, "err\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.cancelled);
}

TEST(SubprocessRunnerTest, TestSearchesPath) {
    SubprocessRunner runner;
    ProcessRequest request{};
    request.argv = {"sh", "-c", "printf hi"};
    const auto result = runner.Run(request);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hi");
}

TEST(SubprocessRunnerTest, TestMissingExecutable) {
    SubprocessRunner runner;
    ProcessRequest request{};
    request.argv = {"warden-no-such-binary"};
    EXPECT_THROW(runner.Run(request), ProcessError);
}

TEST(SubprocessRunnerTest, TestEmptyArgv) {
    SubprocessRunner runner;
    EXPECT_THROW(runner.Run(ProcessRequest{}), ProcessError);
}

TEST(SubprocessRunnerTest, TestEnvironmentAndWorkingDir) {
    SubprocessRunner runner;
    auto request = Shell("printf '%s:' \"$WARDEN_TEST_VAR\"; pwd");
    request.environment["WARDEN_TEST_VAR"] = "value";
    request.working_dir = std::filesystem::temp_directory_path().string();
    const auto result = runner.Run(request);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_THAT(result.output, HasSubstr("value:"));
    EXPECT_THAT(result.output, HasSubstr(std::filesystem::canonical(std::filesystem::temp_directory_path()).string()));
}

TEST(SubprocessRunnerTest, TestTimeoutKillsProcessGroup) {
    SubprocessRunner runner;
    auto request = Shell("sleep 5 & sleep 5; echo done");
    request.timeout = std::chrono::milliseconds(200);
    const auto start = std::chrono::steady_clock::now();
    const auto result = runner.Run(request);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.output, "");
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(SubprocessRunnerTest, TestCancellation) {
    SubprocessRunner runner;
    auto token = std::make_shared<CancelToken>();
    auto request = Shell("sleep 5");
    request.cancel = token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token->Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    const auto result = runner.Run(request);
    canceller.join();
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST(SubprocessRunnerTest, TestSignalExitCode) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("kill -9 $$"));
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(SubprocessRunnerTest, TestFileSizeLimit) {
    SubprocessRunner runner;
    const auto target = std::filesystem::temp_directory_path() / "warden_fsize_test.bin";
    auto request = Shell("trap '' XFSZ; head -c 65536 /dev/zero > '" + target.string() + "'");
    request.file_size_limit_bytes = 4096;
    const auto result = runner.Run(request);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_LE(std::filesystem::file_size(target), 4096u);
    std::filesystem::remove(target);
}

TEST(SubprocessRunnerTest, TestMemoryLimitCapsDataNotAddressSpace) {
    SubprocessRunner runner;
    auto request = Shell("ulimit -d; ulimit -v");
    request.memory_limit_bytes = 512ULL << 20;
    const auto result = runner.Run(request);
    ASSERT_EQ(result.exit_code, 0) << result.error;
    const auto newline = result.output.find('\n');
    ASSERT_NE(newline, std::string::npos);
    EXPECT_EQ(result.output.substr(0, newline), "524288");
    EXPECT_NE(result.output.substr(newline + 1), "524288\n");
}

// With SIGCHLD ignored the kernel reaps the child itself, so wait4 fails.
class IgnoredChildSignal {
public:
    IgnoredChildSignal() : previous_(std::signal(SIGCHLD, SIG_IGN)) {}
    ~IgnoredChildSignal() { std::signal(SIGCHLD, previous_); }

private:
    void (*previous_)(int);
};

TEST(SubprocessRunnerTest, TestUnwaitableChildIsNotATimeout) {
    SubprocessRunner runner;
    auto request = Shell("exit 0");
    request.timeout = std::chrono::seconds(5);
    IgnoredChildSignal ignored;
    EXPECT_THROW(runner.Run(request), ProcessError);
}

TEST(SubprocessRunnerTest, TestReportsUsage) {
    SubprocessRunner runner;
    const auto result = runner.Run(Shell("i=0; while [ $i -lt 20000 ]; do i=$((i+1)); done"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GT(result.max_rss_kb, 0);
    EXPECT_GE(result.cpu_time_s, 0.0);
}

}  // namespace
