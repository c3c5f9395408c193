#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace warden::sandbox {
namespace bp = boost::process;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kTerminateGrace = std::chrono::seconds(1);

// Runs in the forked child before exec: puts the child in its own process
// group, so the whole tree can be signalled, and applies rlimits.
struct ChildSetup : bp::extend::handler {
    std::optional<std::uint64_t> memory_limit_bytes;
    std::optional<std::uint64_t> file_size_limit_bytes;

    template <typename Executor>
    void on_exec_setup(Executor& exec) const {
        if (::setpgid(0, 0) != 0) {
            exec.set_error(std::error_code(errno, std::system_category()), "setpgid failed");
            return;
        }
        if (memory_limit_bytes) {
            const rlimit limit{static_cast<rlim_t>(*memory_limit_bytes),
                               static_cast<rlim_t>(*memory_limit_bytes)};
            // RLIMIT_DATA caps writable private memory; runtimes such as V8
            // reserve large PROT_NONE ranges that RLIMIT_AS would count.
            if (::setrlimit(RLIMIT_DATA, &limit) != 0) {
                exec.set_error(std::error_code(errno, std::system_category()), "setrlimit(RLIMIT_DATA) failed");
                return;
            }
        }
        if (file_size_limit_bytes) {
            const rlimit limit{static_cast<rlim_t>(*file_size_limit_bytes),
                               static_cast<rlim_t>(*file_size_limit_bytes)};
            if (::setrlimit(RLIMIT_FSIZE, &limit) != 0) {
                exec.set_error(std::error_code(errno, std::system_category()), "setrlimit(RLIMIT_FSIZE) failed");
            }
        }
    }
};

std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const auto found = bp::search_path(name);
    if (found.empty()) {
        throw ProcessError("executable not found in PATH: " + name);
    }
    return found.string();
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream target;
    target << input.rdbuf();
    return target.str();
}

bool StopRequested(const ProcessRequest& request) {
    return request.cancel && request.cancel->IsCancelled();
}

// Polls for exit until `deadline`. Returns true once the child was reaped,
// false on deadline or stop request. Throws ProcessError when the child can
// no longer be waited for.
bool WaitUntil(pid_t pid,
               std::chrono::steady_clock::time_point deadline,
               int& status,
               rusage& usage,
               const ProcessRequest* request) {
    while (true) {
        const auto waited = ::wait4(pid, &status, WNOHANG, &usage);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            throw ProcessError(std::string("wait4 failed: ") + std::strerror(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (request && StopRequested(*request)) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void TerminateGroup(pid_t pid, int& status, rusage& usage) {
    ::killpg(pid, SIGTERM);
    if (WaitUntil(pid, std::chrono::steady_clock::now() + kTerminateGrace, status, usage, nullptr)) {
        // Leader is gone; make sure nothing it forked outlives it.
        ::killpg(pid, SIGKILL);
        return;
    }
    ::killpg(pid, SIGKILL);
    while (::wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) {
            throw ProcessError(std::string("wait4 failed: ") + std::strerror(errno));
        }
    }
}

}  // namespace

ProcessResult SubprocessRunner::Run(const ProcessRequest& request) {
    if (request.argv.empty()) {
        throw ProcessError("empty command line");
    }
    ProcessResult result{};

    const auto stamp = utils::GenerateHexId(16);
    const auto stdout_path = std::filesystem::temp_directory_path() / ("warden_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("warden_stderr_" + stamp + ".log");

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : request.environment) {
        env[key] = value;
    }

    const auto executable = ResolveExecutable(request.argv.front());
    const std::vector<std::string> args(request.argv.begin() + 1, request.argv.end());
    const auto working_dir = request.working_dir.empty()
        ? std::filesystem::current_path().string()
        : request.working_dir;

    ChildSetup setup{};
    setup.memory_limit_bytes = request.memory_limit_bytes;
    setup.file_size_limit_bytes = request.file_size_limit_bytes;

    utils::LogDebug("process", "spawn", {{"argv", utils::Join(request.argv, " ")}, {"cwd", working_dir}});

    try {
        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            env,
            bp::start_dir = working_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            setup);

        const pid_t pid = child_process.id();
        const auto deadline = request.timeout.count() > 0
            ? std::chrono::steady_clock::now() + request.timeout
            : std::chrono::steady_clock::time_point::max();

        int status = 0;
        rusage usage{};
        try {
            const bool finished = WaitUntil(pid, deadline, status, usage, &request);
            if (!finished) {
                if (StopRequested(request)) {
                    result.cancelled = true;
                } else {
                    result.timed_out = true;
                }
                TerminateGroup(pid, status, usage);
            }
        } catch (const ProcessError&) {
            ::killpg(pid, SIGKILL);
            child_process.detach();
            throw;
        }
        // Already reaped above; keep the destructor from signalling the pid.
        child_process.detach();

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        if (result.timed_out) {
            result.exit_code = 124;
        }
        result.cpu_time_s = static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
                            static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
        result.max_rss_kb = usage.ru_maxrss;
    } catch (const bp::process_error& ex) {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw ProcessError(std::string("failed to start ") + request.argv.front() + ": " + ex.what());
    } catch (const ProcessError& ex) {
        utils::LogError("process", "lost track of child", {{"argv0", request.argv.front()}, {"error", ex.what()}});
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw;
    }

    result.output = ReadFile(stdout_path);
    result.error = ReadFile(stderr_path);

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);

    utils::LogDebug("process", "exit", {
        {"argv0", request.argv.front()},
        {"code", std::to_string(result.exit_code)},
        {"timed_out", result.timed_out ? "true" : "false"},
        {"cancelled", result.cancelled ? "true" : "false"}
    });
    return result;
}

}  // namespace warden::sandbox
