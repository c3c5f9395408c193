#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/cancel_token.hpp"

namespace warden::sandbox {

// The child process could not be started at all.
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProcessRequest {
    std::vector<std::string> argv;
    // Empty means the current directory.
    std::string working_dir;
    // Merged over the environment of this process.
    std::map<std::string, std::string> environment;
    // Zero means no deadline.
    std::chrono::milliseconds timeout{0};
    std::shared_ptr<const CancelToken> cancel;
    // Applied as RLIMIT_DATA.
    std::optional<std::uint64_t> memory_limit_bytes;
    // Applied as RLIMIT_FSIZE.
    std::optional<std::uint64_t> file_size_limit_bytes;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string output;
    std::string error;
    double cpu_time_s = 0.0;
    std::int64_t max_rss_kb = 0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs the process to completion, deadline or cancellation. A process
    // that was stopped early has its whole process group terminated before
    // this returns. Throws ProcessError when the process cannot be spawned
    // or can no longer be waited for.
    virtual ProcessResult Run(const ProcessRequest& request) = 0;
};

class SubprocessRunner : public ProcessRunner {
public:
    ProcessResult Run(const ProcessRequest& request) override;
};

}  // namespace warden::sandbox
