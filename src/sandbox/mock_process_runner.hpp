#pragma once

#include "gmock/gmock.h"
#include "sandbox/process_runner.hpp"

namespace warden::sandbox {

class MockProcessRunner : public ProcessRunner {
public:
    MOCK_METHOD(ProcessResult, Run, (const ProcessRequest& request), (override));
};

inline ProcessResult Exited(int code, const std::string& output = {}, const std::string& error = {}) {
    ProcessResult result{};
    result.exit_code = code;
    result.output = output;
    result.error = error;
    return result;
}

}  // namespace warden::sandbox
