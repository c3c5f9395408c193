#pragma once

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "runtime/container_runtime.hpp"

namespace warden::runtime {

// Call through a ContainerRuntime reference so the interface's default
// arguments apply.
class MockContainerRuntime : public ContainerRuntime {
public:
    MOCK_METHOD(std::string, Name, (), (const, override));
    MOCK_METHOD(void, Initialize, (), (override));
    MOCK_METHOD(std::string, CreateContainer, (const config::RuntimeOptions& options), (override));
    MOCK_METHOD(CommandResult, ExecuteCommand,
                (const std::string& container_id,
                 const std::string& command,
                 double timeout_s,
                 std::shared_ptr<const sandbox::CancelToken> cancel),
                (override));
    MOCK_METHOD(bool, CopyToContainer,
                (const std::string& container_id, const std::string& host_path, const std::string& container_path),
                (override));
    MOCK_METHOD(bool, CopyFromContainer,
                (const std::string& container_id, const std::string& container_path, const std::string& host_path),
                (override));
    MOCK_METHOD(ContainerStatus, GetContainerStatus, (const std::string& container_id), (override));
    MOCK_METHOD(bool, StopContainer, (const std::string& container_id), (override));
    MOCK_METHOD(void, RemoveContainer, (const std::string& container_id, bool force), (override));
    MOCK_METHOD(std::vector<ContainerStatus>, GetAllContainers, (), (override));
    MOCK_METHOD(void, CleanupAll, (), (override));
    MOCK_METHOD(void, Shutdown, (), (override));
};

}  // namespace warden::runtime
