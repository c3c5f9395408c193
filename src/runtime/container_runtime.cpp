#include "runtime/container_runtime.hpp"

namespace warden::runtime {

nlohmann::json ToJson(const CommandResult& result) {
    nlohmann::json json = {
        {"success", result.success},
        {"output", result.output},
        {"return_code", result.return_code}
    };
    if (!result.error.empty()) {
        json["error"] = result.error;
    }
    return json;
}

nlohmann::json ToJson(const ContainerStatus& status) {
    const auto created = std::chrono::duration<double>(status.created_at.time_since_epoch()).count();
    nlohmann::json json = {
        {"container_id", status.container_id},
        {"name", status.name},
        {"status", status.status},
        {"cpu_usage", status.cpu_usage},
        {"memory_usage", status.memory_usage},
        {"created_at", created}
    };
    if (status.error) {
        json["error"] = *status.error;
    }
    return json;
}

}  // namespace warden::runtime
