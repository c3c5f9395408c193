#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/sandbox_config.hpp"

namespace warden::runtime {

struct ContainerRecord {
    std::string container_id;
    std::string name;
    std::shared_ptr<const config::RuntimeOptions> options;
    std::string status = "running";
    std::chrono::system_clock::time_point created_at;
    double cpu_time_s = 0.0;
    std::int64_t max_rss_kb = 0;
};

// Registry of the containers a runtime owns. Every method takes the table
// lock for its own duration only; callers never hold it across backend calls.
class ContainerTable {
public:
    void Insert(ContainerRecord record);
    std::optional<ContainerRecord> Find(const std::string& container_id) const;
    // Throws ContainerNotFoundError.
    ContainerRecord Get(const std::string& container_id) const;
    bool Contains(const std::string& container_id) const;
    bool SetStatus(const std::string& container_id, const std::string& status);
    bool AddUsage(const std::string& container_id, double cpu_time_s, std::int64_t rss_kb);
    bool Erase(const std::string& container_id);
    std::vector<std::string> Ids() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ContainerRecord> records_;
};

}  // namespace warden::runtime
