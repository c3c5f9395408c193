#include "runtime/container_table.hpp"

#include <algorithm>

#include "runtime/container_runtime.hpp"

namespace warden::runtime {

void ContainerTable::Insert(ContainerRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = record.container_id;
    records_[std::move(id)] = std::move(record);
}

std::optional<ContainerRecord> ContainerTable::Find(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(container_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ContainerRecord ContainerTable::Get(const std::string& container_id) const {
    auto record = Find(container_id);
    if (!record) {
        throw ContainerNotFoundError(container_id);
    }
    return *record;
}

bool ContainerTable::Contains(const std::string& container_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.find(container_id) != records_.end();
}

bool ContainerTable::SetStatus(const std::string& container_id, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(container_id);
    if (it == records_.end()) {
        return false;
    }
    it->second.status = status;
    return true;
}

bool ContainerTable::AddUsage(const std::string& container_id, double cpu_time_s, std::int64_t rss_kb) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(container_id);
    if (it == records_.end()) {
        return false;
    }
    it->second.cpu_time_s += cpu_time_s;
    it->second.max_rss_kb = std::max(it->second.max_rss_kb, rss_kb);
    return true;
}

bool ContainerTable::Erase(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(container_id) > 0;
}

std::vector<std::string> ContainerTable::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, _] : records_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ContainerTable::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace warden::runtime
