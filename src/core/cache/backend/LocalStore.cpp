#include "core/cache/backend/LocalStore.hpp"
#include <mutex>

namespace clinic {
namespace core {
namespace cache {

std::optional<CacheEntry> LocalStore::get(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LocalStore::set(const CacheEntry& entry, std::chrono::seconds /*ttl*/) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[entry.key] = entry;
    return true;
}

bool LocalStore::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

bool LocalStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    return true;
}

size_t LocalStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool LocalStore::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

std::vector<std::string> LocalStore::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        result.push_back(key);
    }
    return result;
}

std::vector<std::string> LocalStore::collectExpired(Clock::time_point now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [key, entry] : entries_) {
        if (entry.isExpired(now)) {
            result.push_back(key);
        }
    }
    return result;
}

} // namespace cache
} // namespace core
} // namespace clinic
