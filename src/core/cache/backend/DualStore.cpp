#include "core/cache/backend/DualStore.hpp"
#include "core/cache/CacheLog.hpp"

namespace clinic {
namespace core {
namespace cache {

DualStore::DualStore(std::unique_ptr<BackendStore> durable)
    : durable_(std::move(durable)) {}

void DualStore::reconcileUnlocked() {
    if (!durable_ || (!clearPending_ && pending_.empty())) {
        return;
    }
    if (clearPending_) {
        if (!durable_->clear()) {
            return;
        }
        clearPending_ = false;
        pending_.clear();
        cacheLogger()->info("DualStore: отложенная очистка {} выполнена", durable_->name());
        return;
    }
    size_t before = pending_.size();
    for (auto it = pending_.begin(); it != pending_.end();) {
        // false без потери связи означает, что ключа уже нет
        if (!durable_->remove(*it) && !durable_->isAvailable()) {
            break;
        }
        it = pending_.erase(it);
    }
    if (pending_.size() != before) {
        cacheLogger()->info("DualStore: синхронизировано {} ключей с {}, осталось {}",
                            before - pending_.size(), durable_->name(), pending_.size());
    }
}

void DualStore::markPendingUnlocked(const std::string& key, bool durableOk) {
    if (durableOk) {
        pending_.erase(key);
        return;
    }
    if (pending_.insert(key).second) {
        cacheLogger()->debug("DualStore: ключ {} ожидает синхронизации с {}", key, durable_->name());
    }
}

std::optional<CacheEntry> DualStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconcileUnlocked();
    if (durable_ && !clearPending_ && pending_.count(key) == 0) {
        if (auto entry = durable_->get(key)) {
            return entry;
        }
    }
    return local_.get(key);
}

bool DualStore::set(const CacheEntry& entry, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    // In-process копия пишется всегда: она остается доступной при сбое внешнего хранилища
    bool stored = local_.set(entry, ttl);
    if (!durable_) {
        return stored;
    }
    reconcileUnlocked();
    bool durableOk = durable_->set(entry, ttl);
    if (!durableOk) {
        cacheLogger()->debug("DualStore: ключ {} сохранен только in-process", entry.key);
    }
    markPendingUnlocked(entry.key, durableOk);
    return stored;
}

bool DualStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removedLocal = local_.remove(key);
    if (!durable_) {
        return true;
    }
    reconcileUnlocked();
    bool removedDurable = durable_->remove(key);
    markPendingUnlocked(key, removedDurable || durable_->isAvailable());
    cacheLogger()->debug("DualStore: удален ключ {} (durable={}, local={})", key, removedDurable, removedLocal);
    return true;
}

bool DualStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (durable_) {
        if (durable_->clear()) {
            clearPending_ = false;
            pending_.clear();
        } else {
            clearPending_ = true;
            cacheLogger()->warn("DualStore: не удалось очистить {}, очищается только in-process кэш", durable_->name());
        }
    }
    return local_.clear();
}

std::string DualStore::name() const {
    return durable_ ? durable_->name() + "+local" : "local";
}

bool DualStore::durableAvailable() const {
    return durable_ && durable_->isAvailable();
}

std::string DualStore::durableName() const {
    return durable_ ? durable_->name() : "none";
}

size_t DualStore::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace cache
} // namespace core
} // namespace clinic
