#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include "core/cache/backend/BackendStore.hpp"
#include "core/cache/backend/LocalStore.hpp"

namespace clinic {
namespace core {
namespace cache {

// DualStore: зеркалирование записей во внешнее хранилище и in-process карту.
// Чтение: сначала внешнее, при ошибке или промахе in-process.
// Ключ, запись или удаление которого во внешнем хранилище не прошли, попадает
// в pending: внешняя копия для него не читается, пока DEL не будет повторен.
class DualStore : public BackendStore {
public:
    explicit DualStore(std::unique_ptr<BackendStore> durable = nullptr); // nullptr = только in-process
    std::optional<CacheEntry> get(const std::string& key) override;
    bool set(const CacheEntry& entry, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool isAvailable() const override { return true; }
    size_t size() const override { return local_.size(); } // Размер in-process части
    std::string name() const override;

    bool hasDurable() const { return durable_ != nullptr; }
    bool durableAvailable() const; // Внешнее хранилище настроено и доступно
    std::string durableName() const;
    BackendStore* durable() { return durable_.get(); }
    LocalStore& local() { return local_; }
    const LocalStore& local() const { return local_; }
    size_t pendingCount() const; // Ключей, ожидающих повторного DEL
private:
    // Вызывается под mutex_
    void reconcileUnlocked();
    void markPendingUnlocked(const std::string& key, bool durableOk);

    std::unique_ptr<BackendStore> durable_;
    LocalStore local_;
    std::unordered_set<std::string> pending_;
    bool clearPending_ = false; // Внешний FLUSH не прошел: внешние копии не читаются
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace clinic
