#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "core/cache/backend/BackendStore.hpp"

namespace clinic {
namespace core {
namespace cache {

// LocalStore: in-process хранилище (резерв для внешнего, не переживает рестарт)
class LocalStore : public BackendStore {
public:
    LocalStore() = default;
    std::optional<CacheEntry> get(const std::string& key) override; // Получить
    bool set(const CacheEntry& entry, std::chrono::seconds ttl) override; // Сохранить
    bool remove(const std::string& key) override; // Удалить
    bool clear() override; // Очистить
    bool isAvailable() const override { return true; }
    size_t size() const override; // Размер
    std::string name() const override { return "local"; }

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const; // Все ключи
    std::vector<std::string> collectExpired(Clock::time_point now) const; // Истекшие ключи
private:
    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace clinic
