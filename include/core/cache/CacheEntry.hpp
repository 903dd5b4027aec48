#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace clinic {
namespace core {
namespace cache {

using Clock = std::chrono::system_clock;
// Источник времени; в тестах подменяется управляемыми часами
using TimeSource = std::function<Clock::time_point()>;
using TagSet = std::set<std::string>;

// CacheEntry: запись кэша (значение, время создания/истечения, теги, версия)
struct CacheEntry {
    std::string key;
    std::any value;
    Clock::time_point createdAt;
    std::optional<Clock::time_point> expiresAt; // nullopt = бессрочно
    TagSet tags;
    uint32_t version = 1; // Зарезервировано

    bool isExpired(Clock::time_point now) const {
        return expiresAt && now >= *expiresAt;
    }
};

// Создать запись с TTL относительно now
inline CacheEntry makeEntry(const std::string& key, std::any value, Clock::time_point now,
                            std::chrono::seconds ttl, TagSet tags = {}) {
    CacheEntry entry;
    entry.key = key;
    entry.value = std::move(value);
    entry.createdAt = now;
    if (ttl.count() > 0) {
        entry.expiresAt = now + ttl;
    }
    entry.tags = std::move(tags);
    return entry;
}

} // namespace cache
} // namespace core
} // namespace clinic
