#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/cache/CacheEntry.hpp"

namespace clinic {
namespace core {
namespace cache {

// TagRegistry: инвертированный индекс tag -> keys и обратный key -> tags.
// Без собственной синхронизации: вызывается под замком CacheManager.
class TagRegistry {
public:
    // Заменяет прежний набор тегов ключа на tags
    void registerKey(const std::string& key, const TagSet& tags);
    // Убирает ключ из всех тегов; пустые теги удаляются
    void unregisterKey(const std::string& key);
    std::vector<std::string> keysForTag(const std::string& tag) const;
    TagSet tagsForKey(const std::string& key) const;
    bool hasTag(const std::string& tag) const;
    size_t tagCount() const { return tagToKeys_.size(); }
    size_t keyCount() const { return keyToTags_.size(); }
    void clear();
private:
    std::unordered_map<std::string, TagSet> tagToKeys_;
    std::unordered_map<std::string, TagSet> keyToTags_;
};

} // namespace cache
} // namespace core
} // namespace clinic
