#include "core/cache/tags/TagRegistry.hpp"

namespace clinic {
namespace core {
namespace cache {

void TagRegistry::registerKey(const std::string& key, const TagSet& tags) {
    unregisterKey(key);
    if (tags.empty()) {
        return;
    }
    for (const auto& tag : tags) {
        tagToKeys_[tag].insert(key);
    }
    keyToTags_[key] = tags;
}

void TagRegistry::unregisterKey(const std::string& key) {
    auto it = keyToTags_.find(key);
    if (it == keyToTags_.end()) {
        return;
    }
    for (const auto& tag : it->second) {
        auto tagIt = tagToKeys_.find(tag);
        if (tagIt == tagToKeys_.end()) continue;
        tagIt->second.erase(key);
        if (tagIt->second.empty()) {
            tagToKeys_.erase(tagIt);
        }
    }
    keyToTags_.erase(it);
}

std::vector<std::string> TagRegistry::keysForTag(const std::string& tag) const {
    auto it = tagToKeys_.find(tag);
    if (it == tagToKeys_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

TagSet TagRegistry::tagsForKey(const std::string& key) const {
    auto it = keyToTags_.find(key);
    return it == keyToTags_.end() ? TagSet{} : it->second;
}

bool TagRegistry::hasTag(const std::string& tag) const {
    return tagToKeys_.count(tag) > 0;
}

void TagRegistry::clear() {
    tagToKeys_.clear();
    keyToTags_.clear();
}

} // namespace cache
} // namespace core
} // namespace clinic
