#include "core/cache/batch/BatchCoordinator.hpp"

namespace clinic {
namespace core {
namespace cache {

bool BatchCoordinator::begin() {
    if (active_) {
        return false;
    }
    active_ = true;
    deferred_.clear();
    return true;
}

bool BatchCoordinator::defer(const std::string& tag) {
    if (!active_) {
        return false;
    }
    deferred_.insert(tag);
    return true;
}

std::vector<std::string> BatchCoordinator::finish() {
    if (!active_) {
        return {};
    }
    active_ = false;
    std::vector<std::string> tags(deferred_.begin(), deferred_.end());
    deferred_.clear();
    return tags;
}

} // namespace cache
} // namespace core
} // namespace clinic
