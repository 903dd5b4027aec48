#include "core/cache/triggers/TriggerDispatcher.hpp"
#include "core/cache/CacheLog.hpp"
#include <algorithm>
#include <cmath>

namespace clinic {
namespace core {
namespace cache {

void TriggerDispatcher::subscribe(const std::string& triggerType, const std::string& handlerName,
                                  TriggerHandler handler) {
    if (!handler) {
        cacheLogger()->error("TriggerDispatcher: пустой обработчик '{}' для '{}'", handlerName, triggerType);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = subscriptions_[triggerType];
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const Subscription& s) { return s.name == handlerName; });
    if (it != list.end()) {
        it->handler = std::move(handler);
        cacheLogger()->debug("TriggerDispatcher: обработчик '{}' для '{}' заменен", handlerName, triggerType);
        return;
    }
    list.push_back(Subscription{handlerName, std::move(handler)});
    cacheLogger()->debug("TriggerDispatcher: подписан '{}' на '{}'", handlerName, triggerType);
}

bool TriggerDispatcher::unsubscribe(const std::string& triggerType, const std::string& handlerName) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(triggerType);
    if (it == subscriptions_.end()) {
        return false;
    }
    auto& list = it->second;
    auto before = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const Subscription& s) { return s.name == handlerName; }),
               list.end());
    bool removed = list.size() != before;
    if (list.empty()) {
        subscriptions_.erase(it);
    }
    return removed;
}

DispatchResult TriggerDispatcher::dispatch(const std::string& triggerType, const TriggerContext& context) const {
    DispatchResult result;
    std::vector<Subscription> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(triggerType);
        if (it != subscriptions_.end()) {
            handlers = it->second;
        }
    }
    if (handlers.empty()) {
        cacheLogger()->warn("TriggerDispatcher: неизвестный триггер инвалидации '{}'", triggerType);
        return result;
    }
    result.known = true;
    for (const auto& subscription : handlers) {
        ++result.invoked;
        try {
            subscription.handler(context);
        } catch (const std::exception& e) {
            ++result.failed;
            cacheLogger()->error("TriggerDispatcher: обработчик '{}' триггера '{}' упал: {} (context={})",
                                 subscription.name, triggerType, e.what(), context.dump());
        } catch (...) {
            ++result.failed;
            cacheLogger()->error("TriggerDispatcher: обработчик '{}' триггера '{}' бросил неизвестное исключение (context={})",
                                 subscription.name, triggerType, context.dump());
        }
    }
    return result;
}

bool TriggerDispatcher::hasHandlers(const std::string& triggerType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(triggerType);
    return it != subscriptions_.end() && !it->second.empty();
}

std::vector<std::string> TriggerDispatcher::triggerTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(subscriptions_.size());
    for (const auto& [type, _] : subscriptions_) {
        result.push_back(type);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::optional<std::string> contextId(const TriggerContext& context, const std::string& field) {
    if (!context.is_object()) return std::nullopt;
    auto it = context.find(field);
    if (it == context.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value == 0) return std::nullopt;
        return std::to_string(value);
    }
    if (it->is_number_integer()) {
        auto value = it->get<int64_t>();
        if (value == 0) return std::nullopt;
        return std::to_string(value);
    }
    // Целое, пришедшее как число с плавающей точкой (7.0)
    if (it->is_number_float()) {
        auto value = it->get<double>();
        if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.0e18) {
            auto integral = static_cast<int64_t>(value);
            if (integral == 0) return std::nullopt;
            return std::to_string(integral);
        }
    }
    if (it->is_string()) {
        auto value = it->get<std::string>();
        if (value.empty()) return std::nullopt;
        return value;
    }
    cacheLogger()->debug("contextId: поле {} с неподдерживаемым значением {} пропущено", field, it->dump());
    return std::nullopt;
}

} // namespace cache
} // namespace core
} // namespace clinic
