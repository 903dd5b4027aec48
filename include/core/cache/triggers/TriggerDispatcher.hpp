#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace clinic {
namespace core {
namespace cache {

// Контекст доменного события (patient_id, screening_type_id, data_type, ...)
using TriggerContext = nlohmann::json;
using TriggerHandler = std::function<void(const TriggerContext&)>;

// DispatchResult: итог рассылки одного события
struct DispatchResult {
    bool known = false;   // Есть ли подписчики на тип
    size_t invoked = 0;   // Вызвано обработчиков
    size_t failed = 0;    // Из них упало
};

/**
 * @brief Реестр подписчиков на именованные триггеры инвалидации.
 *
 * Обработчики регистрируются при старте и вызываются в порядке подписки.
 * Исключение обработчика логируется и не мешает остальным обработчикам.
 * Обработчики вызываются вне внутреннего замка, поэтому могут
 * подписывать/отписывать и повторно входить в CacheManager.
 */
class TriggerDispatcher {
public:
    // Повторная подписка с тем же именем заменяет обработчик
    void subscribe(const std::string& triggerType, const std::string& handlerName, TriggerHandler handler);
    bool unsubscribe(const std::string& triggerType, const std::string& handlerName);
    DispatchResult dispatch(const std::string& triggerType, const TriggerContext& context) const;
    bool hasHandlers(const std::string& triggerType) const;
    std::vector<std::string> triggerTypes() const;
private:
    struct Subscription {
        std::string name;
        TriggerHandler handler;
    };
    std::unordered_map<std::string, std::vector<Subscription>> subscriptions_;
    mutable std::mutex mutex_;
};

// Идентификатор из контекста: целое или непустая строка; null, "" и 0 считаются отсутствующими
std::optional<std::string> contextId(const TriggerContext& context, const std::string& field);

} // namespace cache
} // namespace core
} // namespace clinic
