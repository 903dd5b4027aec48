#pragma once

#include <any>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/CacheEntry.hpp"
#include "core/cache/backend/BackendStore.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/cache/triggers/TriggerDispatcher.hpp"

namespace clinic {
namespace core {
namespace cache {

/**
 * @brief CacheManager: кэш с тегами и TTL поверх внешнего и in-process хранилищ.
 *
 * Создается один раз при старте и передается потребителям по ссылке.
 * Публичные вызовы не бросают исключений: ошибки хранилищ логируются
 * и превращаются в промах или false.
 */
class CacheManager {
public:
    using WarmHook = std::function<void(CacheManager&)>;

    explicit CacheManager(const CacheConfig& config, TimeSource clock = {}); // Конструктор
    // Внешнее хранилище задается явно вместо durableUrl
    CacheManager(const CacheConfig& config, std::unique_ptr<BackendStore> durable, TimeSource clock = {});
    ~CacheManager(); // Деструктор
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    bool initialize(const WarmHook& warmHook = {}); // Проверка хранилища и прогрев
    void shutdown(); // Завершение работы

    std::optional<std::any> get(const std::string& key); // Получить
    std::any get(const std::string& key, std::any defaultValue); // Получить или значение по умолчанию
    template <typename T>
    std::optional<T> getAs(const std::string& key);

    // ttl 0 означает defaultTtl из конфигурации
    bool set(const std::string& key, std::any value,
             std::chrono::seconds ttl = std::chrono::seconds(0), const TagSet& tags = {});
    bool remove(const std::string& key); // Удалить
    size_t invalidateByTag(const std::string& tag); // Инвалидировать тег, в пакете откладывается
    bool clearAll(); // Очистить оба хранилища и реестр тегов
    size_t purgeExpired(); // Удалить истекшие записи

    void beginBatch();
    size_t endBatch(); // Ключей удалено отложенной инвалидацией
    bool batchActive() const;

    void triggerInvalidation(const std::string& triggerType,
                             const TriggerContext& context = TriggerContext::object());
    TriggerDispatcher& triggers(); // Подписка обработчиков при старте

    CacheStats getStats() const; // Статистика
    const CacheConfig& getConfiguration() const; // Получить конфиг

    // Мемоизация: fn вызывается при промахе, результат кэшируется
    template <typename T, typename Fn>
    T cached(const std::string& key, std::chrono::seconds ttl, const TagSet& tags, Fn&& compute);
    // То же для optional-результата; nullopt не кэшируется
    template <typename T, typename Fn>
    std::optional<T> cachedOptional(const std::string& key, std::chrono::seconds ttl, const TagSet& tags, Fn&& compute);

private:
    void logTypeMismatch(const std::string& key, const char* stored, const char* requested) const;

    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

template <typename T>
std::optional<T> CacheManager::getAs(const std::string& key) {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    if (auto* typed = std::any_cast<T>(&*value)) {
        return *typed;
    }
    // Из внешнего хранилища значения приходят как JSON
    if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string> ||
                  std::is_same_v<T, std::vector<std::string>>) {
        if (auto* json = std::any_cast<nlohmann::json>(&*value)) {
            try {
                return json->get<T>();
            } catch (const nlohmann::json::exception&) {
                // ниже: несовпадение типа
            }
        }
    }
    logTypeMismatch(key, value->type().name(), typeid(T).name());
    return std::nullopt;
}

template <typename T, typename Fn>
T CacheManager::cached(const std::string& key, std::chrono::seconds ttl, const TagSet& tags, Fn&& compute) {
    if (auto hit = getAs<T>(key)) {
        return std::move(*hit);
    }
    T result = std::forward<Fn>(compute)();
    set(key, std::any(result), ttl, tags);
    return result;
}

template <typename T, typename Fn>
std::optional<T> CacheManager::cachedOptional(const std::string& key, std::chrono::seconds ttl,
                                              const TagSet& tags, Fn&& compute) {
    if (auto hit = getAs<T>(key)) {
        return hit;
    }
    std::optional<T> result = std::forward<Fn>(compute)();
    if (result) {
        set(key, std::any(*result), ttl, tags);
    }
    return result;
}

} // namespace cache
} // namespace core
} // namespace clinic
