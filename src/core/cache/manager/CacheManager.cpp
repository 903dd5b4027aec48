#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/CacheLog.hpp"
#include "core/cache/backend/DualStore.hpp"
#include "core/cache/backend/RedisStore.hpp"
#include "core/cache/batch/BatchCoordinator.hpp"
#include "core/cache/codec/CompressedCodec.hpp"
#include "core/cache/codec/JsonCodec.hpp"
#include "core/cache/tags/TagRegistry.hpp"
#include "core/cache/triggers/InvalidationHandlers.hpp"
#include <mutex>
#include <stdexcept>

namespace clinic {
namespace core {
namespace cache {

namespace {

// Внешнее хранилище из durableUrl; nullptr = только in-process
std::unique_ptr<BackendStore> makeDurableStore(const CacheConfig& config) {
    initializeCacheLogging(config);
    auto logger = cacheLogger();
    if (config.durableUrl.empty()) {
        logger->info("CacheManager: REDIS url не задан, используется in-process кэш");
        return nullptr;
    }
    auto endpoint = parseRedisUrl(config.durableUrl);
    if (!endpoint) {
        logger->warn("CacheManager: некорректный REDIS url, используется in-process кэш");
        return nullptr;
    }
    std::shared_ptr<const ValueCodec> codec = std::make_shared<JsonCodec>();
    if (config.enableCompression) {
        codec = std::make_shared<CompressedCodec>(codec);
    }
    logger->info("CacheManager: внешнее хранилище redis {}:{}/{} (codec={})",
                 endpoint->host, endpoint->port, endpoint->database, codec->name());
    return std::make_unique<RedisStore>(*endpoint, codec, config.connectTimeout,
                                        config.ioTimeout, config.reconnectInterval);
}

} // namespace

// Реализация PIMPL
struct CacheManager::Impl {
    CacheConfig config;
    TimeSource clock;
    DualStore store;
    TagRegistry registry;
    BatchCoordinator batch;
    TriggerDispatcher dispatcher;
    CacheStats counters; // Только монотонные счетчики
    bool initialized = false;
    mutable std::recursive_mutex mutex;

    Impl(const CacheConfig& cfg, std::unique_ptr<BackendStore> durable, TimeSource source)
        : config(cfg), clock(source ? std::move(source) : TimeSource(&Clock::now)),
          store(std::move(durable)) {}

    Clock::time_point now() const { return clock(); }

    // При выключенных метриках счетчики остаются нулевыми
    void count(uint64_t CacheStats::*counter, uint64_t amount = 1) {
        if (config.enableMetrics) {
            counters.*counter += amount;
        }
    }

    // Под mutex
    bool removeUnlocked(const std::string& key) {
        store.remove(key);
        registry.unregisterKey(key);
        count(&CacheStats::evictions);
        return true;
    }

    // Под mutex
    size_t invalidateTagUnlocked(const std::string& tag) {
        auto keys = registry.keysForTag(tag);
        size_t removed = 0;
        for (const auto& key : keys) {
            if (removeUnlocked(key)) {
                ++removed;
            }
        }
        count(&CacheStats::invalidations, removed);
        if (removed > 0) {
            cacheLogger()->info("Инвалидировано {} записей кэша по тегу {}", removed, tag);
        }
        return removed;
    }
};

CacheManager::CacheManager(const CacheConfig& config, TimeSource clock)
    : CacheManager(config, makeDurableStore(config), std::move(clock)) {}

CacheManager::CacheManager(const CacheConfig& config, std::unique_ptr<BackendStore> durable, TimeSource clock) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша: TTL и таймауты должны быть > 0");
    }
    initializeCacheLogging(config);
    pImpl = std::make_unique<Impl>(config, std::move(durable), std::move(clock));
    registerDefaultInvalidationHandlers(pImpl->dispatcher, *this);
    cacheLogger()->info("CacheManager создан: backend={}, defaultTtl={}s",
                        pImpl->store.name(), config.defaultTtl.count());
}

CacheManager::~CacheManager() {
    shutdown();
}

bool CacheManager::initialize(const WarmHook& warmHook) {
    auto start = std::chrono::steady_clock::now();
    auto logger = cacheLogger();
    {
        std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
        if (pImpl->initialized) {
            logger->warn("CacheManager уже инициализирован");
            return true;
        }
        if (auto* durable = pImpl->store.durable()) {
            if (durable->ping()) {
                logger->info("CacheManager: {} доступен", durable->name());
            } else {
                logger->warn("CacheManager: {} недоступен, работаем через in-process кэш", durable->name());
            }
        }
        pImpl->initialized = true;
    }

    // Прогрев вне замка: обработчик ходит в репозиторий и обратно в кэш
    if (warmHook) {
        try {
            warmHook(*this);
        } catch (const std::exception& e) {
            logger->error("CacheManager: ошибка прогрева кэша: {}", e.what());
        }
    }

    auto totalDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger->info("CacheManager успешно инициализирован за {} ms", totalDuration);
    return true;
}

void CacheManager::shutdown() {
    if (!pImpl) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    if (!pImpl->initialized) {
        return;
    }
    pImpl->initialized = false;
    cacheLogger()->info("CacheManager: завершение работы (записей={}, тегов={})",
                        pImpl->store.size(), pImpl->registry.tagCount());
}

std::optional<std::any> CacheManager::get(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    pImpl->count(&CacheStats::totalRequests);
    try {
        auto entry = pImpl->store.get(key);
        if (!entry) {
            pImpl->count(&CacheStats::cacheMisses);
            cacheLogger()->debug("Промах кэша: {}", key);
            return std::nullopt;
        }
        if (entry->isExpired(pImpl->now())) {
            pImpl->removeUnlocked(key);
            pImpl->count(&CacheStats::cacheMisses);
            cacheLogger()->debug("Запись кэша истекла: {}", key);
            return std::nullopt;
        }
        pImpl->count(&CacheStats::cacheHits);
        cacheLogger()->debug("Попадание в кэш: {}", key);
        return std::move(entry->value);
    } catch (const std::exception& e) {
        pImpl->count(&CacheStats::cacheMisses);
        cacheLogger()->error("Ошибка чтения кэша для ключа {}: {}", key, e.what());
        return std::nullopt;
    }
}

std::any CacheManager::get(const std::string& key, std::any defaultValue) {
    auto value = get(key);
    return value ? std::move(*value) : std::move(defaultValue);
}

bool CacheManager::set(const std::string& key, std::any value, std::chrono::seconds ttl, const TagSet& tags) {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    try {
        if (ttl.count() <= 0) {
            ttl = pImpl->config.defaultTtl;
        }
        if (auto* text = std::any_cast<const char*>(&value)) {
            value = std::string(*text);
        }
        auto entry = makeEntry(key, std::move(value), pImpl->now(), ttl, tags);
        if (auto previous = pImpl->store.local().get(key)) {
            entry.version = previous->version + 1;
        }
        if (!pImpl->store.set(entry, ttl)) {
            cacheLogger()->error("Не удалось записать в кэш ключ {}", key);
            return false;
        }
        pImpl->registry.registerKey(key, entry.tags);
        cacheLogger()->debug("Запись в кэш: {} (ttl={}s, тегов={})", key, ttl.count(), entry.tags.size());
        return true;
    } catch (const std::exception& e) {
        cacheLogger()->error("Ошибка записи в кэш для ключа {}: {}", key, e.what());
        return false;
    }
}

bool CacheManager::remove(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    try {
        return pImpl->removeUnlocked(key);
    } catch (const std::exception& e) {
        cacheLogger()->error("Ошибка удаления из кэша для ключа {}: {}", key, e.what());
        return false;
    }
}

size_t CacheManager::invalidateByTag(const std::string& tag) {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    if (pImpl->batch.defer(tag)) {
        cacheLogger()->debug("Инвалидация тега отложена до конца пакета: {}", tag);
        return 0;
    }
    try {
        return pImpl->invalidateTagUnlocked(tag);
    } catch (const std::exception& e) {
        cacheLogger()->error("Ошибка инвалидации тега {}: {}", tag, e.what());
        return 0;
    }
}

bool CacheManager::clearAll() {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    try {
        bool cleared = pImpl->store.clear();
        pImpl->registry.clear();
        cacheLogger()->info("Кэш очищен ({})", pImpl->store.name());
        return cleared;
    } catch (const std::exception& e) {
        cacheLogger()->error("Ошибка очистки кэша: {}", e.what());
        return false;
    }
}

size_t CacheManager::purgeExpired() {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    auto expired = pImpl->store.local().collectExpired(pImpl->now());
    for (const auto& key : expired) {
        pImpl->removeUnlocked(key);
    }
    if (!expired.empty()) {
        cacheLogger()->info("Удалено {} истекших записей кэша", expired.size());
    }
    return expired.size();
}

void CacheManager::beginBatch() {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    if (pImpl->batch.begin()) {
        cacheLogger()->info("Пакетная операция начата, инвалидации откладываются");
    } else {
        cacheLogger()->debug("Пакетная операция уже активна");
    }
}

size_t CacheManager::endBatch() {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    if (!pImpl->batch.isActive()) {
        cacheLogger()->debug("Завершение пакета без активного пакета проигнорировано");
        return 0;
    }
    auto deferred = pImpl->batch.finish();
    size_t removed = 0;
    for (const auto& tag : deferred) {
        removed += pImpl->invalidateTagUnlocked(tag);
    }
    pImpl->count(&CacheStats::deferredTagsFlushed, deferred.size());
    cacheLogger()->info("Пакетная операция завершена: инвалидировано тегов {} (записей {})",
                        deferred.size(), removed);
    return removed;
}

bool CacheManager::batchActive() const {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    return pImpl->batch.isActive();
}

void CacheManager::triggerInvalidation(const std::string& triggerType, const TriggerContext& context) {
    // Обработчики повторно входят в менеджер, замок здесь не держим
    auto result = pImpl->dispatcher.dispatch(triggerType, context);
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    if (result.known) {
        pImpl->count(&CacheStats::triggersDispatched);
    }
    pImpl->count(&CacheStats::handlerFailures, result.failed);
}

TriggerDispatcher& CacheManager::triggers() {
    return pImpl->dispatcher;
}

CacheStats CacheManager::getStats() const {
    std::lock_guard<std::recursive_mutex> lock(pImpl->mutex);
    CacheStats stats = pImpl->counters;
    stats.cacheSize = pImpl->store.size();
    stats.tagCount = pImpl->registry.tagCount();
    stats.durableAvailable = pImpl->store.durableAvailable();
    stats.durableBackend = pImpl->store.durableName();
    stats.batchActive = pImpl->batch.isActive();
    return stats;
}

const CacheConfig& CacheManager::getConfiguration() const {
    return pImpl->config;
}

void CacheManager::logTypeMismatch(const std::string& key, const char* stored, const char* requested) const {
    cacheLogger()->warn("Несовпадение типа значения для ключа {}: stored={}, requested={}", key, stored, requested);
}

} // namespace cache
} // namespace core
} // namespace clinic
