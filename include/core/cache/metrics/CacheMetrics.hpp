#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace clinic {
namespace core {
namespace cache {

// CacheStats: снимок счетчиков кэша (запросы, попадания, инвалидации, состояние хранилищ)
struct CacheStats {
    uint64_t totalRequests = 0; // Кол-во get
    uint64_t cacheHits = 0;     // Попадания
    uint64_t cacheMisses = 0;   // Промахи
    uint64_t invalidations = 0; // Ключей удалено инвалидацией по тегам
    uint64_t evictions = 0;     // Удалений записей
    uint64_t triggersDispatched = 0; // Обработано триггеров
    uint64_t handlerFailures = 0;    // Упавших обработчиков
    uint64_t deferredTagsFlushed = 0; // Тегов, инвалидированных по окончании пакета
    size_t cacheSize = 0;      // Записей in-process
    size_t tagCount = 0;       // Тегов в реестре
    bool durableAvailable = false; // Внешнее хранилище доступно
    std::string durableBackend = "none";
    bool batchActive = false;  // Идет пакетная операция

    double hitRatio() const {
        return totalRequests == 0 ? 0.0 : static_cast<double>(cacheHits) / static_cast<double>(totalRequests);
    }

    nlohmann::json toJson() const {
        return {
            {"total_requests", totalRequests},
            {"cache_hits", cacheHits},
            {"cache_misses", cacheMisses},
            {"hit_ratio", hitRatio()},
            {"invalidations", invalidations},
            {"evictions", evictions},
            {"triggers_dispatched", triggersDispatched},
            {"handler_failures", handlerFailures},
            {"deferred_tags_flushed", deferredTagsFlushed},
            {"cache_size", cacheSize},
            {"tag_count", tagCount},
            {"durable_available", durableAvailable},
            {"durable_backend", durableBackend},
            {"batch_operation_active", batchActive}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace clinic
