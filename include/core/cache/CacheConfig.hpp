#pragma once
#include <string>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace clinic {
namespace core {
namespace cache {

// CacheConfig: параметры кэша (внешнее хранилище, TTL, таймауты, сжатие, логи)
struct CacheConfig {
    std::string durableUrl;                                   // redis://[:pass@]host[:port][/db], пусто = только in-process
    std::chrono::seconds defaultTtl = std::chrono::seconds(3600); // TTL по умолчанию (1 час)
    std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(5000); // Таймаут подключения
    std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(5000);      // Таймаут чтения/записи
    std::chrono::seconds reconnectInterval = std::chrono::seconds(30); // Пауза между попытками переподключения
    bool enableCompression = false;      // Сжатие zlib для внешнего хранилища
    bool enableMetrics = true;           // Метрики
    double lowHitRatioThreshold = 0.5;   // Порог предупреждения о низком hit ratio
    size_t minRequestsForHealth = 100;   // Мин. число запросов для оценки hit ratio
    std::string logPath = "logs/cachemanager.log"; // Пусто = без файлового лога
    size_t maxLogSize = 1024 * 1024 * 5; // 5MB
    size_t maxLogFiles = 2;
    std::string logLevel = "info";

    bool validate() const {
        return defaultTtl.count() > 0 && connectTimeout.count() > 0 && ioTimeout.count() > 0 &&
               lowHitRatioThreshold >= 0.0 && lowHitRatioThreshold <= 1.0;
    }

    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j); // Отсутствующие поля берутся по умолчанию
    static CacheConfig fromFile(const std::string& path);  // Бросает std::runtime_error
    static CacheConfig fromEnvironment();                   // REDIS_URL, CACHE_DEFAULT_TTL
};

} // namespace cache
} // namespace core
} // namespace clinic
