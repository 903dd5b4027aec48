#include "core/cache/CacheConfig.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace clinic {
namespace core {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    return {
        {"durableUrl", durableUrl},
        {"defaultTtlSeconds", defaultTtl.count()},
        {"connectTimeoutMs", connectTimeout.count()},
        {"ioTimeoutMs", ioTimeout.count()},
        {"reconnectIntervalSeconds", reconnectInterval.count()},
        {"enableCompression", enableCompression},
        {"enableMetrics", enableMetrics},
        {"lowHitRatioThreshold", lowHitRatioThreshold},
        {"minRequestsForHealth", minRequestsForHealth},
        {"logPath", logPath},
        {"maxLogSize", maxLogSize},
        {"maxLogFiles", maxLogFiles},
        {"logLevel", logLevel}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    config.durableUrl = j.value("durableUrl", config.durableUrl);
    config.defaultTtl = std::chrono::seconds(j.value("defaultTtlSeconds", static_cast<long long>(config.defaultTtl.count())));
    config.connectTimeout = std::chrono::milliseconds(j.value("connectTimeoutMs", static_cast<long long>(config.connectTimeout.count())));
    config.ioTimeout = std::chrono::milliseconds(j.value("ioTimeoutMs", static_cast<long long>(config.ioTimeout.count())));
    config.reconnectInterval = std::chrono::seconds(j.value("reconnectIntervalSeconds", static_cast<long long>(config.reconnectInterval.count())));
    config.enableCompression = j.value("enableCompression", config.enableCompression);
    config.enableMetrics = j.value("enableMetrics", config.enableMetrics);
    config.lowHitRatioThreshold = j.value("lowHitRatioThreshold", config.lowHitRatioThreshold);
    config.minRequestsForHealth = j.value("minRequestsForHealth", config.minRequestsForHealth);
    config.logPath = j.value("logPath", config.logPath);
    config.maxLogSize = j.value("maxLogSize", config.maxLogSize);
    config.maxLogFiles = j.value("maxLogFiles", config.maxLogFiles);
    config.logLevel = j.value("logLevel", config.logLevel);
    return config;
}

CacheConfig CacheConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Некорректный JSON в " + path + ": " + e.what());
    }
    auto config = fromJson(j);
    if (!config.validate()) {
        throw std::runtime_error("Некорректная конфигурация кэша в " + path);
    }
    return config;
}

CacheConfig CacheConfig::fromEnvironment() {
    CacheConfig config;
    if (const char* url = std::getenv("REDIS_URL")) {
        config.durableUrl = url;
    }
    if (const char* ttl = std::getenv("CACHE_DEFAULT_TTL")) {
        try {
            auto seconds = std::stoll(ttl);
            if (seconds > 0) {
                config.defaultTtl = std::chrono::seconds(seconds);
            } else {
                spdlog::warn("CacheConfig: CACHE_DEFAULT_TTL={} не положителен, оставлен {}s", ttl, config.defaultTtl.count());
            }
        } catch (const std::exception& e) {
            spdlog::warn("CacheConfig: не удалось разобрать CACHE_DEFAULT_TTL='{}': {}", ttl, e.what());
        }
    }
    return config;
}

} // namespace cache
} // namespace core
} // namespace clinic
