#include "core/cache/metrics/CacheMonitor.hpp"
#include "core/cache/CacheLog.hpp"

namespace clinic {
namespace core {
namespace cache {

CacheMonitor::CacheMonitor(double lowHitRatioThreshold, uint64_t minRequests)
    : threshold_(lowHitRatioThreshold), minRequests_(minRequests) {}

bool CacheMonitor::check(const CacheStats& stats) const {
    bool healthy = true;
    if (stats.totalRequests >= minRequests_ && stats.hitRatio() < threshold_) {
        cacheLogger()->warn("CacheMonitor: низкий hit ratio {:.2f}% ({} из {} запросов)",
                            stats.hitRatio() * 100, stats.cacheHits, stats.totalRequests);
        healthy = false;
    }
    if (stats.durableBackend != "none" && !stats.durableAvailable) {
        cacheLogger()->warn("CacheMonitor: {} недоступен, работает in-process кэш", stats.durableBackend);
        healthy = false;
    }
    return healthy;
}

} // namespace cache
} // namespace core
} // namespace clinic
