#pragma once

#include <cstdint>
#include "core/cache/metrics/CacheMetrics.hpp"

namespace clinic {
namespace core {
namespace cache {

// CacheMonitor: проверка здоровья кэша по снимку статистики
class CacheMonitor {
public:
    CacheMonitor(double lowHitRatioThreshold, uint64_t minRequests);
    // false и предупреждение в лог, если hit ratio ниже порога или Redis пропал
    bool check(const CacheStats& stats) const;
private:
    double threshold_;
    uint64_t minRequests_;
};

} // namespace cache
} // namespace core
} // namespace clinic
