#pragma once

#include <set>
#include <string>
#include <vector>

namespace clinic {
namespace core {
namespace cache {

// BatchCoordinator: откладывает инвалидацию тегов на время пакетной операции.
// Состояния idle/batched; вложенный begin идемпотентен (флаг, не счетчик).
// Без собственной синхронизации: вызывается под замком CacheManager.
class BatchCoordinator {
public:
    // true, если пакет начат этим вызовом
    bool begin();
    // Если пакет активен, запоминает тег и возвращает true
    bool defer(const std::string& tag);
    // Завершает пакет и отдает накопленные теги (каждый ровно один раз); в idle: пусто
    std::vector<std::string> finish();
    bool isActive() const { return active_; }
    size_t pendingCount() const { return deferred_.size(); }
private:
    bool active_ = false;
    std::set<std::string> deferred_;
};

} // namespace cache
} // namespace core
} // namespace clinic
