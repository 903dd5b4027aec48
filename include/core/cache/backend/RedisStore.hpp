#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include "core/cache/backend/BackendStore.hpp"
#include "core/cache/backend/RespClient.hpp"
#include "core/cache/codec/ValueCodec.hpp"

namespace clinic {
namespace core {
namespace cache {

/**
 * @brief Внешнее хранилище Redis.
 *
 * Любая ошибка сети или протокола закрывает соединение, помечает хранилище
 * недоступным и превращается в промах/false. Повторное подключение
 * выполняется лениво, не чаще одного раза за reconnectInterval.
 */
class RedisStore : public BackendStore {
public:
    RedisStore(RedisEndpoint endpoint, std::shared_ptr<const ValueCodec> codec,
               std::chrono::milliseconds connectTimeout, std::chrono::milliseconds ioTimeout,
               std::chrono::seconds reconnectInterval);
    ~RedisStore() override;

    std::optional<CacheEntry> get(const std::string& key) override;
    bool set(const CacheEntry& entry, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool clear() override; // FLUSHDB
    bool isAvailable() const override { return available_.load(std::memory_order_acquire); }
    size_t size() const override; // DBSIZE
    std::string name() const override { return "redis"; }

    bool ping() override; // Проверка связи (с подключением при необходимости)
private:
    // Вызывается под mutex_; false, если соединения нет и переподключаться рано
    bool ensureConnected();
    void markUnavailable(const std::string& operation, const std::string& reason);

    std::unique_ptr<RespClient> client_;
    std::shared_ptr<const ValueCodec> codec_;
    std::chrono::seconds reconnectInterval_;
    std::chrono::steady_clock::time_point lastAttempt_{};
    bool attempted_ = false;
    mutable std::atomic<bool> available_{false}; // size() const тоже снимает флаг
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace clinic
