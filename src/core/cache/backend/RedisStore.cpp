#include "core/cache/backend/RedisStore.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLog.hpp"

namespace clinic {
namespace core {
namespace cache {

RedisStore::RedisStore(RedisEndpoint endpoint, std::shared_ptr<const ValueCodec> codec,
                       std::chrono::milliseconds connectTimeout, std::chrono::milliseconds ioTimeout,
                       std::chrono::seconds reconnectInterval)
    : client_(std::make_unique<RespClient>(std::move(endpoint), connectTimeout, ioTimeout)),
      codec_(std::move(codec)),
      reconnectInterval_(reconnectInterval) {}

RedisStore::~RedisStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    client_->close();
}

bool RedisStore::ensureConnected() {
    if (client_->isConnected()) {
        return true;
    }
    auto now = std::chrono::steady_clock::now();
    if (attempted_ && now - lastAttempt_ < reconnectInterval_) {
        return false;
    }
    bool firstAttempt = !attempted_;
    attempted_ = true;
    lastAttempt_ = now;
    try {
        client_->connect();
        available_.store(true, std::memory_order_release);
        cacheLogger()->info("RedisStore: соединение с {}:{} установлено",
                            client_->endpoint().host, client_->endpoint().port);
        return true;
    } catch (const BackendUnavailable& e) {
        if (firstAttempt) {
            cacheLogger()->warn("RedisStore: Redis недоступен, используется in-process кэш: {}", e.what());
        }
        markUnavailable("connect", e.what());
        return false;
    }
}

void RedisStore::markUnavailable(const std::string& operation, const std::string& reason) {
    bool wasAvailable = available_.exchange(false, std::memory_order_acq_rel);
    lastAttempt_ = std::chrono::steady_clock::now();
    attempted_ = true;
    // Первое падение в warning, повторные в debug
    if (wasAvailable) {
        cacheLogger()->warn("RedisStore: {} не выполнен, переход на in-process кэш: {}", operation, reason);
    } else {
        cacheLogger()->debug("RedisStore: {} не выполнен: {}", operation, reason);
    }
}

bool RedisStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) return false;
    try {
        auto reply = client_->command({"PING"});
        return !reply.isError();
    } catch (const BackendUnavailable& e) {
        markUnavailable("PING", e.what());
        return false;
    }
}

std::optional<CacheEntry> RedisStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) return std::nullopt;
    RespReply reply;
    try {
        reply = client_->command({"GET", key});
    } catch (const BackendUnavailable& e) {
        markUnavailable("GET " + key, e.what());
        return std::nullopt;
    }
    if (reply.isError()) {
        cacheLogger()->error("RedisStore: GET {} вернул ошибку: {}", key, reply.text);
        return std::nullopt;
    }
    if (reply.isNull()) {
        return std::nullopt;
    }
    try {
        return codec_->decode(reply.text);
    } catch (const SerializationError& e) {
        // Битая запись хуже промаха: удаляем
        cacheLogger()->error("RedisStore: не удалось декодировать {}: {}", key, e.what());
        try {
            client_->command({"DEL", key});
        } catch (const BackendUnavailable& del) {
            markUnavailable("DEL " + key, del.what());
        }
        return std::nullopt;
    }
}

bool RedisStore::set(const CacheEntry& entry, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) return false;
    std::string payload;
    try {
        payload = codec_->encode(entry);
    } catch (const SerializationError& e) {
        cacheLogger()->warn("RedisStore: запись {} пропущена, значение остается только in-process: {}",
                            entry.key, e.what());
        // Старая копия во внешнем хранилище не должна пережить новую запись
        try {
            client_->command({"DEL", entry.key});
        } catch (const BackendUnavailable& del) {
            markUnavailable("DEL " + entry.key, del.what());
        }
        return false;
    }
    try {
        RespReply reply = ttl.count() > 0
            ? client_->command({"SETEX", entry.key, std::to_string(ttl.count()), payload})
            : client_->command({"SET", entry.key, payload});
        if (reply.isError()) {
            cacheLogger()->error("RedisStore: SET {} вернул ошибку: {}", entry.key, reply.text);
            return false;
        }
        return true;
    } catch (const BackendUnavailable& e) {
        markUnavailable("SET " + entry.key, e.what());
        return false;
    }
}

bool RedisStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) return false;
    try {
        auto reply = client_->command({"DEL", key});
        return !reply.isError() && reply.integer > 0;
    } catch (const BackendUnavailable& e) {
        markUnavailable("DEL " + key, e.what());
        return false;
    }
}

bool RedisStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) return false;
    try {
        auto reply = client_->command({"FLUSHDB"});
        if (reply.isError()) {
            cacheLogger()->error("RedisStore: FLUSHDB вернул ошибку: {}", reply.text);
            return false;
        }
        return true;
    } catch (const BackendUnavailable& e) {
        markUnavailable("FLUSHDB", e.what());
        return false;
    }
}

size_t RedisStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_->isConnected()) return 0;
    try {
        auto reply = client_->command({"DBSIZE"});
        return reply.type == RespReply::Type::Integer ? static_cast<size_t>(reply.integer) : 0;
    } catch (const BackendUnavailable& e) {
        available_.store(false, std::memory_order_release);
        cacheLogger()->debug("RedisStore: DBSIZE не выполнен: {}", e.what());
        return 0;
    }
}

} // namespace cache
} // namespace core
} // namespace clinic
