#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "core/cache/CacheEntry.hpp"

namespace clinic {
namespace core {
namespace cache {

/**
 * @brief Базовый интерфейс хранилища записей кэша.
 *
 * Реализации не бросают исключений наружу: любая ошибка хранилища
 * превращается в промах (nullopt) или false.
 */
class BackendStore {
public:
    virtual ~BackendStore() = default;
    /// Получить запись по ключу. Истечение TTL проверяет вызывающий.
    virtual std::optional<CacheEntry> get(const std::string& key) = 0;
    /// Сохранить запись; ttl передается хранилищам с собственным истечением.
    virtual bool set(const CacheEntry& entry, std::chrono::seconds ttl) = 0;
    /// Удалить запись по ключу.
    virtual bool remove(const std::string& key) = 0;
    /// Очистить хранилище полностью.
    virtual bool clear() = 0;
    /// Доступно ли хранилище в данный момент.
    virtual bool isAvailable() const = 0;
    /// Количество записей (0, если неизвестно).
    virtual size_t size() const = 0;
    virtual std::string name() const = 0;
    /// Активная проверка связи; по умолчанию совпадает с isAvailable().
    virtual bool ping() { return isAvailable(); }
};

} // namespace cache
} // namespace core
} // namespace clinic
