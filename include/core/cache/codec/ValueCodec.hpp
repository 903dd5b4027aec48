#pragma once

#include <string>
#include "core/cache/CacheEntry.hpp"

namespace clinic {
namespace core {
namespace cache {

/**
 * @brief Кодек записей для байтового внешнего хранилища.
 *
 * encode/decode бросают SerializationError, если запись не представима
 * в байтах. Такие записи остаются доступны только через in-process путь.
 */
class ValueCodec {
public:
    virtual ~ValueCodec() = default;
    virtual std::string encode(const CacheEntry& entry) const = 0;
    virtual CacheEntry decode(const std::string& payload) const = 0;
    virtual std::string name() const = 0;
};

} // namespace cache
} // namespace core
} // namespace clinic
