#pragma once

#include <stdexcept>
#include <string>

namespace clinic {
namespace core {
namespace cache {

// BackendUnavailable: внешнее хранилище недоступно (таймаут, обрыв, ошибка протокола)
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// SerializationError: значение не удалось закодировать/декодировать для внешнего хранилища
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace cache
} // namespace core
} // namespace clinic
