#pragma once

#include <sstream>
#include <string>

namespace clinic {
namespace core {
namespace cache {
namespace util {

// SHA-256 в hex
std::string sha256Hex(const std::string& data);

// Детерминированный ключ вызова: prefix:name[:hash(args)]
template <typename... Args>
std::string callKey(const std::string& prefix, const std::string& name, const Args&... args) {
    std::string key = prefix.empty() ? name : prefix + ":" + name;
    if constexpr (sizeof...(Args) > 0) {
        std::ostringstream oss;
        ((oss << args << '\x1f'), ...);
        key += ":" + sha256Hex(oss.str()).substr(0, 16);
    }
    return key;
}

} // namespace util
} // namespace cache
} // namespace core
} // namespace clinic
