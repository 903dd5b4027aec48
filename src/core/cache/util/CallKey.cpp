#include "core/cache/util/CallKey.hpp"
#include <openssl/sha.h>
#include <iomanip>

namespace clinic {
namespace core {
namespace cache {
namespace util {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace util
} // namespace cache
} // namespace core
} // namespace clinic
