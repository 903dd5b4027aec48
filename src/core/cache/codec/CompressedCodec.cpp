#include "core/cache/codec/CompressedCodec.hpp"
#include "core/cache/CacheErrors.hpp"
#include <zlib.h>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace clinic {
namespace core {
namespace cache {

namespace {
constexpr char MAGIC[] = "ZLB1";
constexpr size_t MAGIC_SIZE = 4;
constexpr size_t HEADER_SIZE = MAGIC_SIZE + 4;
// Защита от порчи заголовка: больше 64MB не распаковываем
constexpr uint32_t MAX_PLAIN_SIZE = 64u * 1024u * 1024u;
}

CompressedCodec::CompressedCodec(std::shared_ptr<const ValueCodec> inner, int level)
    : inner_(std::move(inner)), level_(level) {
    if (!inner_) {
        throw std::invalid_argument("CompressedCodec: inner codec is null");
    }
}

std::string CompressedCodec::encode(const CacheEntry& entry) const {
    return compress(inner_->encode(entry), level_);
}

CacheEntry CompressedCodec::decode(const std::string& payload) const {
    if (!isCompressed(payload)) {
        return inner_->decode(payload);
    }
    return inner_->decode(decompress(payload));
}

std::string CompressedCodec::name() const {
    return "zlib+" + inner_->name();
}

bool CompressedCodec::isCompressed(const std::string& payload) {
    return payload.size() >= HEADER_SIZE && payload.compare(0, MAGIC_SIZE, MAGIC) == 0;
}

std::string CompressedCodec::compress(const std::string& data, int level) {
    if (data.size() > MAX_PLAIN_SIZE) {
        throw SerializationError("CompressedCodec: payload too large: " + std::to_string(data.size()));
    }
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::string out(HEADER_SIZE + bound, '\0');
    out.replace(0, MAGIC_SIZE, MAGIC, MAGIC_SIZE);
    auto size = static_cast<uint32_t>(data.size());
    out[4] = static_cast<char>((size >> 24) & 0xFF);
    out[5] = static_cast<char>((size >> 16) & 0xFF);
    out[6] = static_cast<char>((size >> 8) & 0xFF);
    out[7] = static_cast<char>(size & 0xFF);

    int rc = compress2(reinterpret_cast<Bytef*>(&out[HEADER_SIZE]), &bound,
                       reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        throw SerializationError("CompressedCodec: compress2 failed, rc=" + std::to_string(rc));
    }
    out.resize(HEADER_SIZE + bound);
    return out;
}

std::string CompressedCodec::decompress(const std::string& payload) {
    if (!isCompressed(payload)) {
        throw SerializationError("CompressedCodec: missing ZLB1 header");
    }
    uint32_t size = (static_cast<uint32_t>(static_cast<uint8_t>(payload[4])) << 24) |
                    (static_cast<uint32_t>(static_cast<uint8_t>(payload[5])) << 16) |
                    (static_cast<uint32_t>(static_cast<uint8_t>(payload[6])) << 8) |
                    static_cast<uint32_t>(static_cast<uint8_t>(payload[7]));
    if (size > MAX_PLAIN_SIZE) {
        throw SerializationError("CompressedCodec: declared size too large: " + std::to_string(size));
    }
    std::string out(size, '\0');
    uLongf outLen = size;
    int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &outLen,
                        reinterpret_cast<const Bytef*>(payload.data() + HEADER_SIZE),
                        static_cast<uLong>(payload.size() - HEADER_SIZE));
    if (rc != Z_OK || outLen != size) {
        throw SerializationError("CompressedCodec: uncompress failed, rc=" + std::to_string(rc));
    }
    return out;
}

} // namespace cache
} // namespace core
} // namespace clinic
