#pragma once

#include <memory>
#include "core/cache/codec/ValueCodec.hpp"

namespace clinic {
namespace core {
namespace cache {

// CompressedCodec: zlib-сжатие поверх другого кодека
// Формат: "ZLB1" + 4 байта исходной длины (big-endian) + deflate-поток.
// Полезная нагрузка без маркера передается внутреннему кодеку как есть.
class CompressedCodec : public ValueCodec {
public:
    explicit CompressedCodec(std::shared_ptr<const ValueCodec> inner, int level = 6);
    std::string encode(const CacheEntry& entry) const override;
    CacheEntry decode(const std::string& payload) const override;
    std::string name() const override;

    static std::string compress(const std::string& data, int level);
    static std::string decompress(const std::string& payload);
    static bool isCompressed(const std::string& payload);
private:
    std::shared_ptr<const ValueCodec> inner_;
    int level_;
};

} // namespace cache
} // namespace core
} // namespace clinic
