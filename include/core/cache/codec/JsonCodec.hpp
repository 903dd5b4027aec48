#pragma once

#include <any>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/cache/codec/ValueCodec.hpp"

namespace clinic {
namespace core {
namespace cache {

// JsonCodec: JSON-конверт записи (key, value, created_at, expires_at, tags, version)
// Значение после decode всегда nlohmann::json
class JsonCodec : public ValueCodec {
public:
    std::string encode(const CacheEntry& entry) const override;
    CacheEntry decode(const std::string& payload) const override;
    std::string name() const override { return "json"; }

    // JSON-представление значения; nullopt для несериализуемых типов
    static std::optional<nlohmann::json> toJsonValue(const std::any& value);
};

} // namespace cache
} // namespace core
} // namespace clinic
