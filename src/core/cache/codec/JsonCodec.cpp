#include "core/cache/codec/JsonCodec.hpp"
#include "core/cache/CacheErrors.hpp"
#include <cstdint>
#include <vector>

namespace clinic {
namespace core {
namespace cache {

namespace {

int64_t toMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromMillis(int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

std::optional<nlohmann::json> JsonCodec::toJsonValue(const std::any& value) {
    if (!value.has_value()) return nlohmann::json(nullptr);
    if (auto* v = std::any_cast<nlohmann::json>(&value)) return *v;
    if (auto* v = std::any_cast<std::string>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<const char*>(&value)) return nlohmann::json(std::string(*v));
    if (auto* v = std::any_cast<bool>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<int>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<int64_t>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<uint64_t>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<double>(&value)) return nlohmann::json(*v);
    if (auto* v = std::any_cast<std::vector<std::string>>(&value)) return nlohmann::json(*v);
    return std::nullopt;
}

std::string JsonCodec::encode(const CacheEntry& entry) const {
    auto value = toJsonValue(entry.value);
    if (!value) {
        throw SerializationError("значение ключа '" + entry.key + "' не сериализуемо в JSON (тип " +
                                 entry.value.type().name() + ")");
    }
    nlohmann::json j = {
        {"key", entry.key},
        {"value", *value},
        {"created_at", toMillis(entry.createdAt)},
        {"expires_at", entry.expiresAt ? nlohmann::json(toMillis(*entry.expiresAt)) : nlohmann::json(nullptr)},
        {"tags", entry.tags},
        {"version", entry.version}
    };
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        // Например, невалидный UTF-8 в строке
        throw SerializationError("ошибка сериализации ключа '" + entry.key + "': " + e.what());
    }
}

CacheEntry JsonCodec::decode(const std::string& payload) const {
    try {
        auto j = nlohmann::json::parse(payload);
        CacheEntry entry;
        entry.key = j.at("key").get<std::string>();
        entry.value = j.at("value");
        entry.createdAt = fromMillis(j.at("created_at").get<int64_t>());
        if (j.contains("expires_at") && !j["expires_at"].is_null()) {
            entry.expiresAt = fromMillis(j["expires_at"].get<int64_t>());
        }
        entry.tags = j.value("tags", TagSet{});
        entry.version = j.value("version", 1u);
        return entry;
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("некорректный JSON-конверт: ") + e.what());
    }
}

} // namespace cache
} // namespace core
} // namespace clinic
