#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include "core/cache/CacheConfig.hpp"

namespace clinic {
namespace core {
namespace cache {

constexpr const char* CACHE_LOGGER_NAME = "cachemanager";

// Логгер кэша: зарегистрированный "cachemanager" либо логгер по умолчанию
std::shared_ptr<spdlog::logger> cacheLogger();

// Создать "cachemanager" с rotating sink, если он ещё не зарегистрирован
void initializeCacheLogging(const CacheConfig& config);

} // namespace cache
} // namespace core
} // namespace clinic
