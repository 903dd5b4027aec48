#pragma once

#include "core/cache/triggers/TriggerDispatcher.hpp"

namespace clinic {
namespace core {
namespace cache {

class CacheManager;

// Подписать стандартные обработчики доменных событий (screening types,
// document types, демография пациента, медицинские данные, пакетные операции)
void registerDefaultInvalidationHandlers(TriggerDispatcher& dispatcher, CacheManager& manager);

} // namespace cache
} // namespace core
} // namespace clinic
