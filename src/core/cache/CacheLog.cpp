#include "core/cache/CacheLog.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>

namespace clinic {
namespace core {
namespace cache {

std::shared_ptr<spdlog::logger> cacheLogger() {
    if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
        return logger;
    }
    return spdlog::default_logger();
}

void initializeCacheLogging(const CacheConfig& config) {
    if (spdlog::get(CACHE_LOGGER_NAME) || config.logPath.empty()) {
        return;
    }
    try {
        // Создаем директорию для логов, если её нет
        auto parent = std::filesystem::path(config.logPath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logPath, config.maxLogSize, config.maxLogFiles);
        rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        auto logger = std::make_shared<spdlog::logger>(CACHE_LOGGER_NAME, rotating_sink);
        logger->set_level(spdlog::level::from_str(config.logLevel));
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Ошибка инициализации логгера кэша: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Ошибка создания директории логов: " << e.what() << std::endl;
    }
}

} // namespace cache
} // namespace core
} // namespace clinic
