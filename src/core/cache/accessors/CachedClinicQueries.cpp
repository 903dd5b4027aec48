#include "core/cache/accessors/CachedClinicQueries.hpp"
#include "core/cache/CacheLog.hpp"
#include "core/cache/tags/CacheTags.hpp"
#include <algorithm>
#include <functional>

namespace clinic {
namespace core {
namespace cache {

namespace {

const char* const DOCUMENT_TYPES_KEY = "document_types";

long long elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool WarmupReport::warmed() const {
    return succeeded() > 0;
}

size_t WarmupReport::succeeded() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const WarmupResult& r) { return r.success; }));
}

nlohmann::json WarmupReport::toJson() const {
    nlohmann::json warmResults = nlohmann::json::object();
    nlohmann::json errors = nlohmann::json::array();
    for (const auto& result : results) {
        warmResults[result.name] = {{"success", result.success}, {"elapsed_ms", result.elapsedMs}};
        if (!result.error.empty()) {
            errors.push_back(result.name + ": " + result.error);
        }
    }
    return {
        {"cache_warmed", warmed()},
        {"warm_results", warmResults},
        {"initialization_time_ms", totalMs},
        {"errors", errors}
    };
}

CachedClinicQueries::CachedClinicQueries(CacheManager& cache, ClinicRepository& repository)
    : cache_(cache), repository_(repository) {}

std::string CachedClinicQueries::screeningTypesKey(bool activeOnly) {
    return std::string("screening_types:active=") + (activeOnly ? "true" : "false");
}

std::string CachedClinicQueries::patientDemographicsKey(int64_t patientId) {
    return "patient_demographics:" + std::to_string(patientId);
}

std::vector<ScreeningTypeRecord> CachedClinicQueries::screeningTypes(bool activeOnly) {
    const auto key = screeningTypesKey(activeOnly);
    if (auto cached = cache_.getAs<nlohmann::json>(key)) {
        try {
            std::vector<ScreeningTypeRecord> records;
            for (const auto& item : cached->at("items")) {
                records.push_back(ScreeningTypeRecord::fromJson(item));
            }
            return records;
        } catch (const nlohmann::json::exception& e) {
            cacheLogger()->warn("Поврежденная запись {} в кэше, перезагрузка: {}", key, e.what());
        }
    }

    auto records = repository_.screeningTypes(activeOnly);
    nlohmann::json items = nlohmann::json::array();
    TagSet tagSet{tags::SCREENING_TYPES, activeOnly ? tags::ACTIVE_SCREENING_TYPES : tags::ALL_SCREENING_TYPES};
    for (const auto& record : records) {
        items.push_back(record.toJson());
        tagSet.insert(tags::screeningType(std::to_string(record.id)));
    }
    cache_.set(key, nlohmann::json{{"items", items}}, SCREENING_TYPES_TTL, tagSet);
    cacheLogger()->info("Закэшировано типов скрининга: {} (active_only={})", records.size(), activeOnly);
    return records;
}

std::optional<PatientDemographics> CachedClinicQueries::patientDemographics(int64_t patientId) {
    const auto key = patientDemographicsKey(patientId);
    if (auto cached = cache_.getAs<nlohmann::json>(key)) {
        try {
            return PatientDemographics::fromJson(*cached);
        } catch (const nlohmann::json::exception& e) {
            cacheLogger()->warn("Поврежденная запись {} в кэше, перезагрузка: {}", key, e.what());
        }
    }

    auto demo = repository_.findPatientDemographics(patientId);
    if (!demo) {
        cacheLogger()->debug("Пациент {} не найден, результат не кэшируется", patientId);
        return std::nullopt;
    }
    cache_.set(key, demo->toJson(), PATIENT_DEMOGRAPHICS_TTL,
               {tags::PATIENT_DEMOGRAPHICS, tags::patient(std::to_string(patientId))});
    return demo;
}

std::vector<std::string> CachedClinicQueries::documentTypes() {
    if (auto cached = cache_.getAs<nlohmann::json>(DOCUMENT_TYPES_KEY)) {
        try {
            return cached->get<std::vector<std::string>>();
        } catch (const nlohmann::json::exception& e) {
            cacheLogger()->warn("Поврежденная запись {} в кэше, перезагрузка: {}", DOCUMENT_TYPES_KEY, e.what());
        }
    }

    auto types = repository_.distinctDocumentTypes();
    types.erase(std::remove(types.begin(), types.end(), std::string()), types.end());
    cache_.set(DOCUMENT_TYPES_KEY, nlohmann::json(types), DOCUMENT_TYPES_TTL, {tags::DOCUMENT_TYPES});
    cacheLogger()->info("Закэшировано типов документов: {}", types.size());
    return types;
}

WarmupReport CachedClinicQueries::warmUp() {
    auto start = std::chrono::steady_clock::now();
    WarmupReport report;

    auto warm = [&report](const std::string& name, const std::function<void()>& load) {
        WarmupResult result;
        result.name = name;
        auto stepStart = std::chrono::steady_clock::now();
        try {
            load();
            result.success = true;
        } catch (const std::exception& e) {
            result.error = e.what();
            cacheLogger()->error("Ошибка прогрева кэша ({}): {}", name, e.what());
        }
        result.elapsedMs = elapsedMs(stepStart);
        report.results.push_back(std::move(result));
    };

    warm("active_screening_types", [this] { screeningTypes(true); });
    warm("all_screening_types", [this] { screeningTypes(false); });
    warm("document_types", [this] { documentTypes(); });

    report.totalMs = elapsedMs(start);
    if (report.warmed()) {
        cacheLogger()->info("Кэш прогрет: готово {} кэшей за {} ms", report.succeeded(), report.totalMs);
    } else {
        cacheLogger()->warn("Прогрев кэша выполнен частично");
    }
    return report;
}

} // namespace cache
} // namespace core
} // namespace clinic
