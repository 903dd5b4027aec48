#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/accessors/ClinicRepository.hpp"
#include "core/cache/manager/CacheManager.hpp"

namespace clinic {
namespace core {
namespace cache {

// Результат прогрева одного справочника
struct WarmupResult {
    std::string name;
    bool success = false;
    long long elapsedMs = 0;
    std::string error;
};

// WarmupReport: отчет о прогреве кэша при старте
struct WarmupReport {
    std::vector<WarmupResult> results;
    long long totalMs = 0;

    bool warmed() const; // Хотя бы один справочник загружен
    size_t succeeded() const;
    nlohmann::json toJson() const;
};

/**
 * @brief Кэшированные запросы к справочникам клиники.
 *
 * Чтение через кэш: при промахе данные загружаются из ClinicRepository
 * и сохраняются в виде JSON с тегами для последующей инвалидации.
 * Отсутствующий пациент не кэшируется.
 */
class CachedClinicQueries {
public:
    static constexpr std::chrono::seconds SCREENING_TYPES_TTL{1800};
    static constexpr std::chrono::seconds PATIENT_DEMOGRAPHICS_TTL{3600};
    static constexpr std::chrono::seconds DOCUMENT_TYPES_TTL{7200};

    CachedClinicQueries(CacheManager& cache, ClinicRepository& repository);

    // Ошибки репозитория пробрасываются вызывающему
    std::vector<ScreeningTypeRecord> screeningTypes(bool activeOnly = true);
    std::optional<PatientDemographics> patientDemographics(int64_t patientId);
    std::vector<std::string> documentTypes();

    // Прогрев: активные и все типы скринингов, типы документов. Не бросает.
    WarmupReport warmUp();

    static std::string screeningTypesKey(bool activeOnly);
    static std::string patientDemographicsKey(int64_t patientId);
private:
    CacheManager& cache_;
    ClinicRepository& repository_;
};

} // namespace cache
} // namespace core
} // namespace clinic
