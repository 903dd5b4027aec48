#include <iostream>
#include <memory>
#include <map>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/cache/CacheConfig.hpp"
#include "core/cache/accessors/CachedClinicQueries.hpp"
#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/metrics/CacheMonitor.hpp"
#include "core/cache/tags/CacheTags.hpp"
#include "core/cache/triggers/TriggerTypes.hpp"
#include "core/cache/util/CallKey.hpp"

using namespace clinic::core::cache;

namespace {

// Справочники в памяти вместо базы данных клиники
class DemoRepository : public ClinicRepository {
public:
    DemoRepository() {
        ScreeningTypeRecord mammogram;
        mammogram.id = 1;
        mammogram.name = "Mammogram";
        mammogram.defaultFrequency = "1 year";
        mammogram.frequencyNumber = 1;
        mammogram.frequencyUnit = "years";
        mammogram.minAge = 40;
        mammogram.genderSpecific = "Female";
        mammogram.keywords = "mammogram,breast imaging";

        ScreeningTypeRecord a1c;
        a1c.id = 3;
        a1c.name = "A1C";
        a1c.defaultFrequency = "6 months";
        a1c.frequencyNumber = 6;
        a1c.frequencyUnit = "months";
        a1c.triggerConditions = "diabetes";

        ScreeningTypeRecord legacy;
        legacy.id = 7;
        legacy.name = "Legacy Panel";
        legacy.isActive = false;

        types_ = {a1c, legacy, mammogram};

        PatientDemographics patient;
        patient.id = 7;
        patient.age = 52;
        patient.sex = "Female";
        patient.dateOfBirth = "1973-04-12";
        patient.conditions = {"diabetes"};
        patients_[patient.id] = patient;
    }

    std::vector<ScreeningTypeRecord> screeningTypes(bool activeOnly) override {
        std::vector<ScreeningTypeRecord> result;
        for (const auto& type : types_) {
            if (!activeOnly || type.isActive) {
                result.push_back(type);
            }
        }
        return result;
    }

    std::optional<PatientDemographics> findPatientDemographics(int64_t patientId) override {
        auto it = patients_.find(patientId);
        if (it == patients_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> distinctDocumentTypes() override {
        return {"LAB_REPORT", "IMAGING", "CONSULTATION"};
    }

private:
    std::vector<ScreeningTypeRecord> types_;
    std::map<int64_t, PatientDemographics> patients_;
};

// Initialize logging system
void initializeLogging() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto logger = std::make_shared<spdlog::logger>("clinic_cache", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::debug);

    spdlog::info("=== Clinic Cache Demo Starting ===");
}

CacheConfig loadConfig(int argc, char* argv[]) {
    if (argc > 1) {
        spdlog::info("Loading cache configuration from {}", argv[1]);
        return CacheConfig::fromFile(argv[1]);
    }
    return CacheConfig::fromEnvironment();
}

void runScenarios(CacheManager& cache, CachedClinicQueries& queries) {
    // Демография пациента и инвалидация по событию
    auto demo = queries.patientDemographics(7);
    spdlog::info("Patient 7 demographics: {}", demo ? demo->toJson().dump() : "not found");
    cache.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, {{"patient_id", 7}});
    spdlog::info("Patient 7 cached after change: {}",
                 cache.get(CachedClinicQueries::patientDemographicsKey(7)).has_value());

    // Отсутствующий пациент не кэшируется
    spdlog::info("Patient 404 demographics found: {}", queries.patientDemographics(404).has_value());

    // Пакетная операция: инвалидации применяются один раз в конце
    queries.screeningTypes(true);
    cache.triggerInvalidation(triggers::BATCH_OPERATION_START);
    for (int i = 0; i < 3; ++i) {
        cache.triggerInvalidation(triggers::SCREENING_TYPE_STATUS_CHANGE, {{"screening_type_id", 3}});
    }
    cache.triggerInvalidation(triggers::BATCH_OPERATION_END);

    // Мемоизация вычисления
    auto key = util::callKey("demo", "eligible_screenings", 7, "Female");
    auto count = cache.cached<int64_t>(key, std::chrono::seconds(300), {tags::patient("7")}, [&queries] {
        return static_cast<int64_t>(queries.screeningTypes(true).size());
    });
    spdlog::info("Eligible screenings for patient 7: {} (key={})", count, key);

    cache.triggerInvalidation("unknown_trigger", {{"patient_id", 7}});
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        initializeLogging();

        auto config = loadConfig(argc, argv);
        CacheManager cache(config);
        DemoRepository repository;
        CachedClinicQueries queries(cache, repository);

        cache.initialize([&queries](CacheManager&) {
            auto report = queries.warmUp();
            spdlog::info("Warm-up report: {}", report.toJson().dump());
        });

        runScenarios(cache, queries);

        auto stats = cache.getStats();
        std::cout << stats.toJson().dump(2) << std::endl;

        if (config.enableMetrics) {
            CacheMonitor monitor(config.lowHitRatioThreshold, config.minRequestsForHealth);
            if (!monitor.check(stats)) {
                spdlog::warn("Cache health check reported issues");
            }
        }

        cache.shutdown();
        spdlog::info("=== Clinic Cache Demo Complete ===");
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
