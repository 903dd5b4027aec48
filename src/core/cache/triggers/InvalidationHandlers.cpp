#include "core/cache/triggers/InvalidationHandlers.hpp"
#include "core/cache/CacheLog.hpp"
#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/tags/CacheTags.hpp"
#include "core/cache/triggers/TriggerTypes.hpp"

namespace clinic {
namespace core {
namespace cache {

namespace {

void invalidateScreeningTypes(CacheManager& manager, const TriggerContext& context) {
    manager.invalidateByTag(tags::SCREENING_TYPES);
    manager.invalidateByTag(tags::ACTIVE_SCREENING_TYPES);
    manager.invalidateByTag(tags::ALL_SCREENING_TYPES);
    if (auto id = contextId(context, "screening_type_id")) {
        manager.invalidateByTag(tags::screeningType(*id));
    }
}

} // namespace

void registerDefaultInvalidationHandlers(TriggerDispatcher& dispatcher, CacheManager& manager) {
    CacheManager* cache = &manager;

    dispatcher.subscribe(triggers::SCREENING_TYPE_KEYWORD_CHANGE, "screening_types",
                         [cache](const TriggerContext& context) { invalidateScreeningTypes(*cache, context); });
    dispatcher.subscribe(triggers::SCREENING_TYPE_STATUS_CHANGE, "screening_types",
                         [cache](const TriggerContext& context) { invalidateScreeningTypes(*cache, context); });

    dispatcher.subscribe(triggers::DOCUMENT_TYPE_CHANGE, "document_types",
                         [cache](const TriggerContext& context) {
        cache->invalidateByTag(tags::DOCUMENT_TYPES);
        if (auto patientId = contextId(context, "patient_id")) {
            cache->invalidateByTag(tags::patient(*patientId));
        }
    });

    // Без patient_id событие игнорируется
    dispatcher.subscribe(triggers::PATIENT_DEMOGRAPHIC_CHANGE, "patient_demographics",
                         [cache](const TriggerContext& context) {
        auto patientId = contextId(context, "patient_id");
        if (!patientId) {
            cacheLogger()->debug("patient_demographic_change без patient_id: {}", context.dump());
            return;
        }
        cache->invalidateByTag(tags::patient(*patientId));
        cache->invalidateByTag(tags::PATIENT_DEMOGRAPHICS);
    });

    dispatcher.subscribe(triggers::MEDICAL_DATA_SUBSECTION_UPDATE, "medical_data",
                         [cache](const TriggerContext& context) {
        if (auto patientId = contextId(context, "patient_id")) {
            cache->invalidateByTag(tags::patient(*patientId));
        }
        if (auto dataType = contextId(context, "data_type")) {
            cache->invalidateByTag(tags::medicalData(*dataType));
        }
    });

    dispatcher.subscribe(triggers::BATCH_OPERATION_START, "batch",
                         [cache](const TriggerContext&) { cache->beginBatch(); });
    dispatcher.subscribe(triggers::BATCH_OPERATION_END, "batch",
                         [cache](const TriggerContext&) { cache->endBatch(); });
}

} // namespace cache
} // namespace core
} // namespace clinic
