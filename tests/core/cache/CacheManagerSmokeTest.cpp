#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <string>
#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/CacheConfig.hpp"
#include "core/cache/metrics/CacheMonitor.hpp"
#include "core/cache/tags/CacheTags.hpp"
#include "core/cache/triggers/TriggerTypes.hpp"
#include "core/cache/util/CallKey.hpp"
#include "FakeDurableStore.hpp"

#include <spdlog/spdlog.h>

using namespace clinic::core::cache;

namespace {

struct Opaque {
    int handle = 0;
};

// Управляемые часы
struct ManualClock {
    std::shared_ptr<Clock::time_point> now = std::make_shared<Clock::time_point>(Clock::now());
    TimeSource source() const {
        auto current = now;
        return [current] { return *current; };
    }
    void advance(std::chrono::seconds delta) { *now += delta; }
};

CacheConfig makeConfig() {
    CacheConfig config;
    config.defaultTtl = std::chrono::seconds(3600);
    config.logPath = "logs/cachemanager_test.log";
    config.logLevel = "debug";
    return config;
}

} // namespace

void smokeTestCacheManager() {
    std::cout << "Testing CacheManager basic operations...\n";

    CacheManager manager(makeConfig());
    assert(manager.initialize());
    assert(manager.initialize()); // повторно: только предупреждение
    auto stats = manager.getStats();
    assert(stats.cacheSize == 0);
    assert(stats.durableBackend == "none");
    assert(!stats.durableAvailable);

    manager.shutdown();
    std::cout << "[OK] CacheManager smoke test\n";
}

void testCacheManagerTtl() {
    std::cout << "Testing CacheManager TTL expiry...\n";

    ManualClock clock;
    CacheManager manager(makeConfig(), clock.source());

    assert(manager.set("k", std::string("v"), std::chrono::seconds(10)));
    assert(manager.getAs<std::string>("k") == std::optional<std::string>("v"));

    clock.advance(std::chrono::seconds(9));
    assert(manager.get("k"));

    clock.advance(std::chrono::seconds(1));
    assert(!manager.get("k"));

    auto stats = manager.getStats();
    assert(stats.evictions == 1);
    assert(stats.cacheMisses == 1);
    assert(stats.cacheSize == 0);

    std::cout << "[OK] CacheManager TTL test\n";
}

void testCacheManagerDefaultTtl() {
    std::cout << "Testing CacheManager default TTL...\n";

    ManualClock clock;
    CacheManager manager(makeConfig(), clock.source());

    manager.set("k", 1);
    clock.advance(std::chrono::seconds(3599));
    assert(manager.getAs<int>("k") == std::optional<int>(1));
    clock.advance(std::chrono::seconds(1));
    assert(!manager.get("k"));

    assert(std::any_cast<int>(manager.get("missing", std::any(5))) == 5);

    std::cout << "[OK] CacheManager default TTL test\n";
}

void testCacheManagerTagInvalidation() {
    std::cout << "Testing CacheManager tag invalidation...\n";

    CacheManager manager(makeConfig());
    manager.set("k1", 1, std::chrono::seconds(60), {"T"});
    manager.set("k2", 2, std::chrono::seconds(60), {"T"});
    manager.set("k3", 3, std::chrono::seconds(60), {"U"});

    assert(manager.invalidateByTag("T") == 2);
    assert(!manager.get("k1"));
    assert(!manager.get("k2"));
    assert(manager.get("k3"));
    assert(manager.invalidateByTag("T") == 0);
    assert(manager.invalidateByTag("unknown") == 0);

    // Ключи, добавленные после первой инвалидации, удаляются следующей
    manager.set("k4", 4, std::chrono::seconds(60), {"T"});
    assert(manager.invalidateByTag("T") == 1);

    auto stats = manager.getStats();
    assert(stats.invalidations == 3);
    assert(stats.evictions == 3);
    assert(stats.tagCount == 1);

    std::cout << "[OK] CacheManager tag invalidation test\n";
}

void testCacheManagerOverwriteReplacesTags() {
    std::cout << "Testing CacheManager overwrite replaces tags...\n";

    CacheManager manager(makeConfig());
    manager.set("k", 1, std::chrono::seconds(60), {"A"});
    manager.set("k", 2, std::chrono::seconds(60), {"B"});

    assert(manager.invalidateByTag("A") == 0);
    assert(manager.getAs<int>("k") == std::optional<int>(2));
    assert(manager.invalidateByTag("B") == 1);

    std::cout << "[OK] CacheManager overwrite test\n";
}

void testCacheManagerRemove() {
    std::cout << "Testing CacheManager remove...\n";

    CacheManager manager(makeConfig());
    manager.set("k", 1, std::chrono::seconds(60), {"T"});
    assert(manager.remove("k"));
    assert(!manager.get("k"));
    assert(manager.getStats().tagCount == 0);
    assert(manager.remove("k"));
    assert(manager.getStats().evictions == 2);

    std::cout << "[OK] CacheManager remove test\n";
}

void testCacheManagerBatchCoalescing() {
    std::cout << "Testing CacheManager batch coalescing...\n";

    CacheManager manager(makeConfig());
    manager.set("k1", 1, std::chrono::seconds(60), {"T"});
    manager.set("k2", 2, std::chrono::seconds(60), {"T"});
    auto evictionsBefore = manager.getStats().evictions;

    manager.beginBatch();
    assert(manager.batchActive());
    for (int i = 0; i < 3; ++i) {
        assert(manager.invalidateByTag("T") == 0);
    }
    assert(manager.get("k1"));
    assert(manager.getStats().batchActive);

    assert(manager.endBatch() == 2);
    assert(!manager.batchActive());
    assert(!manager.get("k1"));
    assert(!manager.get("k2"));

    auto stats = manager.getStats();
    assert(stats.evictions - evictionsBefore == 2);
    assert(stats.invalidations == 2);
    assert(stats.deferredTagsFlushed == 1);
    assert(manager.endBatch() == 0);

    std::cout << "[OK] CacheManager batch coalescing test\n";
}

void testCacheManagerStats() {
    std::cout << "Testing CacheManager stats...\n";

    CacheManager manager(makeConfig());
    manager.set("a", 1);
    for (int i = 0; i < 3; ++i) {
        assert(manager.get("a"));
    }
    for (int i = 0; i < 2; ++i) {
        assert(!manager.get("b"));
    }

    auto stats = manager.getStats();
    assert(stats.totalRequests == 5);
    assert(stats.cacheHits == 3);
    assert(stats.cacheMisses == 2);
    assert(stats.hitRatio() > 0.59 && stats.hitRatio() < 0.61);
    assert(stats.cacheSize == 1);

    auto json = stats.toJson();
    assert(json["total_requests"] == 5);
    assert(json["cache_hits"] == 3);
    assert(json["durable_backend"] == "none");
    assert(json["batch_operation_active"] == false);
    assert(CacheStats{}.hitRatio() == 0.0);

    std::cout << "[OK] CacheManager stats test\n";
}

void testScenarioPatientDemographicChange() {
    std::cout << "Testing patient demographic change trigger...\n";

    CacheManager manager(makeConfig());
    nlohmann::json demo = {{"id", 7}, {"age", 52}, {"sex", "Female"}};
    manager.set("patient_demographics:7", demo, std::chrono::seconds(3600), {"patient_7"});
    assert(manager.getAs<nlohmann::json>("patient_demographics:7") == std::optional<nlohmann::json>(demo));

    manager.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, {{"patient_id", 7}});
    assert(!manager.get("patient_demographics:7"));

    // Без patient_id событие ничего не инвалидирует
    manager.set("patient_demographics:8", demo, std::chrono::seconds(3600), {tags::PATIENT_DEMOGRAPHICS});
    manager.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, TriggerContext::object());
    manager.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, {{"patient_id", 0}});
    assert(manager.get("patient_demographics:8"));

    // С patient_id инвалидируется и общий тег демографии
    manager.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, {{"patient_id", "99"}});
    assert(!manager.get("patient_demographics:8"));

    auto stats = manager.getStats();
    assert(stats.triggersDispatched == 4);
    assert(stats.handlerFailures == 0);

    std::cout << "[OK] patient demographic change trigger test\n";
}

void testScenarioBatchedStatusChange() {
    std::cout << "Testing batched screening type status change...\n";

    CacheManager manager(makeConfig());
    manager.set("screening_types:active=true", 1, std::chrono::seconds(1800),
                {tags::SCREENING_TYPES, tags::ACTIVE_SCREENING_TYPES, tags::screeningType("3")});
    manager.set("screening_types:active=false", 2, std::chrono::seconds(1800),
                {tags::SCREENING_TYPES, tags::ALL_SCREENING_TYPES});
    manager.set("screening_type_detail:4", 3, std::chrono::seconds(1800), {tags::screeningType("4")});
    auto evictionsBefore = manager.getStats().evictions;

    manager.triggerInvalidation(triggers::BATCH_OPERATION_START);
    for (int i = 0; i < 3; ++i) {
        manager.triggerInvalidation(triggers::SCREENING_TYPE_STATUS_CHANGE, {{"screening_type_id", 3}});
    }
    assert(manager.get("screening_types:active=true"));
    manager.triggerInvalidation(triggers::BATCH_OPERATION_END);

    assert(!manager.get("screening_types:active=true"));
    assert(!manager.get("screening_types:active=false"));
    assert(manager.get("screening_type_detail:4"));

    auto stats = manager.getStats();
    assert(stats.deferredTagsFlushed == 4);
    assert(stats.invalidations == 2);
    assert(stats.evictions - evictionsBefore == 2);
    assert(stats.triggersDispatched == 5);
    assert(!stats.batchActive);

    std::cout << "[OK] batched screening type status change test\n";
}

void testDefaultHandlers() {
    std::cout << "Testing default invalidation handlers...\n";

    CacheManager manager(makeConfig());
    manager.set("document_types", 1, std::chrono::seconds(60), {tags::DOCUMENT_TYPES});
    manager.set("patient_9_docs", 1, std::chrono::seconds(60), {tags::patient("9")});
    manager.triggerInvalidation(triggers::DOCUMENT_TYPE_CHANGE, {{"patient_id", 9}});
    assert(!manager.get("document_types"));
    assert(!manager.get("patient_9_docs"));

    manager.set("patient_5_summary", 1, std::chrono::seconds(60), {tags::patient("5")});
    manager.set("labs_summary", 1, std::chrono::seconds(60), {tags::medicalData("labs")});
    manager.set("imaging_summary", 1, std::chrono::seconds(60), {tags::medicalData("imaging")});
    manager.triggerInvalidation(triggers::MEDICAL_DATA_SUBSECTION_UPDATE, {{"patient_id", "5"}, {"data_type", "labs"}});
    assert(!manager.get("patient_5_summary"));
    assert(!manager.get("labs_summary"));
    assert(manager.get("imaging_summary"));

    manager.set("screening_types:active=true", 1, std::chrono::seconds(60), {tags::ACTIVE_SCREENING_TYPES});
    manager.triggerInvalidation(triggers::SCREENING_TYPE_KEYWORD_CHANGE, TriggerContext::object());
    assert(!manager.get("screening_types:active=true"));

    manager.triggerInvalidation("unknown_trigger", {{"patient_id", 1}});
    auto stats = manager.getStats();
    assert(stats.triggersDispatched == 3);

    std::cout << "[OK] default invalidation handlers test\n";
}

void testHandlerFailureIsolated() {
    std::cout << "Testing handler failure isolation...\n";

    CacheManager manager(makeConfig());
    manager.triggers().subscribe(triggers::DOCUMENT_TYPE_CHANGE, "audit", [](const TriggerContext&) {
        throw std::runtime_error("audit log unavailable");
    });
    manager.set("document_types", 1, std::chrono::seconds(60), {tags::DOCUMENT_TYPES});

    manager.triggerInvalidation(triggers::DOCUMENT_TYPE_CHANGE, TriggerContext::object());
    assert(!manager.get("document_types"));

    auto stats = manager.getStats();
    assert(stats.handlerFailures == 1);
    assert(stats.triggersDispatched == 1);

    std::cout << "[OK] handler failure isolation test\n";
}

void testScenarioDurableUnreachable() {
    std::cout << "Testing unreachable durable backend...\n";

    auto state = std::make_shared<FakeDurableStore::State>();
    state->reachable = false;
    CacheManager manager(makeConfig(), std::make_unique<FakeDurableStore>(state));
    assert(manager.initialize());

    assert(manager.set("k", std::string("v"), std::chrono::seconds(60), {"T"}));
    assert(manager.getAs<std::string>("k") == std::optional<std::string>("v"));

    auto stats = manager.getStats();
    assert(!stats.durableAvailable);
    assert(stats.durableBackend == "fake");
    assert(stats.cacheHits == 1);

    CacheMonitor monitor(0.5, 100);
    assert(!monitor.check(stats));

    // Восстановление связи
    state->reachable = true;
    assert(manager.getStats().durableAvailable);

    std::cout << "[OK] unreachable durable backend test\n";
}

void testScenarioOutageAndRecovery() {
    std::cout << "Testing writes and invalidations during outage...\n";

    auto state = std::make_shared<FakeDurableStore::State>();
    CacheManager manager(makeConfig(), std::make_unique<FakeDurableStore>(state));
    const std::string key = "patient_demographics:7";

    manager.set("k", std::string("v1"), std::chrono::seconds(60));
    assert(manager.set(key, std::string("demo"), std::chrono::seconds(3600),
                       {tags::patient("7"), tags::PATIENT_DEMOGRAPHICS}));
    assert(state->payloads.count(key) == 1);

    state->reachable = false;
    assert(manager.set("k", std::string("v2"), std::chrono::seconds(60)));
    manager.triggerInvalidation(triggers::PATIENT_DEMOGRAPHIC_CHANGE, {{"patient_id", 7}});
    assert(!manager.get(key));

    state->reachable = true;
    assert(manager.getAs<std::string>("k") == std::optional<std::string>("v2"));
    assert(!manager.get(key));
    assert(state->payloads.count(key) == 0);
    assert(state->payloads.count("k") == 0);

    std::cout << "[OK] outage and recovery test\n";
}

void testTagInvalidationRemovesDurableCopy() {
    std::cout << "Testing tag invalidation removes durable copy...\n";

    auto state = std::make_shared<FakeDurableStore::State>();
    CacheManager manager(makeConfig(), std::make_unique<FakeDurableStore>(state));

    manager.set("patient_demographics:9", std::string("demo"), std::chrono::seconds(3600), {tags::patient("9")});
    manager.set("other", 1, std::chrono::seconds(60), {"unrelated"});
    assert(state->payloads.size() == 2);

    assert(manager.invalidateByTag(tags::patient("9")) == 1);
    assert(state->payloads.count("patient_demographics:9") == 0);
    assert(state->payloads.count("other") == 1);
    assert(!manager.get("patient_demographics:9"));

    std::cout << "[OK] tag invalidation durable copy test\n";
}

void testMetricsDisabled() {
    std::cout << "Testing CacheManager with metrics disabled...\n";

    auto config = makeConfig();
    config.enableMetrics = false;
    CacheManager manager(config);

    manager.set("k", 1, std::chrono::seconds(60), {"T"});
    assert(manager.getAs<int>("k") == std::optional<int>(1));
    assert(!manager.get("missing"));
    assert(manager.invalidateByTag("T") == 1);

    auto stats = manager.getStats();
    assert(stats.totalRequests == 0);
    assert(stats.cacheHits == 0);
    assert(stats.cacheMisses == 0);
    assert(stats.invalidations == 0);
    assert(stats.evictions == 0);
    assert(stats.cacheSize == 0);
    assert(stats.tagCount == 0);

    std::cout << "[OK] metrics disabled test\n";
}

void testDurableRoundTrip() {
    std::cout << "Testing durable backend round trip...\n";

    auto state = std::make_shared<FakeDurableStore::State>();
    CacheManager manager(makeConfig(), std::make_unique<FakeDurableStore>(state));

    manager.set("name", std::string("Mammogram"), std::chrono::seconds(60));
    manager.set("count", 3, std::chrono::seconds(60));
    manager.set("raw", "literal", std::chrono::seconds(60));
    assert(state->payloads.size() == 3);

    // Из внешнего хранилища значения приходят как JSON и приводятся к запрошенному типу
    assert(manager.getAs<std::string>("name") == std::optional<std::string>("Mammogram"));
    assert(manager.getAs<int>("count") == std::optional<int>(3));
    assert(manager.getAs<std::string>("raw") == std::optional<std::string>("literal"));

    // Несериализуемое значение остается только in-process
    manager.set("handle", Opaque{4}, std::chrono::seconds(60));
    assert(state->payloads.count("handle") == 0);
    auto handle = manager.getAs<Opaque>("handle");
    assert(handle && handle->handle == 4);

    assert(manager.clearAll());
    assert(state->payloads.empty());

    std::cout << "[OK] durable backend round trip test\n";
}

void testMemoize() {
    std::cout << "Testing CacheManager memoize...\n";

    CacheManager manager(makeConfig());
    int calls = 0;
    auto key = util::callKey("clinic", "eligible_screenings", 7, "Female");
    auto compute = [&calls] { ++calls; return 42; };

    assert(manager.cached<int>(key, std::chrono::seconds(60), {"patient_7"}, compute) == 42);
    assert(manager.cached<int>(key, std::chrono::seconds(60), {"patient_7"}, compute) == 42);
    assert(calls == 1);

    manager.invalidateByTag("patient_7");
    assert(manager.cached<int>(key, std::chrono::seconds(60), {"patient_7"}, compute) == 42);
    assert(calls == 2);

    // nullopt не кэшируется
    int lookups = 0;
    auto missing = [&lookups]() -> std::optional<std::string> { ++lookups; return std::nullopt; };
    assert(!manager.cachedOptional<std::string>("lookup:404", std::chrono::seconds(60), {}, missing));
    assert(!manager.cachedOptional<std::string>("lookup:404", std::chrono::seconds(60), {}, missing));
    assert(lookups == 2);

    std::cout << "[OK] CacheManager memoize test\n";
}

void testCallKey() {
    std::cout << "Testing call key generation...\n";

    auto a = util::callKey("clinic", "fn", 1, "x");
    auto b = util::callKey("clinic", "fn", 1, "x");
    auto c = util::callKey("clinic", "fn", 2, "x");
    assert(a == b);
    assert(a != c);
    assert(a.rfind("clinic:fn:", 0) == 0);
    assert(a.size() == std::string("clinic:fn:").size() + 16);
    assert(util::callKey("", "fn") == "fn");
    assert(util::callKey("p", "fn") == "p:fn");
    assert(util::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "[OK] call key generation test\n";
}

void testCacheManagerClearAndPurge() {
    std::cout << "Testing CacheManager clear/purge...\n";

    ManualClock clock;
    CacheManager manager(makeConfig(), clock.source());
    manager.set("short", 1, std::chrono::seconds(5), {"S"});
    manager.set("long", 2, std::chrono::seconds(100), {"L"});

    clock.advance(std::chrono::seconds(10));
    assert(manager.purgeExpired() == 1);
    auto stats = manager.getStats();
    assert(stats.cacheSize == 1);
    assert(stats.tagCount == 1);
    assert(stats.evictions == 1);
    assert(manager.purgeExpired() == 0);

    assert(manager.clearAll());
    stats = manager.getStats();
    assert(stats.cacheSize == 0);
    assert(stats.tagCount == 0);
    assert(manager.invalidateByTag("L") == 0);

    std::cout << "[OK] CacheManager clear/purge test\n";
}

void testCacheManagerInitialize() {
    std::cout << "Testing CacheManager initialize with warm hook...\n";

    CacheManager manager(makeConfig());
    assert(manager.initialize([](CacheManager& cache) {
        cache.set("warm", std::string("ready"));
    }));
    assert(manager.getAs<std::string>("warm") == std::optional<std::string>("ready"));

    CacheManager failing(makeConfig());
    assert(failing.initialize([](CacheManager&) {
        throw std::runtime_error("repository offline");
    }));

    std::cout << "[OK] CacheManager initialize test\n";
}

void testCacheManagerConfiguration() {
    std::cout << "Testing CacheManager configuration...\n";

    auto config = makeConfig();
    config.defaultTtl = std::chrono::seconds(0);
    bool thrown = false;
    try {
        CacheManager manager(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    // Некорректный URL: работа только in-process
    auto badUrl = makeConfig();
    badUrl.durableUrl = "memcached://localhost";
    CacheManager manager(badUrl);
    assert(manager.getStats().durableBackend == "none");
    assert(manager.set("k", 1));
    assert(manager.getConfiguration().durableUrl == "memcached://localhost");

    auto parsed = CacheConfig::fromJson({{"durableUrl", "redis://cache:6380/1"}, {"defaultTtlSeconds", 120},
                                         {"enableCompression", true}});
    assert(parsed.durableUrl == "redis://cache:6380/1");
    assert(parsed.defaultTtl == std::chrono::seconds(120));
    assert(parsed.enableCompression);
    assert(parsed.ioTimeout == std::chrono::milliseconds(5000));
    assert(parsed.validate());
    assert(CacheConfig::fromJson(parsed.toJson()).defaultTtl == std::chrono::seconds(120));

    thrown = false;
    try {
        CacheConfig::fromFile("/nonexistent/cache.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] CacheManager configuration test\n";
}

int main() {
    try {
        smokeTestCacheManager();
        testCacheManagerTtl();
        testCacheManagerDefaultTtl();
        testCacheManagerTagInvalidation();
        testCacheManagerOverwriteReplacesTags();
        testCacheManagerRemove();
        testCacheManagerBatchCoalescing();
        testCacheManagerStats();
        testScenarioPatientDemographicChange();
        testScenarioBatchedStatusChange();
        testDefaultHandlers();
        testHandlerFailureIsolated();
        testScenarioDurableUnreachable();
        testScenarioOutageAndRecovery();
        testTagInvalidationRemovesDurableCopy();
        testMetricsDisabled();
        testDurableRoundTrip();
        testMemoize();
        testCallKey();
        testCacheManagerClearAndPurge();
        testCacheManagerInitialize();
        testCacheManagerConfiguration();

        spdlog::shutdown(); // Гарантируем запись всех логов
        std::cout << "All CacheManager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
