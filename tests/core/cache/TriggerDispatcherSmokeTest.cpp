#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/cache/triggers/TriggerDispatcher.hpp"

#include <spdlog/spdlog.h>

using namespace clinic::core::cache;

void testDispatchInSubscriptionOrder() {
    std::cout << "Testing TriggerDispatcher dispatch order...\n";

    TriggerDispatcher dispatcher;
    std::vector<std::string> calls;
    dispatcher.subscribe("document_type_change", "first", [&](const TriggerContext&) { calls.push_back("first"); });
    dispatcher.subscribe("document_type_change", "second", [&](const TriggerContext& ctx) {
        calls.push_back("second:" + ctx.value("document_type", ""));
    });

    auto result = dispatcher.dispatch("document_type_change", {{"document_type", "LAB_REPORT"}});
    assert(result.known);
    assert(result.invoked == 2);
    assert(result.failed == 0);
    assert(calls.size() == 2);
    assert(calls[0] == "first");
    assert(calls[1] == "second:LAB_REPORT");

    std::cout << "[OK] TriggerDispatcher dispatch order test\n";
}

void testUnknownTriggerIsNoop() {
    std::cout << "Testing TriggerDispatcher unknown trigger...\n";

    TriggerDispatcher dispatcher;
    auto result = dispatcher.dispatch("no_such_trigger", TriggerContext::object());
    assert(!result.known);
    assert(result.invoked == 0);
    assert(!dispatcher.hasHandlers("no_such_trigger"));

    std::cout << "[OK] TriggerDispatcher unknown trigger test\n";
}

void testFailingHandlerIsolated() {
    std::cout << "Testing TriggerDispatcher failure isolation...\n";

    TriggerDispatcher dispatcher;
    int after = 0;
    dispatcher.subscribe("patient_demographic_change", "broken", [](const TriggerContext&) {
        throw std::runtime_error("database gone");
    });
    dispatcher.subscribe("patient_demographic_change", "thrower", [](const TriggerContext&) {
        throw 42;
    });
    dispatcher.subscribe("patient_demographic_change", "healthy", [&](const TriggerContext&) { ++after; });

    auto result = dispatcher.dispatch("patient_demographic_change", {{"patient_id", 7}});
    assert(result.invoked == 3);
    assert(result.failed == 2);
    assert(after == 1);

    std::cout << "[OK] TriggerDispatcher failure isolation test\n";
}

void testReplaceAndUnsubscribe() {
    std::cout << "Testing TriggerDispatcher replace/unsubscribe...\n";

    TriggerDispatcher dispatcher;
    int version = 0;
    dispatcher.subscribe("batch_operation_start", "batch", [&](const TriggerContext&) { version = 1; });
    dispatcher.subscribe("batch_operation_start", "batch", [&](const TriggerContext&) { version = 2; });
    auto result = dispatcher.dispatch("batch_operation_start", TriggerContext::object());
    assert(result.invoked == 1);
    assert(version == 2);

    dispatcher.subscribe("batch_operation_end", "batch", [](const TriggerContext&) {});
    auto types = dispatcher.triggerTypes();
    assert(types.size() == 2);
    assert(types[0] == "batch_operation_end");

    assert(dispatcher.unsubscribe("batch_operation_start", "batch"));
    assert(!dispatcher.unsubscribe("batch_operation_start", "batch"));
    assert(!dispatcher.hasHandlers("batch_operation_start"));

    std::cout << "[OK] TriggerDispatcher replace/unsubscribe test\n";
}

void testReentrantSubscribe() {
    std::cout << "Testing TriggerDispatcher reentrant handler...\n";

    TriggerDispatcher dispatcher;
    dispatcher.subscribe("screening_type_keyword_change", "registrar", [&](const TriggerContext&) {
        dispatcher.subscribe("screening_type_status_change", "late", [](const TriggerContext&) {});
    });
    dispatcher.dispatch("screening_type_keyword_change", TriggerContext::object());
    assert(dispatcher.hasHandlers("screening_type_status_change"));

    std::cout << "[OK] TriggerDispatcher reentrant handler test\n";
}

void testContextId() {
    std::cout << "Testing context id extraction...\n";

    assert(contextId({{"patient_id", 7}}, "patient_id") == std::optional<std::string>("7"));
    assert(contextId({{"patient_id", "42"}}, "patient_id") == std::optional<std::string>("42"));
    assert(contextId({{"patient_id", -3}}, "patient_id") == std::optional<std::string>("-3"));
    assert(contextId({{"patient_id", 7.0}}, "patient_id") == std::optional<std::string>("7"));
    assert(!contextId({{"patient_id", 7.5}}, "patient_id"));
    assert(!contextId({{"patient_id", 0.0}}, "patient_id"));
    assert(!contextId({{"patient_id", true}}, "patient_id"));
    assert(!contextId({{"patient_id", 0}}, "patient_id"));
    assert(!contextId({{"patient_id", ""}}, "patient_id"));
    assert(!contextId({{"patient_id", nullptr}}, "patient_id"));
    assert(!contextId({{"other", 1}}, "patient_id"));
    assert(!contextId(TriggerContext::array(), "patient_id"));

    std::cout << "[OK] context id extraction test\n";
}

int main() {
    try {
        testDispatchInSubscriptionOrder();
        testUnknownTriggerIsNoop();
        testFailingHandlerIsolated();
        testReplaceAndUnsubscribe();
        testReentrantSubscribe();
        testContextId();

        spdlog::shutdown();
        std::cout << "All TriggerDispatcher tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
