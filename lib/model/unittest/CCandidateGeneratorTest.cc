/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CoreTypes.h>

#include <model/CCandidateGenerator.h>
#include <model/CIncident.h>
#include <model/CRcaConfig.h>
#include <model/CTelemetryStore.h>
#include <model/CTelemetryTypes.h>

#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>

BOOST_AUTO_TEST_SUITE(CCandidateGeneratorTest)

using namespace rca;

namespace {
const core_t::TTime START{1700000000};

model::SChangeEvent deployment(const std::string& service, const std::string& id, core_t::TTime time) {
    model::SChangeEvent result;
    result.s_Service = service;
    result.s_Id = id;
    result.s_Time = time;
    model::SDeploymentPayload payload;
    payload.s_CommitSha = "abc123";
    payload.s_DiffSummary = "bump connection pool size";
    result.s_Payload = payload;
    return result;
}

model::SChangeEvent config(const std::string& service, const std::string& id, core_t::TTime time) {
    model::SChangeEvent result;
    result.s_Service = service;
    result.s_Id = id;
    result.s_Time = time;
    model::SConfigChangePayload payload;
    payload.s_Key = "db.timeout";
    payload.s_OldValue = "5s";
    payload.s_NewValue = "1s";
    result.s_Payload = payload;
    return result;
}

model::SChangeEvent flag(const std::string& service, const std::string& id, core_t::TTime time) {
    model::SChangeEvent result;
    result.s_Service = service;
    result.s_Id = id;
    result.s_Time = time;
    model::SFlagChangePayload payload;
    payload.s_FlagName = "new_checkout";
    payload.s_OldState = "off";
    payload.s_NewState = "on";
    result.s_Payload = payload;
    return result;
}

model::SIncident incident(core_t::TTime start) {
    model::SIncident result;
    result.s_Id = "inc-1";
    result.s_Start = start;
    result.s_Services = {"checkout"};
    return result;
}
}

BOOST_AUTO_TEST_CASE(testChangeEventPayloads) {
    model::SChangeEvent change{config("checkout", "cfg-1", START)};
    BOOST_REQUIRE_EQUAL(model_t::E_ConfigChange, change.type());
    BOOST_REQUIRE_EQUAL("db.timeout 5s 1s", change.payloadText());
    BOOST_TEST_REQUIRE(change.isGlobal() == false);

    change = flag("", "flag-1", START);
    BOOST_REQUIRE_EQUAL(model_t::E_FlagChange, change.type());
    BOOST_REQUIRE_EQUAL("new_checkout on", change.payloadText());
    BOOST_TEST_REQUIRE(change.isGlobal());

    change = deployment("checkout", "deploy-1", START);
    BOOST_REQUIRE_EQUAL(model_t::E_Deployment, change.type());
    BOOST_REQUIRE_EQUAL("bump connection pool size", change.payloadText());
}

BOOST_AUTO_TEST_CASE(testStoreQueries) {
    model::CInMemoryTelemetryStore store;

    for (core_t::TTime time : {START + 120, START, START + 60}) {
        model::SMetricSample sample;
        sample.s_Service = "checkout";
        sample.s_Metric = "qps";
        sample.s_Time = time;
        sample.s_Value = 1.0;
        store.addMetric(sample);
    }
    model::CTelemetryStore::TMetricSampleVec samples{store.metrics("checkout", START, START + 120)};
    BOOST_REQUIRE_EQUAL(2, samples.size());
    BOOST_REQUIRE_EQUAL(START, samples[0].s_Time);
    BOOST_REQUIRE_EQUAL(START + 60, samples[1].s_Time);
    BOOST_TEST_REQUIRE(store.metrics("search", START, START + 120).empty());
    BOOST_REQUIRE_EQUAL(1, store.metricNames("checkout").size());

    store.addChange(deployment("checkout", "deploy-1", START));
    store.addChange(flag("", "flag-1", START + 10));
    store.addChange(deployment("search", "deploy-2", START + 20));

    // Changes are inclusive of both ends of the range.
    BOOST_REQUIRE_EQUAL(2, store.changes({"checkout"}, START, START + 10, true).size());
    BOOST_REQUIRE_EQUAL(1, store.changes({"checkout"}, START, START + 10, false).size());
    BOOST_REQUIRE_EQUAL(3, store.changes({"checkout", "search"}, START, START + 20, true).size());
    BOOST_TEST_REQUIRE(store.changes({"checkout"}, START + 10, START, true).empty());
}

BOOST_AUTO_TEST_CASE(testGenerateOrdering) {
    auto store = std::make_shared<model::CInMemoryTelemetryStore>();
    core_t::TTime start{START};
    store->addChange(deployment("checkout", "deploy-50", start - 50 * constants::MINUTE));
    store->addChange(deployment("checkout", "deploy-5", start - 5 * constants::MINUTE));
    store->addChange(deployment("checkout", "deploy-15", start - 15 * constants::MINUTE));
    store->addChange(flag("checkout", "flag-5", start - 5 * constants::MINUTE));
    store->addChange(config("checkout", "cfg-5", start - 5 * constants::MINUTE));
    store->addChange(deployment("search", "deploy-other", start - 5 * constants::MINUTE));

    model::CCandidateGenerator generator{model::CRcaConfig::SCandidates{}, store};
    model::TCandidateVec candidates{generator.generate(incident(start))};

    BOOST_REQUIRE_EQUAL(5, candidates.size());
    BOOST_REQUIRE_EQUAL("deploy-5", candidates[0].s_Key);
    BOOST_REQUIRE_EQUAL("cfg-5", candidates[1].s_Key);
    BOOST_REQUIRE_EQUAL("flag-5", candidates[2].s_Key);
    BOOST_REQUIRE_EQUAL("deploy-15", candidates[3].s_Key);
    BOOST_REQUIRE_EQUAL("deploy-50", candidates[4].s_Key);
    for (const auto& candidate : candidates) {
        BOOST_REQUIRE_EQUAL("inc-1", candidate.s_IncidentId);
        BOOST_REQUIRE_EQUAL("checkout", candidate.s_Service);
    }
    BOOST_REQUIRE_EQUAL(model_t::E_ConfigChange, candidates[1].s_Type);
    BOOST_REQUIRE_EQUAL("db.timeout 5s 1s", candidates[1].s_PayloadText);
}

BOOST_AUTO_TEST_CASE(testGenerateWindow) {
    auto store = std::make_shared<model::CInMemoryTelemetryStore>();
    core_t::TTime start{START};
    store->addChange(deployment("checkout", "too-early", start - 2 * constants::HOUR - 1));
    store->addChange(deployment("checkout", "earliest", start - 2 * constants::HOUR));
    store->addChange(deployment("checkout", "at-start", start));
    store->addChange(deployment("checkout", "after", start + 10 * constants::MINUTE));
    store->addChange(flag("", "global-flag", start - constants::HOUR));

    model::CRcaConfig::SCandidates config;
    model::CCandidateGenerator generator{config, store};
    model::TCandidateVec candidates{generator.generate(incident(start))};

    BOOST_REQUIRE_EQUAL(3, candidates.size());
    BOOST_REQUIRE_EQUAL("at-start", candidates[0].s_Key);
    BOOST_REQUIRE_EQUAL("global-flag", candidates[1].s_Key);
    BOOST_TEST_REQUIRE(candidates[1].s_Service.empty());
    BOOST_REQUIRE_EQUAL("earliest", candidates[2].s_Key);

    // A lookahead admits changes after the start but not after the end.
    config.s_Lookahead = 15 * constants::MINUTE;
    model::CCandidateGenerator lookahead{config, store};
    BOOST_REQUIRE_EQUAL(4, lookahead.generate(incident(start)).size());

    model::SIncident finished{incident(start)};
    finished.s_End = start + 5 * constants::MINUTE;
    BOOST_REQUIRE_EQUAL(3, lookahead.generate(finished).size());

    config.s_Lookback = constants::HOUR / 2;
    config.s_Lookahead = 0;
    model::CCandidateGenerator shortLookback{config, store};
    candidates = shortLookback.generate(incident(start));
    BOOST_REQUIRE_EQUAL(1, candidates.size());
    BOOST_REQUIRE_EQUAL("at-start", candidates[0].s_Key);
}

BOOST_AUTO_TEST_CASE(testGenerateDeduplicates) {
    auto store = std::make_shared<model::CInMemoryTelemetryStore>();
    core_t::TTime start{START};
    store->addChange(deployment("checkout", "deploy-1", start - 20 * constants::MINUTE));
    store->addChange(deployment("checkout", "deploy-1", start - 10 * constants::MINUTE));
    // The same key with a different type is a different change.
    store->addChange(config("checkout", "deploy-1", start - 30 * constants::MINUTE));

    model::CCandidateGenerator generator{model::CRcaConfig::SCandidates{}, store};
    model::TCandidateVec candidates{generator.generate(incident(start))};

    BOOST_REQUIRE_EQUAL(2, candidates.size());
    BOOST_REQUIRE_EQUAL(model_t::E_Deployment, candidates[0].s_Type);
    BOOST_REQUIRE_EQUAL(start - 10 * constants::MINUTE, candidates[0].s_ChangeTime);
    BOOST_REQUIRE_EQUAL(model_t::E_ConfigChange, candidates[1].s_Type);
}

BOOST_AUTO_TEST_CASE(testGenerateNoChanges) {
    auto store = std::make_shared<model::CInMemoryTelemetryStore>();
    model::CCandidateGenerator generator{model::CRcaConfig::SCandidates{}, store};
    BOOST_TEST_REQUIRE(generator.generate(incident(START)).empty());
}

BOOST_AUTO_TEST_SUITE_END()
