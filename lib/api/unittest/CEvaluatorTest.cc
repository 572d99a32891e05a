/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CoreTypes.h>

#include <model/CAnomaly.h>
#include <model/CIncident.h>
#include <model/CLabel.h>
#include <model/CRcaConfig.h>
#include <model/CSuspect.h>

#include <api/CEvaluator.h>
#include <api/CRcaEngine.h>

#include <boost/optional/optional_io.hpp>
#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CEvaluatorTest)

using namespace rca;

namespace {
using TIncidentResultVec = api::CEvaluator::TIncidentResultVec;

model::SIncident incident(const std::string& id, core_t::TTime start) {
    model::SIncident result;
    result.s_Id = id;
    result.s_Start = start;
    return result;
}

model::SSuspect suspect(const std::string& incidentId,
                        model_t::ESuspectType type,
                        const std::string& key,
                        std::size_t rank) {
    model::SSuspect result;
    result.s_IncidentId = incidentId;
    result.s_Type = type;
    result.s_Key = key;
    result.s_Id = incidentId + ':' + model_t::print(type) + ':' + key;
    result.s_Rank = rank;
    return result;
}

model::SLabel label(const model::SSuspect& suspect, bool isCause) {
    model::SLabel result;
    result.s_IncidentId = suspect.s_IncidentId;
    result.s_SuspectId = suspect.s_Id;
    result.s_SuspectType = suspect.s_Type;
    result.s_SuspectKey = suspect.s_Key;
    result.s_IsCause = isCause;
    return result;
}

model::SAnomaly anomaly(core_t::TTime start) {
    model::SAnomaly result;
    result.s_Start = start;
    result.s_End = start;
    return result;
}

api::CEvaluator::SIncidentResult incidentResult(const std::string& id, bool hasCause, std::size_t rank) {
    api::CEvaluator::SIncidentResult result;
    result.s_IncidentId = id;
    result.s_HasTrueCause = hasCause;
    result.s_TrueCauseRank = rank;
    return result;
}
}

BOOST_AUTO_TEST_CASE(testEvaluateIncident) {
    model::SIncident subject{incident("inc-1", 6000)};
    model::TSuspectVec suspects{suspect("inc-1", model_t::E_Deployment, "d-1", 1),
                                suspect("inc-1", model_t::E_ConfigChange, "cfg-1", 2),
                                suspect("inc-1", model_t::E_FlagChange, "flag-1", 3)};

    // Labels for other incidents and negative labels are ignored.
    model::TLabelVec labels{label(suspects[0], false), label(suspects[1], true),
                            label(suspect("inc-2", model_t::E_Deployment, "d-1", 1), true)};

    api::CEvaluator::SIncidentResult evaluated{
        api::CEvaluator::evaluate(subject, suspects, {anomaly(6300), anomaly(6120)}, labels)};
    BOOST_REQUIRE_EQUAL("inc-1", evaluated.s_IncidentId);
    BOOST_TEST_REQUIRE(evaluated.s_HasTrueCause);
    BOOST_REQUIRE_EQUAL(2, evaluated.s_TrueCauseRank);
    BOOST_TEST_REQUIRE(evaluated.s_TimeToDetectMinutes != boost::none);
    BOOST_REQUIRE_EQUAL(2.0, *evaluated.s_TimeToDetectMinutes);

    // A rerun gives the labelled change a new rank but it is matched on
    // its type and key.
    model::TSuspectVec rerun{suspect("inc-1", model_t::E_ConfigChange, "cfg-1", 1)};
    rerun[0].s_Id = "renamed";
    evaluated = api::CEvaluator::evaluate(subject, rerun, {}, labels);
    BOOST_REQUIRE_EQUAL(1, evaluated.s_TrueCauseRank);
    BOOST_TEST_REQUIRE(evaluated.s_TimeToDetectMinutes == boost::none);

    // The labelled cause may not be among the suspects at all.
    evaluated = api::CEvaluator::evaluate(subject, {suspects[0]}, {}, labels);
    BOOST_TEST_REQUIRE(evaluated.s_HasTrueCause);
    BOOST_REQUIRE_EQUAL(0, evaluated.s_TrueCauseRank);

    evaluated = api::CEvaluator::evaluate(subject, suspects, {}, {label(suspects[2], false)});
    BOOST_TEST_REQUIRE(evaluated.s_HasTrueCause == false);
}

BOOST_AUTO_TEST_CASE(testSummarise) {
    TIncidentResultVec results{incidentResult("inc-1", true, 1), incidentResult("inc-2", true, 2),
                               incidentResult("inc-3", true, 0), incidentResult("inc-4", true, 4),
                               incidentResult("inc-5", false, 0)};
    results[0].s_TimeToDetectMinutes = 1.0;
    results[1].s_TimeToDetectMinutes = 4.0;

    api::CEvaluator::SSummary summary{api::CEvaluator::summarise(results)};
    BOOST_REQUIRE_EQUAL(5, summary.s_NumberIncidents);
    BOOST_REQUIRE_EQUAL(4, summary.s_NumberWithTrueCause);
    BOOST_REQUIRE_CLOSE(0.25, *summary.s_PrecisionAt1, 1e-10);
    BOOST_REQUIRE_CLOSE(0.5, *summary.s_PrecisionAt3, 1e-10);
    BOOST_REQUIRE_CLOSE((1.0 + 0.5 + 0.0 + 0.25) / 4.0, *summary.s_MeanReciprocalRank, 1e-10);
    BOOST_REQUIRE_CLOSE(2.5, *summary.s_MeanTimeToDetectMinutes, 1e-10);
    BOOST_REQUIRE_EQUAL(5, summary.s_Incidents.size());
    BOOST_REQUIRE_EQUAL("inc-5", summary.s_Incidents[4].s_IncidentId);
}

BOOST_AUTO_TEST_CASE(testSummariseWithoutCauses) {
    api::CEvaluator::SSummary summary{api::CEvaluator::summarise({incidentResult("inc-1", false, 0)})};
    BOOST_REQUIRE_EQUAL(1, summary.s_NumberIncidents);
    BOOST_REQUIRE_EQUAL(0, summary.s_NumberWithTrueCause);
    BOOST_TEST_REQUIRE(summary.s_PrecisionAt1 == boost::none);
    BOOST_TEST_REQUIRE(summary.s_PrecisionAt3 == boost::none);
    BOOST_TEST_REQUIRE(summary.s_MeanReciprocalRank == boost::none);
    BOOST_TEST_REQUIRE(summary.s_MeanTimeToDetectMinutes == boost::none);

    summary = api::CEvaluator::summarise({});
    BOOST_REQUIRE_EQUAL(0, summary.s_NumberIncidents);
    BOOST_TEST_REQUIRE(summary.s_Incidents.empty());
}

BOOST_AUTO_TEST_CASE(testEvaluateEngine) {
    model::CRcaConfig config;
    config.engine().s_RunThreads = 0;
    api::CRcaEngine engine{config};

    const core_t::TTime start{1700000000};
    model::SChangeEvent change;
    change.s_Service = "cart";
    change.s_Time = start + 55 * constants::MINUTE;
    change.s_Id = "d-1";
    change.s_Payload = model::SDeploymentPayload{"abc123", "2.0.0", "sam", "new cache"};
    BOOST_TEST_REQUIRE(engine.addChange(change));
    for (core_t::TTime i = 0; i < 60; ++i) {
        engine.addMetric(model::SMetricSample{"cart", "p95_latency_ms", start + i * constants::MINUTE,
                                              98.0 + static_cast<double>(i % 5)});
    }
    engine.addMetric(model::SMetricSample{"cart", "p95_latency_ms", start + constants::HOUR, 400.0});

    // Nothing is labelled yet.
    BOOST_REQUIRE_EQUAL(0, api::CEvaluator::evaluate(engine).s_NumberIncidents);

    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(1, suspects.size());
    engine.submitLabel("inc-1", suspects[0].s_Id, true, engine.now());

    api::CEvaluator::SSummary summary{api::CEvaluator::evaluate(engine)};
    BOOST_REQUIRE_EQUAL(1, summary.s_NumberIncidents);
    BOOST_REQUIRE_EQUAL(1, summary.s_NumberWithTrueCause);
    BOOST_REQUIRE_EQUAL(1.0, *summary.s_PrecisionAt1);
    BOOST_REQUIRE_EQUAL(1.0, *summary.s_MeanReciprocalRank);
    BOOST_REQUIRE_EQUAL(0.0, *summary.s_MeanTimeToDetectMinutes);
}

BOOST_AUTO_TEST_SUITE_END()
