/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CProgramCounters.h>
#include <core/CoreTypes.h>

#include <model/CAnomaly.h>
#include <model/CIncident.h>
#include <model/CIncidentGrouper.h>
#include <model/CRcaConfig.h>

#include <test/CProgramCounterClearingFixture.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <utility>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(CIncidentGrouperTest, rca::test::CProgramCounterClearingFixture)

using namespace rca;

namespace {
using TIncidentChangePr = std::pair<model::SIncident, model::CIncidentGrouper::EChange>;
using TIncidentChangePrVec = std::vector<TIncidentChangePr>;

const core_t::TTime START{1700000000};

model::SAnomaly anomaly(const std::string& service,
                        const std::string& metric,
                        core_t::TTime start,
                        core_t::TTime end,
                        bool open) {
    model::SAnomaly result;
    result.s_Id = model::SAnomaly::makeId(service, metric, start);
    result.s_Service = service;
    result.s_Metric = metric;
    result.s_Start = start;
    result.s_End = end;
    result.s_Score = 5.0;
    result.s_Open = open;
    return result;
}

model::CIncidentGrouper::TIncidentCallback collect(TIncidentChangePrVec& changes) {
    return [&changes](const model::SIncident& incident, model::CIncidentGrouper::EChange change) {
        changes.emplace_back(incident, change);
    };
}
}

BOOST_AUTO_TEST_CASE(testGroupOverlapping) {
    TIncidentChangePrVec changes;
    model::CIncidentGrouper grouper{model::CRcaConfig::SGrouper{}, collect(changes)};

    std::string first{grouper.addAnomaly(anomaly("checkout", "p95_latency_ms", START, START, true))};
    BOOST_REQUIRE_EQUAL(1, changes.size());
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Created, changes[0].second);
    const model::SIncident& created = changes[0].first;
    BOOST_REQUIRE_EQUAL(first, created.s_Id);
    BOOST_REQUIRE_EQUAL("Incident in checkout", created.s_Title);
    BOOST_REQUIRE_EQUAL(START, created.s_Start);
    BOOST_TEST_REQUIRE(!created.s_End);
    BOOST_TEST_REQUIRE(created.isOpen());
    BOOST_REQUIRE_EQUAL("checkout", created.s_CorrelationKey);

    // A second metric of the same service breaching soon after joins.
    std::string second{grouper.addAnomaly(
        anomaly("checkout", "error_rate", START + 3 * constants::MINUTE,
                START + 3 * constants::MINUTE, true))};
    BOOST_REQUIRE_EQUAL(first, second);
    BOOST_REQUIRE_EQUAL(2, changes.size());
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Updated, changes[1].second);
    BOOST_REQUIRE_EQUAL(2, changes[1].first.s_AnomalyIds.size());
    BOOST_REQUIRE_EQUAL("Anomalous error_rate, p95_latency_ms across 2 anomalies",
                        changes[1].first.s_Summary);

    // Extending an anomaly updates the incident but doesn't add to it.
    grouper.addAnomaly(anomaly("checkout", "p95_latency_ms", START,
                               START + 5 * constants::MINUTE, true));
    BOOST_REQUIRE_EQUAL(3, changes.size());
    BOOST_REQUIRE_EQUAL(2, changes[2].first.s_AnomalyIds.size());
    BOOST_REQUIRE_EQUAL(START + 5 * constants::MINUTE, changes[2].first.s_LastActivity);

    // A different service is a different incident.
    std::string other{grouper.addAnomaly(anomaly("search", "error_rate", START, START, true))};
    BOOST_TEST_REQUIRE(other != first);
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Created, changes.back().second);
    BOOST_REQUIRE_EQUAL(2, grouper.numberOpenIncidents());
    BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberIncidents));
}

BOOST_AUTO_TEST_CASE(testCorrelationGroups) {
    model::CRcaConfig::SGrouper config;
    config.s_CorrelationGroups["shop"] = {"cart", "checkout"};

    TIncidentChangePrVec changes;
    model::CIncidentGrouper grouper{config, collect(changes)};

    std::string first{grouper.addAnomaly(anomaly("checkout", "error_rate", START, START, true))};
    std::string second{grouper.addAnomaly(
        anomaly("cart", "p95_latency_ms", START + constants::MINUTE, START + constants::MINUTE, true))};
    BOOST_REQUIRE_EQUAL(first, second);
    BOOST_REQUIRE_EQUAL("Incident affecting cart, checkout", changes.back().first.s_Title);
    BOOST_REQUIRE_EQUAL("group:shop", changes.back().first.s_CorrelationKey);
    BOOST_REQUIRE_EQUAL(2, changes.back().first.s_Services.size());

    BOOST_TEST_REQUIRE(grouper.addAnomaly(anomaly("search", "error_rate", START, START, true)) != first);
}

BOOST_AUTO_TEST_CASE(testGraceMargin) {
    TIncidentChangePrVec changes;
    model::CIncidentGrouper grouper{model::CRcaConfig::SGrouper{}, collect(changes)};

    core_t::TTime end{START + 5 * constants::MINUTE};
    std::string first{grouper.addAnomaly(anomaly("checkout", "error_rate", START, end, false))};
    BOOST_TEST_REQUIRE(changes.back().first.s_End.is_initialized());
    BOOST_REQUIRE_EQUAL(end, *changes.back().first.s_End);

    // Within the grace margin of the end of a finished incident.
    BOOST_REQUIRE_EQUAL(first, grouper.addAnomaly(anomaly("checkout", "qps", end + 9 * constants::MINUTE,
                                                          end + 9 * constants::MINUTE, false)));

    // Beyond the grace margin of the now later end.
    core_t::TTime later{end + 9 * constants::MINUTE + 11 * constants::MINUTE};
    std::string second{grouper.addAnomaly(anomaly("checkout", "p99_latency_ms", later, later, true))};
    BOOST_TEST_REQUIRE(second != first);

    // Before the start but within the grace margin.
    BOOST_REQUIRE_EQUAL(first, grouper.addAnomaly(anomaly("checkout", "cpu", START - 8 * constants::MINUTE,
                                                          START - 8 * constants::MINUTE, false)));
    BOOST_REQUIRE_EQUAL(START - 8 * constants::MINUTE, changes.back().first.s_Start);
}

BOOST_AUTO_TEST_CASE(testOpenIncidentWindowIsUnbounded) {
    TIncidentChangePrVec changes;
    model::CIncidentGrouper grouper{model::CRcaConfig::SGrouper{}, collect(changes)};

    std::string first{grouper.addAnomaly(anomaly("checkout", "error_rate", START, START, true))};
    BOOST_REQUIRE_EQUAL(first, grouper.addAnomaly(anomaly("checkout", "qps", START + 3 * constants::HOUR,
                                                          START + 3 * constants::HOUR, true)));
}

BOOST_AUTO_TEST_CASE(testClosure) {
    TIncidentChangePrVec changes;
    model::CIncidentGrouper grouper{model::CRcaConfig::SGrouper{}, collect(changes)};

    model::SAnomaly latency{anomaly("checkout", "p95_latency_ms", START, START, true)};
    std::string id{grouper.addAnomaly(latency)};

    // Not closed while an anomaly is open.
    grouper.closeQuietIncidents(START + constants::HOUR);
    BOOST_REQUIRE_EQUAL(1, changes.size());

    latency.s_End = START + 4 * constants::MINUTE;
    latency.s_Open = false;
    grouper.addAnomaly(latency);
    BOOST_REQUIRE_EQUAL(START + 4 * constants::MINUTE, *changes.back().first.s_End);

    grouper.closeQuietIncidents(latency.s_End + 10 * constants::MINUTE - 1);
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Updated, changes.back().second);

    grouper.closeQuietIncidents(latency.s_End + 10 * constants::MINUTE);
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Closed, changes.back().second);
    BOOST_REQUIRE_EQUAL(id, changes.back().first.s_Id);
    BOOST_REQUIRE_EQUAL(model_t::E_Closed, changes.back().first.s_Status);
    BOOST_REQUIRE_EQUAL(latency.s_End, *changes.back().first.s_End);
    BOOST_REQUIRE_EQUAL(0, grouper.numberOpenIncidents());

    // Closure is final.
    std::size_t numberChanges{changes.size()};
    grouper.closeQuietIncidents(START + constants::HOUR);
    BOOST_REQUIRE_EQUAL(numberChanges, changes.size());

    latency.s_Open = true;
    latency.s_End = START + 20 * constants::MINUTE;
    std::string reopened{grouper.addAnomaly(latency)};
    BOOST_TEST_REQUIRE(reopened != id);
    BOOST_REQUIRE_EQUAL(model::CIncidentGrouper::E_Created, changes.back().second);
    for (std::size_t i = numberChanges; i < changes.size(); ++i) {
        BOOST_TEST_REQUIRE(changes[i].first.s_Id != id);
    }
}

BOOST_AUTO_TEST_CASE(testTitle) {
    BOOST_REQUIRE_EQUAL("Incident in api", model::CIncidentGrouper::title({"api"}));
    BOOST_REQUIRE_EQUAL("Incident affecting api, db, web",
                        model::CIncidentGrouper::title({"web", "db", "api"}));
}

BOOST_AUTO_TEST_SUITE_END()
