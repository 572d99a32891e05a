/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CoreTypes.h>

#include <maths/CLogisticRegression.h>

#include <model/CEvidence.h>
#include <model/CRankingModel.h>
#include <model/CRcaConfig.h>
#include <model/CRcaError.h>
#include <model/CTelemetryStore.h>

#include <api/CActivityLog.h>
#include <api/CRcaEngine.h>

#include <test/CProgramCounterClearingFixture.h>

#include <boost/optional/optional_io.hpp>
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include <string>
#include <thread>

BOOST_TEST_DONT_PRINT_LOG_VALUE(rca::api::CRcaEngine::TOptionalIncident)

BOOST_FIXTURE_TEST_SUITE(CRcaEngineTest, rca::test::CProgramCounterClearingFixture)

using namespace rca;

namespace {
const core_t::TTime START{1700000000};
const core_t::TTime INCIDENT_START{START + constants::HOUR};

//! Blocks change queries until opened.
class CGatedTelemetryStore : public model::CInMemoryTelemetryStore {
public:
    TChangeEventVec changes(const model_t::TStrSet& services,
                            core_t::TTime from,
                            core_t::TTime to,
                            bool includeGlobal) const override {
        {
            std::unique_lock<std::mutex> lock{m_GateMutex};
            m_Gate.wait(lock, [this] { return m_Open; });
        }
        return this->model::CInMemoryTelemetryStore::changes(services, from, to, includeGlobal);
    }

    void open() {
        std::lock_guard<std::mutex> lock{m_GateMutex};
        m_Open = true;
        m_Gate.notify_all();
    }

private:
    mutable std::mutex m_GateMutex;
    mutable std::condition_variable m_Gate;
    bool m_Open{false};
};

//! Makes change queries slow while enabled.
class CSlowTelemetryStore : public model::CInMemoryTelemetryStore {
public:
    TChangeEventVec changes(const model_t::TStrSet& services,
                            core_t::TTime from,
                            core_t::TTime to,
                            bool includeGlobal) const override {
        if (m_Slow.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
        return this->model::CInMemoryTelemetryStore::changes(services, from, to, includeGlobal);
    }

    void slow(bool slow) { m_Slow.store(slow); }

private:
    std::atomic<bool> m_Slow{true};
};

//! Fails selected calls to the repository.
class CFailingIncidentRepository : public model::CInMemoryIncidentRepository {
public:
    TOptionalIncident incident(const std::string& id) const override {
        if (m_LookupsBeforeFailure.load() > 0 && --m_LookupsBeforeFailure == 0) {
            throw std::runtime_error("incident lookup failed");
        }
        return this->model::CInMemoryIncidentRepository::incident(id);
    }

    boost::optional<model_t::ERcaStatus>
    rcaStatus(const std::string& incidentId, model_t::ERcaStatus status) override {
        if (m_FailStatusUpdate.exchange(false)) {
            throw std::runtime_error("status update failed");
        }
        return this->model::CInMemoryIncidentRepository::rcaStatus(incidentId, status);
    }

    //! Fail the lookup after the next \p lookups succeed.
    void failLookupAfter(int lookups) { m_LookupsBeforeFailure.store(lookups + 1); }

    void failStatusUpdate() { m_FailStatusUpdate.store(true); }

private:
    mutable std::atomic<int> m_LookupsBeforeFailure{0};
    std::atomic<bool> m_FailStatusUpdate{false};
};

model::CRcaConfig synchronousConfig() {
    model::CRcaConfig config;
    config.engine().s_RunThreads = 0;
    return config;
}

model::SChangeEvent deployment(const std::string& id, core_t::TTime time) {
    model::SChangeEvent change;
    change.s_Service = "checkout";
    change.s_Time = time;
    change.s_Id = id;
    model::SDeploymentPayload payload;
    payload.s_Version = id;
    payload.s_DiffSummary = "bump client library";
    change.s_Payload = payload;
    return change;
}

model::SChangeEvent configChange(const std::string& id, core_t::TTime time) {
    model::SChangeEvent change;
    change.s_Service = "checkout";
    change.s_Time = time;
    change.s_Id = id;
    model::SConfigChangePayload payload;
    payload.s_Key = "db.pool_size";
    payload.s_OldValue = "20";
    payload.s_NewValue = "5";
    change.s_Payload = payload;
    return change;
}

//! Add two changes, an hour of normal error rates and then \p breaches
//! minutes of elevated error rates starting at INCIDENT_START.
//!
//! \return The time of the next sample.
core_t::TTime createIncident(api::CRcaEngine& engine, std::size_t breaches) {
    BOOST_TEST_REQUIRE(engine.addChange(deployment("d-1", INCIDENT_START - 10 * constants::MINUTE)));
    BOOST_TEST_REQUIRE(engine.addChange(configChange("cfg-1", INCIDENT_START - 5 * constants::MINUTE)));

    core_t::TTime time{START};
    for (std::size_t i = 0; i < 60; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(
            model::SMetricSample{"checkout", "error_rate", time, 98.0 + static_cast<double>(i % 5)}));
    }
    for (std::size_t i = 0; i < breaches; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "error_rate", time, 200.0}));
    }
    return time;
}

std::size_t countEvents(const api::CRcaEngine& engine, api::CActivityLog::EType type) {
    return engine.activity().eventsSince(0, api::CActivityLog::DEFAULT_LIMIT, type).size();
}

std::string persistedModel(const std::string& version) {
    model_t::TStrVec names{model::SEvidence::IS_BEFORE_INCIDENT,
                           model::SEvidence::TIME_PROXIMITY_SCORE};
    maths::CLogisticRegression regression;
    BOOST_TEST_REQUIRE(regression.parameters({0.5, 0.5}, {1.0, 1.0}, {0.5, 2.0}, -1.0));
    model::CRankingModel ranking{version, names, regression, 25, 0.9, START};
    std::ostringstream result;
    ranking.persist(result);
    return result.str();
}
}

BOOST_AUTO_TEST_CASE(testEndToEnd) {
    api::CRcaEngine engine{synchronousConfig()};

    core_t::TTime time{createIncident(engine, 5)};

    api::CRcaEngine::TIncidentVec incidents{engine.incidents()};
    BOOST_REQUIRE_EQUAL(1, incidents.size());
    const model::SIncident& incident = incidents[0];
    BOOST_REQUIRE_EQUAL("inc-1", incident.s_Id);
    BOOST_TEST_REQUIRE(incident.isOpen());
    BOOST_REQUIRE_EQUAL(INCIDENT_START, incident.s_Start);
    BOOST_REQUIRE_EQUAL(1, incident.s_Services.size());
    BOOST_REQUIRE_EQUAL("checkout", *incident.s_Services.begin());
    BOOST_REQUIRE_EQUAL(model_t::E_Completed, incident.s_RcaStatus);
    BOOST_REQUIRE_EQUAL(2, incident.s_SuspectsCount);
    BOOST_TEST_REQUIRE(incident.s_RcaFailed == false);

    api::CRcaEngine::TAnomalyVec anomalies{engine.anomalies("inc-1")};
    BOOST_REQUIRE_EQUAL(1, anomalies.size());
    BOOST_REQUIRE_EQUAL("error_rate", anomalies[0].s_Metric);
    BOOST_TEST_REQUIRE(anomalies[0].s_Open);

    // The configuration change is closer to the incident.
    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(2, suspects.size());
    BOOST_REQUIRE_EQUAL("cfg-1", suspects[0].s_Key);
    BOOST_REQUIRE_EQUAL(model_t::E_ConfigChange, suspects[0].s_Type);
    BOOST_REQUIRE_EQUAL(1, suspects[0].s_Rank);
    BOOST_REQUIRE_EQUAL("d-1", suspects[1].s_Key);
    BOOST_REQUIRE_EQUAL(2, suspects[1].s_Rank);
    BOOST_TEST_REQUIRE(suspects[0].s_Score >= suspects[1].s_Score);
    BOOST_REQUIRE_EQUAL(model::SSuspect::HEURISTIC, suspects[0].s_ScoredBy);

    BOOST_REQUIRE_EQUAL(1, countEvents(engine, api::CActivityLog::E_AnomalyDetected));
    BOOST_REQUIRE_EQUAL(1, countEvents(engine, api::CActivityLog::E_IncidentCreated));
    BOOST_TEST_REQUIRE(countEvents(engine, api::CActivityLog::E_SuspectsGenerated) >= 1);
    BOOST_REQUIRE_EQUAL(0, countEvents(engine, api::CActivityLog::E_RcaFailed));
    std::uint64_t started{core::CProgramCounters::counter(counter_t::E_RcaNumberRunsStarted)};
    BOOST_TEST_REQUIRE(started >= 1);
    BOOST_REQUIRE_EQUAL(started, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted));

    // Recovery closes the anomaly and, once quiet, the incident.
    for (std::size_t i = 0; i < 15; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "error_rate", time, 100.0}));
    }
    engine.tick(time + constants::HOUR);

    api::CRcaEngine::TOptionalIncident closed{engine.incident("inc-1")};
    BOOST_TEST_REQUIRE(closed != boost::none);
    BOOST_REQUIRE_EQUAL(model_t::E_Closed, closed->s_Status);
    BOOST_TEST_REQUIRE(closed->s_End != boost::none);
    BOOST_TEST_REQUIRE(engine.anomalies("inc-1")[0].s_Open == false);
    BOOST_REQUIRE_EQUAL(1, countEvents(engine, api::CActivityLog::E_IncidentClosed));
    BOOST_REQUIRE_EQUAL(time + constants::HOUR, engine.now());
}

BOOST_AUTO_TEST_CASE(testLabels) {
    api::CRcaEngine engine{synchronousConfig()};
    createIncident(engine, 3);

    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(2, suspects.size());

    BOOST_REQUIRE_EQUAL(1, engine.submitLabel("inc-1", suspects[1].s_Id, true, engine.now(),
                                              "oncall", "rolled back"));
    BOOST_REQUIRE_EQUAL(2, engine.submitLabel("inc-1", suspects[0].s_Id, false, engine.now()));
    BOOST_REQUIRE_EQUAL(2, engine.feedback().size());
    BOOST_REQUIRE_EQUAL(2, countEvents(engine, api::CActivityLog::E_LabelRecorded));

    model::TLabelVec labels{engine.feedback().labels()};
    BOOST_REQUIRE_EQUAL("d-1", labels[0].s_SuspectKey);
    BOOST_REQUIRE_EQUAL(model_t::E_Deployment, labels[0].s_SuspectType);
    BOOST_REQUIRE_EQUAL("checkout", labels[0].s_Service);
    BOOST_REQUIRE_EQUAL("oncall", labels[0].s_Annotator);

    // Labelling doesn't reorder the incident's own suspects, even on rerun.
    std::uint64_t cursor{engine.activity().lastSequence()};
    engine.rerun("inc-1");
    model::TSuspectVec rerun{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(suspects.size(), rerun.size());
    for (std::size_t i = 0; i < suspects.size(); ++i) {
        BOOST_REQUIRE_EQUAL(suspects[i].s_Id, rerun[i].s_Id);
        BOOST_REQUIRE_EQUAL(suspects[i].s_Rank, rerun[i].s_Rank);
        BOOST_REQUIRE_CLOSE(suspects[i].s_Score, rerun[i].s_Score, 1e-6);
    }
    BOOST_TEST_REQUIRE(engine.activity()
                           .eventsSince(cursor, api::CActivityLog::DEFAULT_LIMIT,
                                        api::CActivityLog::E_SuspectScoreUpdated)
                           .empty());

    // Too few labels to retrain.
    model::CRetrainer::SResult result{engine.retrain()};
    BOOST_REQUIRE_EQUAL(model::CRetrainer::E_InsufficientLabels, result.s_Outcome);
    BOOST_TEST_REQUIRE(engine.models().active() == nullptr);
}

BOOST_AUTO_TEST_CASE(testInvalidRequests) {
    api::CRcaEngine engine{synchronousConfig()};
    createIncident(engine, 1);
    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(2, suspects.size());

    BOOST_REQUIRE_THROW(engine.submitLabel("", suspects[0].s_Id, true, 0), model::CInvalidLabelError);
    BOOST_REQUIRE_THROW(engine.submitLabel("inc-1", "", true, 0), model::CInvalidLabelError);
    BOOST_REQUIRE_THROW(engine.submitLabel("inc-9", suspects[0].s_Id, true, 0),
                        model::CUnknownIncidentError);
    BOOST_REQUIRE_THROW(engine.submitLabel("inc-1", "inc-1:deployment:d-9", true, 0),
                        model::CUnknownSuspectError);
    BOOST_REQUIRE_THROW(engine.rerun("inc-9"), model::CUnknownIncidentError);
    BOOST_REQUIRE_EQUAL(0, engine.feedback().size());
}

BOOST_AUTO_TEST_CASE(testRejectedTelemetry) {
    api::CRcaEngine engine{synchronousConfig()};

    BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"", "error_rate", START, 1.0}) == false);
    BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "", START, 1.0}) == false);
    BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{
                           "checkout", "error_rate", START,
                           std::numeric_limits<double>::quiet_NaN()}) == false);
    BOOST_TEST_REQUIRE(engine.addLog(model::SLogEntry{}) == false);
    BOOST_TEST_REQUIRE(engine.addChange(deployment("", START)) == false);

    model::SChangeEvent unscoped{configChange("cfg-1", START)};
    unscoped.s_Service.clear();
    BOOST_TEST_REQUIRE(engine.addChange(unscoped) == false);

    // A flag change without a service applies everywhere.
    model::SChangeEvent flag;
    flag.s_Time = START;
    flag.s_Id = "new_checkout";
    flag.s_Payload = model::SFlagChangePayload{"new_checkout", "off", "on"};
    BOOST_TEST_REQUIRE(engine.addChange(flag));

    BOOST_REQUIRE_EQUAL(6, core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected));
    BOOST_REQUIRE_EQUAL(0, core::CProgramCounters::counter(counter_t::E_RcaNumberMetricSamples));
    BOOST_REQUIRE_EQUAL(START, engine.now());
}

BOOST_AUTO_TEST_CASE(testRunsCoalesce) {
    model::CRcaConfig config;
    config.engine().s_RunThreads = 1;
    auto store = std::make_shared<CGatedTelemetryStore>();
    {
        api::CRcaEngine engine{config, store};
        createIncident(engine, 1);

        // The first run is blocked so these both fold into one follow-up.
        engine.rerun("inc-1");
        engine.rerun("inc-1");
        BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCoalesced));

        store->open();
        engine.waitForIdle();

        BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsStarted));
        BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted));
        BOOST_REQUIRE_EQUAL(2, engine.suspects("inc-1").size());
        BOOST_REQUIRE_EQUAL(model_t::E_Completed, engine.incident("inc-1")->s_RcaStatus);
    }
}

BOOST_AUTO_TEST_CASE(testTimeoutRevertsStatus) {
    model::CRcaConfig config{synchronousConfig()};
    config.engine().s_RunTimeoutMs = 200;
    config.engine().s_MaximumConsecutiveFailures = 2;
    auto store = std::make_shared<CSlowTelemetryStore>();
    api::CRcaEngine engine{config, store};

    core_t::TTime time{createIncident(engine, 1)};

    api::CRcaEngine::TOptionalIncident incident{engine.incident("inc-1")};
    BOOST_TEST_REQUIRE(incident != boost::none);
    BOOST_REQUIRE_EQUAL(model_t::E_NotStarted, incident->s_RcaStatus);
    BOOST_TEST_REQUIRE(incident->s_RcaFailed == false);
    BOOST_TEST_REQUIRE(engine.suspects("inc-1").empty());
    BOOST_REQUIRE_EQUAL(1, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed));
    BOOST_REQUIRE_EQUAL(1, countEvents(engine, api::CActivityLog::E_RcaFailed));

    // The second consecutive failure suspends automatic analysis.
    engine.rerun("inc-1");
    BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed));
    BOOST_TEST_REQUIRE(engine.incident("inc-1")->s_RcaFailed);

    BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "error_rate", time, 220.0}));
    BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsStarted));

    // A manual rerun still runs and a success lifts the suspension.
    store->slow(false);
    engine.rerun("inc-1");
    incident = engine.incident("inc-1");
    BOOST_REQUIRE_EQUAL(3, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsStarted));
    BOOST_REQUIRE_EQUAL(model_t::E_Completed, incident->s_RcaStatus);
    BOOST_TEST_REQUIRE(incident->s_RcaFailed == false);
    BOOST_REQUIRE_EQUAL(2, engine.suspects("inc-1").size());
}

BOOST_AUTO_TEST_CASE(testLoadAndSaveModel) {
    api::CRcaEngine engine{synchronousConfig()};

    std::ostringstream none;
    BOOST_TEST_REQUIRE(engine.saveModel(none) == false);
    BOOST_TEST_REQUIRE(engine.loadModel("{\"version\":") == false);

    std::string json{persistedModel("v1")};
    BOOST_TEST_REQUIRE(engine.loadModel(json));
    BOOST_TEST_REQUIRE(engine.models().active() != nullptr);
    BOOST_REQUIRE_EQUAL("v1", engine.models().active()->version());
    BOOST_TEST_REQUIRE(engine.loadModel(json) == false);

    std::ostringstream saved;
    BOOST_TEST_REQUIRE(engine.saveModel(saved));
    BOOST_REQUIRE_EQUAL(json, saved.str());

    createIncident(engine, 1);
    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(2, suspects.size());
    for (const auto& suspect : suspects) {
        LOG_DEBUG(<< suspect.s_Key << " scored " << suspect.s_Score);
        BOOST_REQUIRE_EQUAL("v1", suspect.s_ScoredBy);
        BOOST_TEST_REQUIRE(suspect.s_Score > 0.0);
        BOOST_TEST_REQUIRE(suspect.s_Score < 1.0);
    }
    BOOST_REQUIRE_EQUAL("cfg-1", suspects[0].s_Key);
}

BOOST_AUTO_TEST_CASE(testClosedIncidentsReleaseTracking) {
    api::CRcaEngine engine{synchronousConfig()};

    core_t::TTime time{createIncident(engine, 3)};
    BOOST_REQUIRE_EQUAL(1, engine.numberTrackedAnomalies());
    BOOST_REQUIRE_EQUAL(1, engine.numberTrackedRuns());

    // Housekeeping closes the incident once the metric has been quiet long enough.
    for (std::size_t i = 0; i < 40; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "error_rate", time, 100.0}));
    }

    BOOST_REQUIRE_EQUAL(model_t::E_Closed, engine.incident("inc-1")->s_Status);
    BOOST_REQUIRE_EQUAL(0, engine.numberTrackedAnomalies());
    BOOST_REQUIRE_EQUAL(0, engine.numberTrackedRuns());

    // A manual rerun of a closed incident still runs and leaves nothing behind.
    std::uint64_t completed{core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted)};
    engine.rerun("inc-1");
    engine.waitForIdle();
    BOOST_REQUIRE_EQUAL(completed + 1,
                        core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted));
    BOOST_REQUIRE_EQUAL(2, engine.suspects("inc-1").size());
    BOOST_REQUIRE_EQUAL(0, engine.numberTrackedRuns());

    // A new episode opens a new incident which is tracked afresh.
    for (std::size_t i = 0; i < 3; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{"checkout", "error_rate", time, 250.0}));
    }
    BOOST_REQUIRE_EQUAL(2, engine.incidents().size());
    BOOST_REQUIRE_EQUAL(1, engine.numberTrackedAnomalies());
    BOOST_REQUIRE_EQUAL(1, engine.numberTrackedRuns());
}

BOOST_AUTO_TEST_CASE(testRecentDeploymentWithMetricShiftRanksFirst) {
    api::CRcaEngine engine{synchronousConfig()};

    // Three deployments on one service. Latency doubles only after the
    // most recent, five minutes before the incident starts.
    BOOST_TEST_REQUIRE(engine.addChange(deployment("d-50", INCIDENT_START - 50 * constants::MINUTE)));
    BOOST_TEST_REQUIRE(engine.addChange(deployment("d-15", INCIDENT_START - 15 * constants::MINUTE)));
    BOOST_TEST_REQUIRE(engine.addChange(deployment("d-5", INCIDENT_START - 5 * constants::MINUTE)));

    core_t::TTime time{START};
    for (std::size_t i = 0; time < INCIDENT_START; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{
            "checkout", "p95_latency_ms", time, 100.0 + static_cast<double>(i % 5)}));
    }
    for (std::size_t i = 0; i < 10; ++i, time += constants::MINUTE) {
        BOOST_TEST_REQUIRE(engine.addMetric(model::SMetricSample{
            "checkout", "p95_latency_ms", time, 200.0 + static_cast<double>(i % 5)}));
    }
    engine.flushPendingRuns();
    engine.waitForIdle();

    BOOST_REQUIRE_EQUAL(1, engine.incidents().size());
    BOOST_REQUIRE_EQUAL(INCIDENT_START, engine.incident("inc-1")->s_Start);

    model::TSuspectVec suspects{engine.suspects("inc-1")};
    BOOST_REQUIRE_EQUAL(3, suspects.size());
    BOOST_REQUIRE_EQUAL("d-5", suspects[0].s_Key);
    BOOST_REQUIRE_EQUAL("d-15", suspects[1].s_Key);
    BOOST_REQUIRE_EQUAL("d-50", suspects[2].s_Key);
    for (std::size_t i = 0; i < suspects.size(); ++i) {
        BOOST_REQUIRE_EQUAL(i + 1, suspects[i].s_Rank);
    }
    BOOST_TEST_REQUIRE(suspects[0].s_Score > suspects[1].s_Score);
    BOOST_TEST_REQUIRE(suspects[1].s_Score > suspects[2].s_Score);

    BOOST_REQUIRE_EQUAL(5.0, suspects[0].s_Evidence.s_MinutesBeforeIncident);
    BOOST_TEST_REQUIRE(suspects[0].s_Evidence.s_MetricDeltaCount >= 1);
    BOOST_TEST_REQUIRE(suspects[0].s_Evidence.s_MaxMetricDelta > 0.4);
    BOOST_REQUIRE_EQUAL(0, suspects[1].s_Evidence.s_MetricDeltaCount);
    BOOST_REQUIRE_EQUAL(0, suspects[2].s_Evidence.s_MetricDeltaCount);
}

BOOST_AUTO_TEST_CASE(testRepositoryFailuresReleaseTheRun) {
    auto repository = std::make_shared<CFailingIncidentRepository>();
    api::CRcaEngine engine{synchronousConfig(), nullptr, repository};

    createIncident(engine, 1);
    BOOST_REQUIRE_EQUAL(2, engine.suspects("inc-1").size());
    BOOST_REQUIRE_EQUAL(1, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted));

    // Failing to mark the run in progress fails just this run.
    repository->failStatusUpdate();
    BOOST_REQUIRE_NO_THROW(engine.rerun("inc-1"));
    BOOST_REQUIRE_EQUAL(1, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed));
    BOOST_REQUIRE_EQUAL(1, countEvents(engine, api::CActivityLog::E_RcaFailed));
    BOOST_REQUIRE_EQUAL(model_t::E_Completed, engine.incident("inc-1")->s_RcaStatus);

    // A failure before the run gets going must not leave it marked running.
    repository->failLookupAfter(1);
    BOOST_REQUIRE_NO_THROW(engine.rerun("inc-1"));
    BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed));
    engine.waitForIdle();

    engine.rerun("inc-1");
    engine.waitForIdle();
    BOOST_REQUIRE_EQUAL(0, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCoalesced));
    BOOST_REQUIRE_EQUAL(2, core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted));
    BOOST_REQUIRE_EQUAL(model_t::E_Completed, engine.incident("inc-1")->s_RcaStatus);
    BOOST_REQUIRE_EQUAL(2, engine.suspects("inc-1").size());
}

BOOST_AUTO_TEST_CASE(testAutomaticRetrainCountsLatestLabels) {
    model::CRcaConfig config{synchronousConfig()};
    config.feedback().s_MinimumLabels = 2;
    config.feedback().s_RetrainEvery = 2;
    {
        api::CRcaEngine engine{config};
        createIncident(engine, 1);
        model::TSuspectVec suspects{engine.suspects("inc-1")};
        BOOST_REQUIRE_EQUAL(2, suspects.size());

        // A relabelled suspect supersedes its earlier label so this is
        // still only one training example.
        engine.submitLabel("inc-1", suspects[0].s_Id, true, engine.now());
        engine.submitLabel("inc-1", suspects[0].s_Id, false, engine.now());
        BOOST_REQUIRE_EQUAL(2, engine.feedback().size());
        BOOST_REQUIRE_EQUAL(1, engine.feedback().latestLabels().size());

        engine.submitLabel("inc-1", suspects[1].s_Id, true, engine.now());
        BOOST_REQUIRE_EQUAL(2, engine.feedback().latestLabels().size());
    }
    BOOST_REQUIRE_EQUAL(1, core::CProgramCounters::counter(counter_t::E_RcaNumberRetrains));
}

BOOST_AUTO_TEST_SUITE_END()
