/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CRcaEngine.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CStopWatch.h>
#include <core/CStringUtils.h>

#include <model/CLabel.h>
#include <model/CRankingModel.h>
#include <model/CRcaError.h>
#include <model/ModelTypes.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <vector>

namespace rca {
namespace api {
namespace {
std::string affected(const model::SIncident& incident) {
    return core::CStringUtils::join(incident.s_Services, ",");
}

const double SCORE_TOLERANCE{1e-9};
}

const core_t::TTime CRcaEngine::HOUSEKEEPING_INTERVAL(constants::MINUTE);

CRcaEngine::CRcaEngine(const model::CRcaConfig& config,
                       model::TTelemetryStorePtr telemetry,
                       model::TIncidentRepositoryPtr repository)
    : m_Config(config),
      m_Telemetry(telemetry != nullptr ? std::move(telemetry)
                                       : std::make_shared<model::CInMemoryTelemetryStore>()),
      m_Repository(repository != nullptr
                       ? std::move(repository)
                       : std::make_shared<model::CInMemoryIncidentRepository>()),
      m_Activity(config.engine().s_ActivityCapacity),
      m_Generator(config.candidates(), m_Telemetry),
      m_Extractor(config.features(), m_Telemetry,
                  [this](model_t::ESuspectType type, const std::string& service,
                         const std::string& excludeIncidentId) {
                      return m_Feedback.historicalRisk(type, service, excludeIncidentId);
                  }),
      m_Ranker(config.ranker(), &m_Registry),
      m_Grouper(config.grouper(),
                [this](const model::SIncident& incident, model::CIncidentGrouper::EChange change) {
                    this->onIncident(incident, change);
                }),
      m_Detector(config.detector(),
                 [this](const model::SAnomaly& anomaly) { this->onAnomaly(anomaly); }),
      m_Retrainer(std::make_unique<model::CRetrainer>(
          config.feedback(), config.ranker(), m_Feedback, m_Registry,
          [this](const model::CRetrainer::SResult& result) { this->onRetrained(result); })),
      m_RunExecutor(core::makeExecutor(config.engine().s_RunThreads)) {
}

CRcaEngine::~CRcaEngine() {
    this->waitForIdle();
    m_Retrainer->wait();
}

bool CRcaEngine::addMetric(const model::SMetricSample& sample) {
    if (sample.s_Service.empty() || sample.s_Metric.empty()) {
        LOG_WARN(<< "Rejecting metric sample with missing service or metric at " << sample.s_Time);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
        return false;
    }
    if (std::isfinite(sample.s_Value) == false) {
        LOG_WARN(<< "Rejecting non-finite value for " << sample.s_Service << "/"
                 << sample.s_Metric << " at " << sample.s_Time);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
        return false;
    }

    m_Telemetry->addMetric(sample);
    m_Detector.addSample(sample);
    this->advance(sample.s_Time);
    return true;
}

bool CRcaEngine::addLog(const model::SLogEntry& entry) {
    if (entry.s_Service.empty()) {
        LOG_WARN(<< "Rejecting log entry with missing service at " << entry.s_Time);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
        return false;
    }
    m_Telemetry->addLog(entry);
    this->advance(entry.s_Time);
    return true;
}

bool CRcaEngine::addChange(const model::SChangeEvent& change) {
    if (change.s_Id.empty()) {
        LOG_WARN(<< "Rejecting " << model_t::print(change.type())
                 << " with missing identifier at " << change.s_Time);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
        return false;
    }
    if (change.s_Service.empty() && change.type() != model_t::E_FlagChange) {
        LOG_WARN(<< "Rejecting " << model_t::print(change.type()) << " '" << change.s_Id
                 << "' with missing service");
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
        return false;
    }
    m_Telemetry->addChange(change);
    this->advance(change.s_Time);
    return true;
}

std::uint64_t CRcaEngine::submitLabel(const std::string& incidentId,
                                      const std::string& suspectId,
                                      bool isCause,
                                      core_t::TTime time,
                                      const std::string& annotator,
                                      const std::string& notes) {
    if (incidentId.empty()) {
        throw model::CInvalidLabelError("missing incident identifier");
    }
    if (suspectId.empty()) {
        throw model::CInvalidLabelError("missing suspect identifier");
    }
    if (m_Repository->incident(incidentId) == boost::none) {
        throw model::CUnknownIncidentError(incidentId);
    }
    model::CIncidentRepository::TOptionalSuspect suspect{
        m_Repository->suspect(incidentId, suspectId)};
    if (suspect == boost::none) {
        throw model::CUnknownSuspectError(incidentId, suspectId);
    }

    model::SLabel label;
    label.s_IncidentId = incidentId;
    label.s_SuspectId = suspectId;
    label.s_IsCause = isCause;
    label.s_Time = time;
    label.s_Annotator = annotator;
    label.s_Notes = notes;
    label.s_SuspectType = suspect->s_Type;
    label.s_SuspectKey = suspect->s_Key;
    label.s_Service = suspect->s_Service;
    label.s_Evidence = suspect->s_Evidence;
    std::uint64_t sequence{m_Feedback.append(std::move(label))};

    LOG_DEBUG(<< "Recorded label " << sequence << " for " << suspectId << ": "
              << (isCause ? "cause" : "not cause"));
    m_Activity.record(time, CActivityLog::E_LabelRecorded, suspect->s_Service,
                      "Suspect " + suspect->s_Key + " labelled as " +
                          (isCause ? "the cause" : "not the cause"),
                      {{"incident_id", incidentId},
                       {"suspect_id", suspectId},
                       {"label", isCause ? "1" : "0"},
                       {"annotator", annotator}});

    const auto& feedback = m_Config.feedback();
    std::size_t sinceRetrain{++m_LabelsSinceRetrain};
    if (feedback.s_AutoRetrain && m_Feedback.latestLabels().size() >= feedback.s_MinimumLabels &&
        sinceRetrain >= std::max(feedback.s_RetrainEvery, std::size_t{1})) {
        if (m_Retrainer->retrainAsync(m_Now.load())) {
            m_LabelsSinceRetrain.store(0);
        }
    }

    return sequence;
}

void CRcaEngine::rerun(const std::string& incidentId) {
    if (m_Repository->incident(incidentId) == boost::none) {
        throw model::CUnknownIncidentError(incidentId);
    }
    LOG_INFO(<< "Manual rerun of " << incidentId);
    this->trigger(incidentId, true);
}

void CRcaEngine::tick(core_t::TTime now) {
    core_t::TTime latest{m_Now.load()};
    while (now > latest && m_Now.compare_exchange_weak(latest, now) == false) {
    }
    m_NextHousekeeping.store(now + HOUSEKEEPING_INTERVAL);

    m_Detector.flush(now);
    m_Grouper.closeQuietIncidents(now);

    model_t::TStrVec due;
    {
        std::lock_guard<std::mutex> lock{m_RunMutex};
        for (const auto& state : m_RunStates) {
            if (state.second.s_Dirty &&
                now - state.second.s_LastTriggered >= m_Config.engine().s_RerunDebounce) {
                due.push_back(state.first);
            }
        }
    }
    std::sort(due.begin(), due.end());
    for (const auto& incidentId : due) {
        this->trigger(incidentId, false);
    }
}

void CRcaEngine::flushPendingRuns() {
    model_t::TStrVec due;
    {
        std::lock_guard<std::mutex> lock{m_RunMutex};
        for (const auto& state : m_RunStates) {
            if (state.second.s_Dirty) {
                due.push_back(state.first);
            }
        }
    }
    std::sort(due.begin(), due.end());
    for (const auto& incidentId : due) {
        this->trigger(incidentId, false);
    }
}

void CRcaEngine::waitForIdle() {
    std::unique_lock<std::mutex> lock{m_RunMutex};
    m_IdleCondition.wait(lock, [this] { return m_ActiveRuns == 0; });
}

CRcaEngine::TIncidentVec CRcaEngine::incidents() const {
    return m_Repository->incidents();
}

CRcaEngine::TOptionalIncident CRcaEngine::incident(const std::string& incidentId) const {
    return m_Repository->incident(incidentId);
}

CRcaEngine::TAnomalyVec CRcaEngine::anomalies(const std::string& incidentId) const {
    return m_Repository->anomalies(incidentId);
}

model::TSuspectVec CRcaEngine::suspects(const std::string& incidentId) const {
    return m_Repository->suspects(incidentId);
}

const CActivityLog& CRcaEngine::activity() const {
    return m_Activity;
}

const model::CFeedbackStore& CRcaEngine::feedback() const {
    return m_Feedback;
}

model::CRankingModelRegistry& CRcaEngine::models() {
    return m_Registry;
}

const model::CRankingModelRegistry& CRcaEngine::models() const {
    return m_Registry;
}

const model::CRcaConfig& CRcaEngine::config() const {
    return m_Config;
}

core_t::TTime CRcaEngine::now() const {
    return m_Now.load();
}

model::CRetrainer::SResult CRcaEngine::retrain() {
    m_LabelsSinceRetrain.store(0);
    return m_Retrainer->retrain(m_Now.load());
}

bool CRcaEngine::retrainAsync() {
    if (m_Retrainer->retrainAsync(m_Now.load()) == false) {
        return false;
    }
    m_LabelsSinceRetrain.store(0);
    return true;
}

bool CRcaEngine::loadModel(const std::string& json) {
    model::CRankingModelRegistry::TRankingModelCPtr restored{model::CRankingModel::restore(json)};
    if (restored == nullptr) {
        LOG_ERROR(<< "Failed to restore ranking model");
        return false;
    }
    if (m_Registry.publish(restored) == false) {
        LOG_ERROR(<< "Failed to activate ranking model " << restored->version());
        return false;
    }
    LOG_INFO(<< "Loaded ranking model " << restored->version() << " trained on "
             << restored->trainedOn() << " labels");
    return true;
}

bool CRcaEngine::saveModel(std::ostream& strm) const {
    model::CRankingModelRegistry::TRankingModelCPtr active{m_Registry.active()};
    if (active == nullptr) {
        LOG_WARN(<< "No active ranking model to save");
        return false;
    }
    active->persist(strm);
    return strm.good();
}

std::size_t CRcaEngine::numberTrackedAnomalies() const {
    std::lock_guard<std::mutex> lock{m_SeenMutex};
    return m_SeenAnomalies.size();
}

std::size_t CRcaEngine::numberTrackedRuns() const {
    std::lock_guard<std::mutex> lock{m_RunMutex};
    return m_RunStates.size();
}

void CRcaEngine::onAnomaly(const model::SAnomaly& anomaly) {
    bool isNew{false};
    {
        std::lock_guard<std::mutex> lock{m_SeenMutex};
        isNew = m_SeenAnomalies.insert(anomaly.s_Id).second;
    }
    if (isNew) {
        m_Activity.record(m_Now.load(), CActivityLog::E_AnomalyDetected, anomaly.s_Service,
                          "Anomaly detected in " + anomaly.s_Metric + " for " + anomaly.s_Service,
                          {{"anomaly_id", anomaly.s_Id},
                           {"metric", anomaly.s_Metric},
                           {"score", core::CStringUtils::typeToStringPrecise(anomaly.s_Score, 4)}});
    }

    std::string incidentId{m_Grouper.addAnomaly(anomaly)};
    m_Repository->upsertAnomaly(incidentId, anomaly);
}

void CRcaEngine::onIncident(const model::SIncident& incident,
                            model::CIncidentGrouper::EChange change) {
    m_Repository->upsertIncident(incident);

    switch (change) {
    case model::CIncidentGrouper::E_Created:
        LOG_INFO(<< "Created " << incident.s_Id << ": " << incident.s_Title);
        m_Activity.record(m_Now.load(), CActivityLog::E_IncidentCreated, affected(incident),
                          incident.s_Title, {{"incident_id", incident.s_Id}});
        this->trigger(incident.s_Id, false);
        break;
    case model::CIncidentGrouper::E_Updated:
        this->triggerDebounced(incident.s_Id);
        break;
    case model::CIncidentGrouper::E_Closed:
        LOG_INFO(<< "Closed " << incident.s_Id);
        m_Activity.record(m_Now.load(), CActivityLog::E_IncidentClosed, affected(incident),
                          incident.s_Title + " closed", {{"incident_id", incident.s_Id}});
        {
            std::lock_guard<std::mutex> lock{m_SeenMutex};
            for (const auto& anomalyId : incident.s_AnomalyIds) {
                m_SeenAnomalies.erase(anomalyId);
            }
        }
        {
            std::lock_guard<std::mutex> lock{m_RunMutex};
            auto state = m_RunStates.find(incident.s_Id);
            if (state != m_RunStates.end()) {
                if (state->second.s_Running || state->second.s_Dirty) {
                    // The run loop drops the state once this work is done.
                    state->second.s_Closed = true;
                } else {
                    m_RunStates.erase(state);
                }
            }
        }
        break;
    }
}

void CRcaEngine::onRetrained(const model::CRetrainer::SResult& result) {
    if (result.s_Outcome != model::CRetrainer::E_Activated) {
        LOG_INFO(<< "Retraining on " << result.s_Labels
                 << " labels finished: " << model::CRetrainer::print(result.s_Outcome));
        return;
    }
    m_Activity.record(m_Now.load(), CActivityLog::E_ModelActivated, std::string{},
                      "Activated ranking model " + result.s_Version,
                      {{"version", result.s_Version},
                       {"labels", core::CStringUtils::typeToString(result.s_Labels)},
                       {"auc", core::CStringUtils::typeToStringPrecise(result.s_ModelAuc, 4)},
                       {"heuristic_auc",
                        core::CStringUtils::typeToStringPrecise(result.s_HeuristicAuc, 4)}});
}

void CRcaEngine::triggerDebounced(const std::string& incidentId) {
    {
        std::lock_guard<std::mutex> lock{m_RunMutex};
        SRunState& state = m_RunStates[incidentId];
        if (state.s_HasTriggered &&
            m_Now.load() - state.s_LastTriggered < m_Config.engine().s_RerunDebounce) {
            state.s_Dirty = true;
            return;
        }
    }
    this->trigger(incidentId, false);
}

void CRcaEngine::trigger(const std::string& incidentId, bool manual) {
    {
        std::lock_guard<std::mutex> lock{m_RunMutex};
        auto inserted = m_RunStates.emplace(incidentId, SRunState{});
        SRunState& state = inserted.first->second;
        if (inserted.second) {
            TOptionalIncident incident{m_Repository->incident(incidentId)};
            state.s_Closed = incident != boost::none && incident->isOpen() == false;
        }
        if (state.s_Suspended && manual == false) {
            LOG_DEBUG(<< "Automatic analysis of " << incidentId << " is suspended");
            state.s_Dirty = false;
            if (state.s_Closed && state.s_Running == false) {
                m_RunStates.erase(inserted.first);
            }
            return;
        }
        state.s_Dirty = false;
        state.s_HasTriggered = true;
        state.s_LastTriggered = m_Now.load();
        if (state.s_Running) {
            LOG_TRACE(<< "Coalescing analysis trigger for " << incidentId);
            state.s_Pending = true;
            state.s_PendingManual = state.s_PendingManual || manual;
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCoalesced);
            return;
        }
        state.s_Running = true;
        ++m_ActiveRuns;
    }
    m_RunExecutor->schedule([this, incidentId] { this->runLoop(incidentId); });
}

void CRcaEngine::runLoop(const std::string& incidentId) {
    for (;;) {
        bool completed{false};
        try {
            completed = this->runOnce(incidentId);
        } catch (const std::exception& e) {
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed);
            LOG_ERROR(<< "Root cause analysis of " << incidentId << " aborted: " << e.what());
        }

        std::lock_guard<std::mutex> lock{m_RunMutex};
        SRunState& state = m_RunStates[incidentId];
        if (completed) {
            state.s_ConsecutiveFailures = 0;
            if (state.s_Suspended || state.s_Closed) {
                state.s_Suspended = false;
                m_Repository->rcaFailed(incidentId, false);
            }
        } else {
            ++state.s_ConsecutiveFailures;
            std::size_t maximum{m_Config.engine().s_MaximumConsecutiveFailures};
            if (state.s_Suspended == false && maximum > 0 &&
                state.s_ConsecutiveFailures >= maximum) {
                LOG_ERROR(<< "Suspending automatic analysis of " << incidentId << " after "
                          << state.s_ConsecutiveFailures << " consecutive failures");
                state.s_Suspended = true;
                m_Repository->rcaFailed(incidentId, true);
            }
        }

        if (state.s_Pending && (state.s_Suspended == false || state.s_PendingManual)) {
            state.s_Pending = false;
            state.s_PendingManual = false;
            continue;
        }

        state.s_Pending = false;
        state.s_PendingManual = false;
        state.s_Running = false;
        if (state.s_Closed && state.s_Dirty == false) {
            m_RunStates.erase(incidentId);
        }
        --m_ActiveRuns;
        m_IdleCondition.notify_all();
        return;
    }
}

bool CRcaEngine::runOnce(const std::string& incidentId) {
    core::CStopWatch watch{true};

    TOptionalIncident incident{m_Repository->incident(incidentId)};
    if (incident == boost::none) {
        LOG_ERROR(<< "Unable to analyse unknown incident " << incidentId);
        return false;
    }

    boost::optional<model_t::ERcaStatus> previous;
    try {
        previous = m_Repository->rcaStatus(incidentId, model_t::E_InProgress);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRunsStarted);
        m_Activity.record(m_Now.load(), CActivityLog::E_RcaStarted, affected(*incident),
                          "Root cause analysis started for " + incident->s_Title,
                          {{"incident_id", incidentId}});

        model::TCandidateVec candidates{m_Generator.generate(*incident)};
        this->checkDeadline(watch, incidentId, "after candidate generation");

        std::uint64_t timeout{static_cast<std::uint64_t>(
            std::max(m_Config.engine().s_RunTimeoutMs, std::int64_t{0}))};
        model::CFeatureExtractor::TOptionalEvidenceVec evidence{m_Extractor.extractAll(
            *incident, candidates, [&watch, timeout] { return watch.lap() > timeout; })};
        this->checkDeadline(watch, incidentId, "during feature extraction");

        model::CSuspectRanker::TCandidateEvidencePrVec scored;
        scored.reserve(candidates.size());
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (evidence[i] != boost::none) {
                scored.emplace_back(candidates[i], *evidence[i]);
            }
        }
        model::CSuspectRanker::SResult result{m_Ranker.rank(scored)};
        this->checkDeadline(watch, incidentId, "during ranking");

        model::TSuspectVec previousSuspects{m_Repository->suspects(incidentId)};
        if (m_Repository->replaceSuspects(incidentId, result.s_Suspects) == false) {
            throw model::CUnknownIncidentError(incidentId);
        }
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRunsCompleted);

        LOG_INFO(<< "Generated " << result.s_Suspects.size() << " suspects for " << incidentId
                 << " from " << candidates.size() << " candidates in " << watch.stop()
                 << "ms scored by " << result.s_ScoredBy);
        m_Activity.record(
            m_Now.load(), CActivityLog::E_SuspectsGenerated, affected(*incident),
            "Generated " + core::CStringUtils::typeToString(result.s_Suspects.size()) +
                " suspects for " + incident->s_Title,
            {{"incident_id", incidentId},
             {"suspects_count", core::CStringUtils::typeToString(result.s_Suspects.size())},
             {"scored_by", result.s_ScoredBy},
             {"fallback", result.s_FellBack ? "true" : "false"}});

        for (const auto& suspect : result.s_Suspects) {
            auto old = std::find_if(previousSuspects.begin(), previousSuspects.end(),
                                    [&suspect](const model::SSuspect& candidate) {
                                        return candidate.s_Id == suspect.s_Id;
                                    });
            if (old == previousSuspects.end()) {
                continue;
            }
            if (old->s_Rank != suspect.s_Rank ||
                std::fabs(old->s_Score - suspect.s_Score) > SCORE_TOLERANCE) {
                m_Activity.record(
                    m_Now.load(), CActivityLog::E_SuspectScoreUpdated, suspect.s_Service,
                    "Suspect " + suspect.s_Key + " rescored",
                    {{"incident_id", incidentId},
                     {"suspect_id", suspect.s_Id},
                     {"old_rank", core::CStringUtils::typeToString(old->s_Rank)},
                     {"new_rank", core::CStringUtils::typeToString(suspect.s_Rank)},
                     {"old_score", core::CStringUtils::typeToStringPrecise(old->s_Score, 4)},
                     {"new_score", core::CStringUtils::typeToStringPrecise(suspect.s_Score, 4)}});
            }
        }
        return true;
    } catch (const std::exception& e) {
        if (previous != boost::none) {
            m_Repository->rcaStatus(incidentId, *previous);
        }
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberRunsFailed);
        LOG_ERROR(<< "Root cause analysis of " << incidentId << " failed: " << e.what());
        m_Activity.record(m_Now.load(), CActivityLog::E_RcaFailed, affected(*incident),
                          e.what(), {{"incident_id", incidentId}});
    }
    return false;
}

void CRcaEngine::checkDeadline(const core::CStopWatch& watch,
                               const std::string& incidentId,
                               const std::string& stage) const {
    std::int64_t elapsed{static_cast<std::int64_t>(watch.lap())};
    if (elapsed > m_Config.engine().s_RunTimeoutMs) {
        throw model::CRunTimeoutError(incidentId, stage);
    }
}

void CRcaEngine::advance(core_t::TTime time) {
    core_t::TTime latest{m_Now.load()};
    while (time > latest && m_Now.compare_exchange_weak(latest, time) == false) {
    }
    if (time >= m_NextHousekeeping.load()) {
        this->tick(time);
    }
}
}
}
