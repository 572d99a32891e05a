/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CRcaEngine_h
#define INCLUDED_rca_api_CRcaEngine_h

#include <core/CNonCopyable.h>
#include <core/CoreTypes.h>
#include <core/Concurrency.h>

#include <model/CAnomaly.h>
#include <model/CCandidateGenerator.h>
#include <model/CFeatureExtractor.h>
#include <model/CFeedbackStore.h>
#include <model/CIncident.h>
#include <model/CIncidentGrouper.h>
#include <model/CIncidentRepository.h>
#include <model/CMetricAnomalyDetector.h>
#include <model/CRankingModelRegistry.h>
#include <model/CRcaConfig.h>
#include <model/CRetrainer.h>
#include <model/CSuspect.h>
#include <model/CSuspectRanker.h>
#include <model/CTelemetryStore.h>
#include <model/CTelemetryTypes.h>

#include <api/CActivityLog.h>
#include <api/ImportExport.h>

#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace rca {
namespace core {
class CStopWatch;
}
namespace api {

//! \brief The root cause analysis engine.
//!
//! DESCRIPTION:\n
//! Wires the anomaly detector, incident grouper, candidate generator,
//! feature extractor, suspect ranker, feedback store and retrainer
//! together. Metric samples flow through the detector into the grouper;
//! every new or extended incident triggers an analysis run which
//! replaces the incident's suspects.
//!
//! Time is driven by the data: the engine's notion of now is the latest
//! telemetry timestamp it has seen, advanced further by tick.
//!
//! IMPLEMENTATION DECISIONS:\n
//! At most one analysis run is in flight per incident. A trigger which
//! arrives while a run is in progress is coalesced into a single follow-up
//! run. Runs are scheduled on a fixed size pool; with zero run threads
//! they execute synchronously on the calling thread, which makes replay
//! deterministic.
//!
//! Runs check a wall clock deadline between stages and after each
//! candidate extraction. A run which times out or fails reverts the
//! incident's analysis status. After a configured number of consecutive
//! failures the incident is flagged as failed and only a manual rerun
//! will analyse it again.
class API_EXPORT CRcaEngine : private core::CNonCopyable {
public:
    using TIncidentVec = model::CIncidentRepository::TIncidentVec;
    using TAnomalyVec = model::CIncidentRepository::TAnomalyVec;
    using TOptionalIncident = model::CIncidentRepository::TOptionalIncident;

    //! The interval between housekeeping passes driven by metric time.
    static const core_t::TTime HOUSEKEEPING_INTERVAL;

public:
    //! \param[in] config The engine configuration.
    //! \param[in] telemetry The telemetry store, in memory if null.
    //! \param[in] repository The incident repository, in memory if null.
    explicit CRcaEngine(const model::CRcaConfig& config,
                        model::TTelemetryStorePtr telemetry = nullptr,
                        model::TIncidentRepositoryPtr repository = nullptr);
    ~CRcaEngine();

    //! \name Ingestion
    //@{
    //! Add a metric sample.
    //!
    //! \return False if the sample was rejected.
    bool addMetric(const model::SMetricSample& sample);

    //! Add a log entry.
    bool addLog(const model::SLogEntry& entry);

    //! Add a change event.
    bool addChange(const model::SChangeEvent& change);
    //@}

    //! Record a human label for a suspect.
    //!
    //! \return The label's sequence number.
    //! \throws model::CInvalidLabelError if the identifiers are empty.
    //! \throws model::CUnknownIncidentError if the incident is unknown.
    //! \throws model::CUnknownSuspectError if the suspect is unknown.
    std::uint64_t submitLabel(const std::string& incidentId,
                              const std::string& suspectId,
                              bool isCause,
                              core_t::TTime time,
                              const std::string& annotator = std::string{},
                              const std::string& notes = std::string{});

    //! Rerun the analysis of an incident, even if automatic analysis of
    //! it has been suspended.
    //!
    //! \throws model::CUnknownIncidentError if the incident is unknown.
    void rerun(const std::string& incidentId);

    //! Advance time to \p now closing quiet anomalies and incidents and
    //! starting any debounced runs which are due.
    void tick(core_t::TTime now);

    //! Start every debounced run regardless of whether it is due.
    void flushPendingRuns();

    //! Block until no analysis run is in progress.
    void waitForIdle();

    //! \name Queries
    //@{
    TIncidentVec incidents() const;
    TOptionalIncident incident(const std::string& incidentId) const;
    TAnomalyVec anomalies(const std::string& incidentId) const;
    model::TSuspectVec suspects(const std::string& incidentId) const;
    const CActivityLog& activity() const;
    const model::CFeedbackStore& feedback() const;
    model::CRankingModelRegistry& models();
    const model::CRankingModelRegistry& models() const;
    const model::CRcaConfig& config() const;
    core_t::TTime now() const;
    //@}

    //! Retrain the ranking model on the calling thread.
    model::CRetrainer::SResult retrain();

    //! Start retraining in the background.
    //!
    //! \return False if a retrain is already in progress.
    bool retrainAsync();

    //! Restore a ranking model from its JSON representation and activate it.
    bool loadModel(const std::string& json);

    //! Write the active ranking model, if any, to \p strm.
    bool saveModel(std::ostream& strm) const;

    //! Get the number of anomaly identifiers of open incidents retained
    //! to detect new anomalies.
    std::size_t numberTrackedAnomalies() const;

    //! Get the number of incidents with retained analysis run state.
    std::size_t numberTrackedRuns() const;

private:
    struct SRunState {
        bool s_Running{false};
        bool s_Pending{false};
        bool s_PendingManual{false};
        //! Set when an update arrived inside the debounce interval.
        bool s_Dirty{false};
        bool s_HasTriggered{false};
        core_t::TTime s_LastTriggered{0};
        std::size_t s_ConsecutiveFailures{0};
        bool s_Suspended{false};
        //! Set when the incident is closed while work for it is outstanding.
        bool s_Closed{false};
    };
    using TStrRunStateUMap = boost::unordered_map<std::string, SRunState>;
    using TStrUSet = boost::unordered_set<std::string>;

private:
    void onAnomaly(const model::SAnomaly& anomaly);
    void onIncident(const model::SIncident& incident, model::CIncidentGrouper::EChange change);
    void onRetrained(const model::CRetrainer::SResult& result);

    //! Trigger a run unless one was started within the debounce interval.
    void triggerDebounced(const std::string& incidentId);

    //! Start a run or, if one is in progress, coalesce into a follow-up.
    void trigger(const std::string& incidentId, bool manual);

    //! Run the analysis repeatedly until no follow-up is pending.
    void runLoop(const std::string& incidentId);

    //! Run the analysis once.
    //!
    //! \return True if the run completed.
    bool runOnce(const std::string& incidentId);

    void checkDeadline(const core::CStopWatch& watch,
                       const std::string& incidentId,
                       const std::string& stage) const;

    void advance(core_t::TTime time);

private:
    model::CRcaConfig m_Config;
    model::TTelemetryStorePtr m_Telemetry;
    model::TIncidentRepositoryPtr m_Repository;
    CActivityLog m_Activity;
    model::CFeedbackStore m_Feedback;
    model::CRankingModelRegistry m_Registry;
    model::CCandidateGenerator m_Generator;
    model::CFeatureExtractor m_Extractor;
    model::CSuspectRanker m_Ranker;
    model::CIncidentGrouper m_Grouper;
    model::CMetricAnomalyDetector m_Detector;

    std::atomic<core_t::TTime> m_Now{0};
    std::atomic<core_t::TTime> m_NextHousekeeping{0};
    std::atomic<std::size_t> m_LabelsSinceRetrain{0};

    mutable std::mutex m_SeenMutex;
    TStrUSet m_SeenAnomalies;

    mutable std::mutex m_RunMutex;
    std::condition_variable m_IdleCondition;
    std::size_t m_ActiveRuns{0};
    TStrRunStateUMap m_RunStates;

    //! Declared last so they are destroyed first.
    std::unique_ptr<model::CRetrainer> m_Retrainer;
    core::TExecutorUPtr m_RunExecutor;
};
}
}

#endif // INCLUDED_rca_api_CRcaEngine_h
