/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CIncidentRepository_h
#define INCLUDED_rca_model_CIncidentRepository_h

#include <model/CAnomaly.h>
#include <model/CIncident.h>
#include <model/CSuspect.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief Interface to the store of anomalies, incidents and suspects.
//!
//! DESCRIPTION:\n
//! Holds the records produced by analysis. Implementations must be safe
//! to use concurrently and replaceSuspects must be atomic: readers see
//! either the old or the new suspect set, never a mixture.
class MODEL_EXPORT CIncidentRepository {
public:
    using TAnomalyVec = std::vector<SAnomaly>;
    using TIncidentVec = std::vector<SIncident>;
    using TOptionalIncident = boost::optional<SIncident>;
    using TOptionalSuspect = boost::optional<SSuspect>;

public:
    virtual ~CIncidentRepository() = default;

    //! Insert or update an anomaly and record it against \p incidentId.
    virtual void upsertAnomaly(const std::string& incidentId, const SAnomaly& anomaly) = 0;

    //! Get the anomalies of \p incidentId ordered by start time.
    virtual TAnomalyVec anomalies(const std::string& incidentId) const = 0;

    //! Insert or update an incident.
    //!
    //! \note The analysis status, suspect count and failure flag are owned
    //! by the repository and are not overwritten by this call.
    virtual void upsertIncident(const SIncident& incident) = 0;

    virtual TOptionalIncident incident(const std::string& id) const = 0;

    //! Get every incident, most recent first.
    virtual TIncidentVec incidents() const = 0;

    //! Atomically replace the suspects of \p incidentId, mark its analysis
    //! complete and update its suspect count.
    //!
    //! \return False if the incident is unknown.
    virtual bool replaceSuspects(const std::string& incidentId, TSuspectVec suspects) = 0;

    //! Get the suspects of \p incidentId ordered by rank.
    virtual TSuspectVec suspects(const std::string& incidentId) const = 0;

    virtual TOptionalSuspect suspect(const std::string& incidentId,
                                     const std::string& suspectId) const = 0;

    //! Set the analysis status of \p incidentId.
    //!
    //! \return The previous status or none if the incident is unknown.
    virtual boost::optional<model_t::ERcaStatus>
    rcaStatus(const std::string& incidentId, model_t::ERcaStatus status) = 0;

    //! Set whether automatic analysis of \p incidentId has failed.
    virtual void rcaFailed(const std::string& incidentId, bool failed) = 0;
};

//! \brief A thread safe in-memory incident repository.
class MODEL_EXPORT CInMemoryIncidentRepository : public CIncidentRepository {
public:
    void upsertAnomaly(const std::string& incidentId, const SAnomaly& anomaly) override;
    TAnomalyVec anomalies(const std::string& incidentId) const override;
    void upsertIncident(const SIncident& incident) override;
    TOptionalIncident incident(const std::string& id) const override;
    TIncidentVec incidents() const override;
    bool replaceSuspects(const std::string& incidentId, TSuspectVec suspects) override;
    TSuspectVec suspects(const std::string& incidentId) const override;
    TOptionalSuspect suspect(const std::string& incidentId,
                             const std::string& suspectId) const override;
    boost::optional<model_t::ERcaStatus>
    rcaStatus(const std::string& incidentId, model_t::ERcaStatus status) override;
    void rcaFailed(const std::string& incidentId, bool failed) override;

private:
    using TStrAnomalyMap = std::map<std::string, SAnomaly>;
    using TStrStrAnomalyMapUMap = boost::unordered_map<std::string, TStrAnomalyMap>;
    using TStrIncidentUMap = boost::unordered_map<std::string, SIncident>;
    using TStrSuspectVecUMap = boost::unordered_map<std::string, TSuspectVec>;

private:
    mutable std::mutex m_Mutex;
    TStrStrAnomalyMapUMap m_Anomalies;
    TStrIncidentUMap m_Incidents;
    TStrSuspectVecUMap m_Suspects;
};

using TIncidentRepositoryPtr = std::shared_ptr<CIncidentRepository>;
}
}

#endif // INCLUDED_rca_model_CIncidentRepository_h
