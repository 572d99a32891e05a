/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CIncidentGrouper_h
#define INCLUDED_rca_model_CIncidentGrouper_h

#include <core/CNonCopyable.h>
#include <core/CoreTypes.h>

#include <model/CAnomaly.h>
#include <model/CIncident.h>
#include <model/CRcaConfig.h>
#include <model/ImportExport.h>

#include <boost/unordered_map.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rca {
namespace model {

//! \brief Groups related anomalies into incidents.
//!
//! DESCRIPTION:\n
//! An anomaly joins an open incident with the same correlation key if
//! its span overlaps the incident's active window widened by the grace
//! margin. The active window of an incident with any open anomaly extends
//! indefinitely. Otherwise the anomaly opens a new incident.
//!
//! An incident closes once none of its anomalies is open and none has
//! been extended for the quiet period. Closure is final: updates to an
//! anomaly of a closed incident are grouped afresh.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each correlation key has its own lock so distinct keys are grouped in
//! parallel and each incident has a single writer. The lock is held while
//! the callback runs so changes to one incident are seen in order.
class MODEL_EXPORT CIncidentGrouper : private core::CNonCopyable {
public:
    //! The kinds of incident change published.
    enum EChange { E_Created, E_Updated, E_Closed };

    using TIncidentCallback = std::function<void(const SIncident&, EChange)>;

public:
    CIncidentGrouper(CRcaConfig::SGrouper config, TIncidentCallback callback);

    //! Group a new or updated anomaly.
    //!
    //! \return The identifier of the incident it belongs to.
    std::string addAnomaly(const SAnomaly& anomaly);

    //! Close every incident which has been quiet since before \p now
    //! less the quiet period.
    void closeQuietIncidents(core_t::TTime now);

    //! Get the number of open incidents.
    std::size_t numberOpenIncidents() const;

    //! Get the title for an incident implicating \p services.
    static std::string title(const model_t::TStrSet& services);

private:
    using TStrTimeMap = std::map<std::string, core_t::TTime>;

    struct SIncidentState {
        SIncident s_Incident;
        //! The end time of every anomaly, keyed by anomaly id.
        TStrTimeMap s_AnomalyEnds;
        model_t::TStrSet s_OpenAnomalies;
    };
    using TStrIncidentStateMap = std::map<std::string, SIncidentState>;
    using TStrStrUMap = boost::unordered_map<std::string, std::string>;

    struct SGroup {
        std::mutex s_Mutex;
        //! The open incidents, keyed by id.
        TStrIncidentStateMap s_Incidents;
        //! The incident each anomaly of an open incident belongs to.
        TStrStrUMap s_AnomalyIncidents;
    };
    using TGroupPtr = std::shared_ptr<SGroup>;
    using TStrGroupPtrUMap = boost::unordered_map<std::string, TGroupPtr>;

private:
    TGroupPtr group(const std::string& key);

    //! Does \p anomaly overlap the active window of \p state?
    bool overlaps(const SIncidentState& state, const SAnomaly& anomaly) const;

    //! Merge \p anomaly into \p state and recompute the derived fields.
    static void merge(SIncidentState& state, const SAnomaly& anomaly);

    std::string nextId();

    void publish(const SIncident& incident, EChange change) const;

private:
    CRcaConfig::SGrouper m_Config;
    TIncidentCallback m_Callback;
    std::atomic<std::uint64_t> m_NextId{0};
    mutable std::mutex m_GroupsMutex;
    TStrGroupPtrUMap m_Groups;
};
}
}

#endif // INCLUDED_rca_model_CIncidentGrouper_h
