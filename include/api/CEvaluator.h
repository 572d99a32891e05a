/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CEvaluator_h
#define INCLUDED_rca_api_CEvaluator_h

#include <model/CAnomaly.h>
#include <model/CIncident.h>
#include <model/CLabel.h>
#include <model/CSuspect.h>

#include <api/ImportExport.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace rca {
namespace api {
class CRcaEngine;

//! \brief Offline quality metrics for the suspect rankings.
//!
//! DESCRIPTION:\n
//! For every labelled incident finds the rank of the best ranked suspect
//! labelled as the cause and reports precision at one and three and the
//! mean reciprocal rank over the incidents which have a labelled cause.
//! Also reports the time from incident start to first anomaly.
class API_EXPORT CEvaluator {
public:
    using TOptionalDouble = boost::optional<double>;
    using TAnomalyVec = std::vector<model::SAnomaly>;

    struct API_EXPORT SIncidentResult {
        std::string s_IncidentId;
        bool s_HasTrueCause{false};
        //! Zero if the cause was not among the suspects.
        std::size_t s_TrueCauseRank{0};
        TOptionalDouble s_TimeToDetectMinutes;
    };
    using TIncidentResultVec = std::vector<SIncidentResult>;

    struct API_EXPORT SSummary {
        std::size_t s_NumberIncidents{0};
        std::size_t s_NumberWithTrueCause{0};
        TOptionalDouble s_PrecisionAt1;
        TOptionalDouble s_PrecisionAt3;
        TOptionalDouble s_MeanReciprocalRank;
        TOptionalDouble s_MeanTimeToDetectMinutes;
        TIncidentResultVec s_Incidents;
    };

public:
    //! Evaluate one incident against the latest labels.
    static SIncidentResult evaluate(const model::SIncident& incident,
                                    const model::TSuspectVec& suspects,
                                    const TAnomalyVec& anomalies,
                                    const model::TLabelVec& latestLabels);

    //! Evaluate every labelled incident known to \p engine.
    static SSummary evaluate(const CRcaEngine& engine);

    //! Average the per incident results.
    static SSummary summarise(TIncidentResultVec results);
};
}
}

#endif // INCLUDED_rca_api_CEvaluator_h
