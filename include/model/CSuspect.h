/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CSuspect_h
#define INCLUDED_rca_model_CSuspect_h

#include <core/CoreTypes.h>

#include <model/CEvidence.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <cstddef>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief A change event proposed as a possible cause of an incident.
struct MODEL_EXPORT SCandidate {
    std::string s_IncidentId;
    model_t::ESuspectType s_Type{model_t::E_Deployment};
    //! The change event identifier.
    std::string s_Key;
    core_t::TTime s_ChangeTime{0};
    //! The service the change applied to, empty for a global change.
    std::string s_Service;
    std::string s_PayloadText;
};

using TCandidateVec = std::vector<SCandidate>;

//! \brief A scored and ranked candidate.
//!
//! Ranks are 1..N without gaps per incident and every analysis run
//! replaces the whole set.
struct MODEL_EXPORT SSuspect {
    //! The scoring mode name used when no model produced the score.
    static const std::string HEURISTIC;

    //! Get the deterministic identifier of the suspect for \p candidate.
    static std::string makeId(const SCandidate& candidate);

    std::string s_Id;
    std::string s_IncidentId;
    model_t::ESuspectType s_Type{model_t::E_Deployment};
    std::string s_Key;
    std::string s_Service;
    core_t::TTime s_ChangeTime{0};
    std::size_t s_Rank{0};
    double s_Score{0.0};
    SEvidence s_Evidence;
    //! Either "heuristic" or the model version which scored this suspect.
    std::string s_ScoredBy;
};

using TSuspectVec = std::vector<SSuspect>;
}
}

#endif // INCLUDED_rca_model_CSuspect_h
