/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CLabel_h
#define INCLUDED_rca_model_CLabel_h

#include <core/CoreTypes.h>

#include <model/CEvidence.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <cstdint>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief A human judgement of whether a suspect caused its incident.
//!
//! DESCRIPTION:\n
//! Labels are append only. The suspect's type, key, service and evidence
//! are captured at submission so training data survives later analysis
//! runs replacing the suspect set.
struct MODEL_EXPORT SLabel {
    std::string s_IncidentId;
    std::string s_SuspectId;
    bool s_IsCause{false};
    core_t::TTime s_Time{0};
    std::string s_Annotator;
    std::string s_Notes;
    //! Assigned by the feedback store in submission order.
    std::uint64_t s_Sequence{0};

    model_t::ESuspectType s_SuspectType{model_t::E_Deployment};
    std::string s_SuspectKey;
    std::string s_Service;
    SEvidence s_Evidence;
};

using TLabelVec = std::vector<SLabel>;
}
}

#endif // INCLUDED_rca_model_CLabel_h
