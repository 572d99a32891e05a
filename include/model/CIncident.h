/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CIncident_h
#define INCLUDED_rca_model_CIncident_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <string>

namespace rca {
namespace model {

//! \brief A group of related anomalies believed to share one cause.
//!
//! DESCRIPTION:\n
//! The end time is unset while any contributing anomaly is still open.
//! Once closed an incident is never reopened.
struct MODEL_EXPORT SIncident {
    using TOptionalTime = boost::optional<core_t::TTime>;

    bool isOpen() const { return s_Status == model_t::E_Open; }

    std::string s_Id;
    std::string s_Title;
    model_t::EIncidentStatus s_Status{model_t::E_Open};
    core_t::TTime s_Start{0};
    TOptionalTime s_End;
    std::string s_Summary;
    model_t::TStrSet s_AnomalyIds;
    //! The implicated services.
    model_t::TStrSet s_Services;
    model_t::TStrSet s_Metrics;
    std::string s_CorrelationKey;
    //! The latest time any contributing anomaly was extended.
    core_t::TTime s_LastActivity{0};
    model_t::ERcaStatus s_RcaStatus{model_t::E_NotStarted};
    std::size_t s_SuspectsCount{0};
    //! Set when automatic analysis has been suspended after repeated failures.
    bool s_RcaFailed{false};
};
}
}

#endif // INCLUDED_rca_model_CIncident_h
