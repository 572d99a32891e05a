/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CAnomaly_h
#define INCLUDED_rca_model_CAnomaly_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <string>

namespace rca {
namespace model {

//! \brief The statistics which justified flagging an anomaly.
struct MODEL_EXPORT SAnomalyDetails {
    double s_BaselineMedian{0.0};
    double s_BaselineSpread{0.0};
    model_t::EDirection s_Direction{model_t::E_Up};
    //! The evaluation window aggregate at the most extreme breach.
    double s_Aggregate{0.0};
    double s_Threshold{0.0};
};

//! \brief A contiguous episode of abnormal behaviour of one metric.
//!
//! DESCRIPTION:\n
//! Created by the detector at the first breaching sample. The end time is
//! extended while breaches continue and the open flag is cleared when the
//! episode is closed. Nothing else is mutated.
struct MODEL_EXPORT SAnomaly {
    //! Get the deterministic identifier of an episode.
    static std::string makeId(const std::string& service,
                              const std::string& metric,
                              core_t::TTime start);

    std::string s_Id;
    std::string s_Service;
    std::string s_Metric;
    core_t::TTime s_Start{0};
    core_t::TTime s_End{0};
    //! The largest absolute robust z-score seen in the episode.
    double s_Score{0.0};
    std::string s_Detector;
    bool s_Open{true};
    SAnomalyDetails s_Details;
};
}
}

#endif // INCLUDED_rca_model_CAnomaly_h
