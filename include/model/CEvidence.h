/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CEvidence_h
#define INCLUDED_rca_model_CEvidence_h

#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/optional.hpp>

#include <cstddef>
#include <string>

namespace rca {
namespace model {

//! \brief The evidence linking one candidate change to one incident.
//!
//! DESCRIPTION:\n
//! A fixed schema of named fields plus an open extension map for
//! detector specific values. Every field defaults to zero when it can't
//! be computed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Ranking models see the evidence as a vector in the order given by
//! featureNames(). Models record the names they were trained on so a
//! schema change is detected rather than silently misaligned.
struct MODEL_EXPORT SEvidence {
    using TOptionalDouble = boost::optional<double>;

    //! \name Field names.
    //@{
    static const std::string MINUTES_BEFORE_INCIDENT;
    static const std::string IS_BEFORE_INCIDENT;
    static const std::string METRIC_DELTA_COUNT;
    static const std::string MAX_METRIC_DELTA;
    static const std::string ERROR_LOG_DELTA;
    static const std::string NEW_ERROR_SIGNATURE;
    static const std::string DIFF_KEYWORD_HIT;
    static const std::string HISTORICAL_RISK;
    static const std::string TIME_PROXIMITY_SCORE;
    static const std::string AVG_METRIC_DELTA;
    static const std::string DIFF_KEYWORD_COUNT;
    static const std::string DIFF_LENGTH;
    //@}

    //! The ordered names of the features fed to ranking models.
    static const model_t::TStrVec& featureNames();

    //! Get the value of the field called \p name, fixed or extension.
    TOptionalDouble value(const std::string& name) const;

    //! Set the field called \p name. Unknown names go to the extension map.
    void value(const std::string& name, double value);

    //! Get the values of the fields called \p names, in order.
    //!
    //! \return False if any name is unknown.
    bool toFeatureVector(const model_t::TStrVec& names, model_t::TDoubleVec& result) const;

    //! Get all fields, fixed and extension, keyed by name.
    model_t::TStrDoubleMap toMap() const;

    double s_MinutesBeforeIncident{0.0};
    bool s_IsBeforeIncident{false};
    std::size_t s_MetricDeltaCount{0};
    double s_MaxMetricDelta{0.0};
    double s_ErrorLogDelta{0.0};
    bool s_NewErrorSignature{false};
    bool s_DiffKeywordHit{false};
    double s_HistoricalRisk{0.0};
    model_t::TStrDoubleMap s_Extensions;
};
}
}

#endif // INCLUDED_rca_model_CEvidence_h
