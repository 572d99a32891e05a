/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CJsonOutputWriter_h
#define INCLUDED_rca_api_CJsonOutputWriter_h

#include <core/CNonCopyable.h>
#include <core/CRapidJsonLineWriter.h>

#include <model/CAnomaly.h>
#include <model/CEvidence.h>
#include <model/CIncident.h>
#include <model/CRankingModelRegistry.h>
#include <model/CSuspect.h>

#include <api/CActivityLog.h>
#include <api/CEvaluator.h>
#include <api/ImportExport.h>

#include <rapidjson/ostreamwrapper.h>

#include <iosfwd>

namespace rca {
namespace api {
class CRcaEngine;

//! \brief Writes analysis results as JSON.
//!
//! DESCRIPTION:\n
//! Writes a single JSON document holding every incident with its
//! anomalies and ranked suspects, the activity feed, the ranking model
//! versions and, optionally, the evaluation summary. Timestamps are
//! written as ISO 8601 strings.
class API_EXPORT CJsonOutputWriter : private core::CNonCopyable {
public:
    explicit CJsonOutputWriter(std::ostream& strmOut);

    //! Write the engine's results and, if supplied, \p evaluation.
    void writeResults(const CRcaEngine& engine, const CEvaluator::SSummary* evaluation = nullptr);

    //! \name Write individual records.
    //@{
    //! Write the fields of \p incident into the enclosing object.
    void writeIncident(const model::SIncident& incident);
    void writeAnomaly(const model::SAnomaly& anomaly);
    void writeSuspect(const model::SSuspect& suspect);
    void writeEvidence(const model::SEvidence& evidence);
    void writeEvent(const CActivityLog::SEvent& event);
    void writeModels(const model::CRankingModelRegistry& registry);
    void writeEvaluation(const CEvaluator::SSummary& evaluation);
    //@}

private:
    using TWriter = core::CRapidJsonLineWriter<rapidjson::OStreamWrapper>;

private:
    void writeOptionalDouble(const std::string& name, const CEvaluator::TOptionalDouble& value);

private:
    rapidjson::OStreamWrapper m_WriteStream;
    TWriter m_Writer;
};
}
}

#endif // INCLUDED_rca_api_CJsonOutputWriter_h
