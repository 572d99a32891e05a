/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CTelemetryRecordHandler_h
#define INCLUDED_rca_api_CTelemetryRecordHandler_h

#include <core/CoreTypes.h>

#include <model/CTelemetryTypes.h>

#include <api/ImportExport.h>

#include <rapidjson/document.h>

#include <cstddef>
#include <string>

namespace rca {
namespace api {
class CRcaEngine;

//! \brief Routes decoded input records to the engine.
//!
//! DESCRIPTION:\n
//! Each record is a JSON object with a "type" field naming one of metric,
//! log, deployment, config_change, flag_change, label, rerun or tick.
//! Timestamps ("ts") may be ISO 8601 strings or numeric epoch seconds.
//!
//! Records which fail validation are logged, counted as rejected and
//! skipped; handleRecord only returns false if processing must stop.
class API_EXPORT CTelemetryRecordHandler {
public:
    explicit CTelemetryRecordHandler(CRcaEngine& engine);

    //! Dispatch \p record to the engine.
    bool handleRecord(const rapidjson::Value& record);

    //! Get the number of records which were rejected.
    std::size_t numberRejected() const;

    //! Get the number of records dispatched to the engine.
    std::size_t numberHandled() const;

    //! \name Decoders
    //@{
    static bool decodeTime(const rapidjson::Value& record, core_t::TTime& time);
    static bool decodeMetric(const rapidjson::Value& record, model::SMetricSample& sample);
    static bool decodeLog(const rapidjson::Value& record, model::SLogEntry& entry);
    static bool decodeDeployment(const rapidjson::Value& record, model::SChangeEvent& change);
    static bool decodeConfigChange(const rapidjson::Value& record, model::SChangeEvent& change);
    static bool decodeFlagChange(const rapidjson::Value& record, model::SChangeEvent& change);
    //@}

private:
    bool handleLabel(const rapidjson::Value& record);
    bool handleRerun(const rapidjson::Value& record);
    bool handleTick(const rapidjson::Value& record);
    void reject(const std::string& type, const std::string& reason);

private:
    CRcaEngine& m_Engine;
    std::size_t m_Handled{0};
    std::size_t m_Rejected{0};
};
}
}

#endif // INCLUDED_rca_api_CTelemetryRecordHandler_h
