/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CTelemetryTypes_h
#define INCLUDED_rca_model_CTelemetryTypes_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/variant.hpp>

#include <string>

namespace rca {
namespace model {

//! \brief A single observation of a service metric.
struct MODEL_EXPORT SMetricSample {
    std::string s_Service;
    std::string s_Metric;
    core_t::TTime s_Time{0};
    double s_Value{0.0};
};

//! \brief A structured log line.
//!
//! The signature identifies the log statement or error class independently
//! of the variable parts of the message.
struct MODEL_EXPORT SLogEntry {
    std::string s_Service;
    core_t::TTime s_Time{0};
    model_t::ELogLevel s_Level{model_t::E_InfoLevel};
    std::string s_Signature;
    std::string s_Message;
    std::string s_TraceId;
};

struct MODEL_EXPORT SDeploymentPayload {
    std::string s_CommitSha;
    std::string s_Version;
    std::string s_Author;
    std::string s_DiffSummary;
};

struct MODEL_EXPORT SConfigChangePayload {
    std::string s_Key;
    std::string s_OldValue;
    std::string s_NewValue;
    std::string s_DiffSummary;
    std::string s_Source;
};

struct MODEL_EXPORT SFlagChangePayload {
    std::string s_FlagName;
    std::string s_OldState;
    std::string s_NewState;
};

//! \brief A discrete change to the running system.
//!
//! DESCRIPTION:\n
//! A deployment, configuration change or feature flag flip. The variant
//! payload selects the kind. Change events are immutable once ingested.
//!
//! A flag change with an empty service applies to every service.
struct MODEL_EXPORT SChangeEvent {
    using TPayload = boost::variant<SDeploymentPayload, SConfigChangePayload, SFlagChangePayload>;

    //! The kind of change, derived from the payload.
    model_t::ESuspectType type() const;

    //! The text searched for risk keywords.
    std::string payloadText() const;

    //! True if this change applies to every service.
    bool isGlobal() const;

    std::string s_Service;
    core_t::TTime s_Time{0};
    //! The identifier, e.g. the deployment id or flag name.
    std::string s_Id;
    TPayload s_Payload;
};
}
}

#endif // INCLUDED_rca_model_CTelemetryTypes_h
