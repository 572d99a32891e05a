/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CRcaError_h
#define INCLUDED_rca_model_CRcaError_h

#include <model/ImportExport.h>

#include <stdexcept>
#include <string>

namespace rca {
namespace model {

//! \brief The base of errors raised when a caller breaks a contract of
//! the analysis API.
class MODEL_EXPORT CRcaError : public std::runtime_error {
public:
    explicit CRcaError(const std::string& what) : std::runtime_error(what) {}
};

//! \brief Raised when a request names an incident which doesn't exist.
class MODEL_EXPORT CUnknownIncidentError : public CRcaError {
public:
    explicit CUnknownIncidentError(const std::string& incidentId)
        : CRcaError("Unknown incident '" + incidentId + "'") {}
};

//! \brief Raised when a request names a suspect which doesn't exist.
class MODEL_EXPORT CUnknownSuspectError : public CRcaError {
public:
    CUnknownSuspectError(const std::string& incidentId, const std::string& suspectId)
        : CRcaError("Unknown suspect '" + suspectId + "' for incident '" + incidentId + "'") {}
};

//! \brief Raised for a label which can't be recorded.
class MODEL_EXPORT CInvalidLabelError : public CRcaError {
public:
    explicit CInvalidLabelError(const std::string& what)
        : CRcaError("Invalid label: " + what) {}
};

//! \brief Raised when an analysis run exceeds its deadline.
class MODEL_EXPORT CRunTimeoutError : public CRcaError {
public:
    CRunTimeoutError(const std::string& incidentId, const std::string& stage)
        : CRcaError("Analysis of '" + incidentId + "' timed out " + stage) {}
};

//! \brief Raised when evidence doesn't match a ranking model's schema.
class MODEL_EXPORT CModelSchemaError : public CRcaError {
public:
    explicit CModelSchemaError(const std::string& what) : CRcaError(what) {}
};
}
}

#endif // INCLUDED_rca_model_CRcaError_h
