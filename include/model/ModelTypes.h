/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_t_ModelTypes_h
#define INCLUDED_rca_model_t_ModelTypes_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rca {
namespace model_t {

using TStrVec = std::vector<std::string>;
using TStrSet = std::set<std::string>;
using TDoubleVec = std::vector<double>;
using TStrDoubleMap = std::map<std::string, double>;
using TStrStrMap = std::map<std::string, std::string>;

//! The kinds of change event which can be proposed as a cause.
//!
//! The order is the tie-break priority used by the ranker: lower values
//! win, so deployments outrank config changes which outrank flag flips.
enum ESuspectType { E_Deployment = 0, E_ConfigChange = 1, E_FlagChange = 2 };

//! Get the wire name of \p type, e.g. "config_change".
MODEL_EXPORT
const std::string& print(ESuspectType type);

//! Parse a wire name into \p type.
MODEL_EXPORT
bool parseSuspectType(const std::string& name, ESuspectType& type);

//! The priority of \p type when breaking ties, larger is preferred.
MODEL_EXPORT
int suspectTypePriority(ESuspectType type);

//! The lifecycle of an incident. CLOSED is terminal.
enum EIncidentStatus { E_Open, E_Closed };

MODEL_EXPORT
const std::string& print(EIncidentStatus status);

//! The progress of root cause analysis for an incident.
enum ERcaStatus { E_NotStarted, E_InProgress, E_Completed };

MODEL_EXPORT
const std::string& print(ERcaStatus status);

//! Log levels understood at the ingestion boundary.
enum ELogLevel { E_TraceLevel, E_DebugLevel, E_InfoLevel, E_WarnLevel, E_ErrorLevel, E_FatalLevel };

MODEL_EXPORT
const std::string& print(ELogLevel level);

//! Parse a log level case insensitively.  Accepts the common aliases
//! "warning" and "critical".
MODEL_EXPORT
bool parseLogLevel(const std::string& name, ELogLevel& level);

//! Is \p level at least error severity?
MODEL_EXPORT
bool isErrorLevel(ELogLevel level);

//! The direction in which a metric moving is harmful.
enum EDirection { E_Up, E_Down, E_Both };

MODEL_EXPORT
const std::string& print(EDirection direction);

MODEL_EXPORT
bool parseDirection(const std::string& name, EDirection& direction);
}
}

#endif // INCLUDED_rca_model_t_ModelTypes_h
