/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/ModelTypes.h>

#include <core/CStringUtils.h>

#include <array>

namespace rca {
namespace model_t {
namespace {
const std::array<std::string, 3> SUSPECT_TYPE_NAMES{"deployment", "config_change", "flag_change"};
const std::array<std::string, 2> INCIDENT_STATUS_NAMES{"OPEN", "CLOSED"};
const std::array<std::string, 3> RCA_STATUS_NAMES{"not_started", "in_progress", "completed"};
const std::array<std::string, 6> LOG_LEVEL_NAMES{"TRACE", "DEBUG", "INFO",
                                                 "WARN",  "ERROR", "FATAL"};
const std::array<std::string, 3> DIRECTION_NAMES{"up", "down", "both"};
const std::string UNKNOWN{"unknown"};

template<typename ENUM, std::size_t N>
const std::string& printEnum(ENUM value, const std::array<std::string, N>& names) {
    std::size_t index{static_cast<std::size_t>(value)};
    return index < N ? names[index] : UNKNOWN;
}
}

const std::string& print(ESuspectType type) {
    return printEnum(type, SUSPECT_TYPE_NAMES);
}

bool parseSuspectType(const std::string& name, ESuspectType& type) {
    std::string lower{core::CStringUtils::toLower(name)};
    for (std::size_t i = 0; i < SUSPECT_TYPE_NAMES.size(); ++i) {
        if (lower == SUSPECT_TYPE_NAMES[i]) {
            type = static_cast<ESuspectType>(i);
            return true;
        }
    }
    // The short names used by the change feeds.
    if (lower == "config") {
        type = E_ConfigChange;
        return true;
    }
    if (lower == "flag") {
        type = E_FlagChange;
        return true;
    }
    return false;
}

int suspectTypePriority(ESuspectType type) {
    switch (type) {
    case E_Deployment:
        return 3;
    case E_ConfigChange:
        return 2;
    case E_FlagChange:
        return 1;
    }
    return 0;
}

const std::string& print(EIncidentStatus status) {
    return printEnum(status, INCIDENT_STATUS_NAMES);
}

const std::string& print(ERcaStatus status) {
    return printEnum(status, RCA_STATUS_NAMES);
}

const std::string& print(ELogLevel level) {
    return printEnum(level, LOG_LEVEL_NAMES);
}

bool parseLogLevel(const std::string& name, ELogLevel& level) {
    std::string lower{core::CStringUtils::toLower(name)};
    if (lower == "warning") {
        level = E_WarnLevel;
        return true;
    }
    if (lower == "critical") {
        level = E_FatalLevel;
        return true;
    }
    for (std::size_t i = 0; i < LOG_LEVEL_NAMES.size(); ++i) {
        if (lower == core::CStringUtils::toLower(LOG_LEVEL_NAMES[i])) {
            level = static_cast<ELogLevel>(i);
            return true;
        }
    }
    return false;
}

bool isErrorLevel(ELogLevel level) {
    return level >= E_ErrorLevel;
}

const std::string& print(EDirection direction) {
    return printEnum(direction, DIRECTION_NAMES);
}

bool parseDirection(const std::string& name, EDirection& direction) {
    std::string lower{core::CStringUtils::toLower(name)};
    for (std::size_t i = 0; i < DIRECTION_NAMES.size(); ++i) {
        if (lower == DIRECTION_NAMES[i]) {
            direction = static_cast<EDirection>(i);
            return true;
        }
    }
    return false;
}
}
}
