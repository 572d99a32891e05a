/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CActivityLog.h>

#include <core/CLogger.h>

#include <algorithm>
#include <array>

namespace rca {
namespace api {
namespace {
const std::array<std::string, 9> TYPE_NAMES{
    "anomaly_detected",      "incident_created", "incident_closed",
    "rca_started",           "suspects_generated", "suspect_score_updated",
    "rca_failed",            "label_recorded",   "model_activated"};
const std::string UNKNOWN{"unknown"};
}

const std::size_t CActivityLog::DEFAULT_LIMIT(250);

CActivityLog::CActivityLog(std::size_t capacity) : m_Events(std::max(capacity, std::size_t{1})) {
}

std::uint64_t CActivityLog::record(core_t::TTime time,
                                   EType type,
                                   const std::string& service,
                                   const std::string& message,
                                   TStrStrMap metadata) {
    SEvent event;
    event.s_Time = time;
    event.s_Type = type;
    event.s_Service = service;
    event.s_Message = message;
    event.s_Metadata = std::move(metadata);

    LOG_TRACE(<< print(type) << " " << service << ": " << message);

    std::lock_guard<std::mutex> lock{m_Mutex};
    event.s_Sequence = ++m_LastSequence;
    m_Events.push_back(std::move(event));
    return m_LastSequence;
}

CActivityLog::TEventVec
CActivityLog::eventsSince(std::uint64_t cursor, std::size_t limit, TOptionalType type) const {
    TEventVec result;
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = std::upper_bound(m_Events.begin(), m_Events.end(), cursor,
                              [](std::uint64_t sequence, const SEvent& event) {
                                  return sequence < event.s_Sequence;
                              });
    for (/**/; i != m_Events.end() && result.size() < limit; ++i) {
        if (!type || i->s_Type == *type) {
            result.push_back(*i);
        }
    }
    return result;
}

CActivityLog::TEventVec CActivityLog::eventsAfter(core_t::TTime time, std::size_t limit) const {
    TEventVec result;
    std::lock_guard<std::mutex> lock{m_Mutex};
    for (auto i = m_Events.begin(); i != m_Events.end() && result.size() < limit; ++i) {
        if (i->s_Time >= time) {
            result.push_back(*i);
        }
    }
    return result;
}

std::uint64_t CActivityLog::lastSequence() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_LastSequence;
}

const std::string& CActivityLog::print(EType type) {
    std::size_t index{static_cast<std::size_t>(type)};
    return index < TYPE_NAMES.size() ? TYPE_NAMES[index] : UNKNOWN;
}

bool CActivityLog::parse(const std::string& name, EType& type) {
    auto i = std::find(TYPE_NAMES.begin(), TYPE_NAMES.end(), name);
    if (i == TYPE_NAMES.end()) {
        return false;
    }
    type = static_cast<EType>(i - TYPE_NAMES.begin());
    return true;
}
}
}
