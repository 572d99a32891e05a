/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CIncidentRepository.h>

#include <algorithm>

namespace rca {
namespace model {

void CInMemoryIncidentRepository::upsertAnomaly(const std::string& incidentId,
                                                const SAnomaly& anomaly) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_Anomalies[incidentId][anomaly.s_Id] = anomaly;
}

CIncidentRepository::TAnomalyVec
CInMemoryIncidentRepository::anomalies(const std::string& incidentId) const {
    TAnomalyVec result;
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        auto i = m_Anomalies.find(incidentId);
        if (i == m_Anomalies.end()) {
            return result;
        }
        for (const auto& anomaly : i->second) {
            result.push_back(anomaly.second);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const SAnomaly& lhs, const SAnomaly& rhs) {
        return lhs.s_Start < rhs.s_Start;
    });
    return result;
}

void CInMemoryIncidentRepository::upsertIncident(const SIncident& incident) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Incidents.find(incident.s_Id);
    if (i == m_Incidents.end()) {
        m_Incidents.emplace(incident.s_Id, incident);
        return;
    }
    SIncident updated{incident};
    updated.s_RcaStatus = i->second.s_RcaStatus;
    updated.s_SuspectsCount = i->second.s_SuspectsCount;
    updated.s_RcaFailed = i->second.s_RcaFailed;
    i->second = std::move(updated);
}

CIncidentRepository::TOptionalIncident
CInMemoryIncidentRepository::incident(const std::string& id) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Incidents.find(id);
    return i == m_Incidents.end() ? TOptionalIncident{} : TOptionalIncident{i->second};
}

CIncidentRepository::TIncidentVec CInMemoryIncidentRepository::incidents() const {
    TIncidentVec result;
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        result.reserve(m_Incidents.size());
        for (const auto& incident : m_Incidents) {
            result.push_back(incident.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const SIncident& lhs, const SIncident& rhs) {
        return lhs.s_Start != rhs.s_Start ? lhs.s_Start > rhs.s_Start : lhs.s_Id < rhs.s_Id;
    });
    return result;
}

bool CInMemoryIncidentRepository::replaceSuspects(const std::string& incidentId,
                                                  TSuspectVec suspects) {
    std::sort(suspects.begin(), suspects.end(), [](const SSuspect& lhs, const SSuspect& rhs) {
        return lhs.s_Rank < rhs.s_Rank;
    });

    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Incidents.find(incidentId);
    if (i == m_Incidents.end()) {
        return false;
    }
    i->second.s_RcaStatus = model_t::E_Completed;
    i->second.s_SuspectsCount = suspects.size();
    m_Suspects[incidentId] = std::move(suspects);
    return true;
}

TSuspectVec CInMemoryIncidentRepository::suspects(const std::string& incidentId) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Suspects.find(incidentId);
    return i == m_Suspects.end() ? TSuspectVec{} : i->second;
}

CIncidentRepository::TOptionalSuspect
CInMemoryIncidentRepository::suspect(const std::string& incidentId,
                                     const std::string& suspectId) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Suspects.find(incidentId);
    if (i == m_Suspects.end()) {
        return TOptionalSuspect{};
    }
    for (const auto& suspect : i->second) {
        if (suspect.s_Id == suspectId) {
            return suspect;
        }
    }
    return TOptionalSuspect{};
}

boost::optional<model_t::ERcaStatus>
CInMemoryIncidentRepository::rcaStatus(const std::string& incidentId, model_t::ERcaStatus status) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Incidents.find(incidentId);
    if (i == m_Incidents.end()) {
        return boost::none;
    }
    model_t::ERcaStatus previous{i->second.s_RcaStatus};
    i->second.s_RcaStatus = status;
    return previous;
}

void CInMemoryIncidentRepository::rcaFailed(const std::string& incidentId, bool failed) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Incidents.find(incidentId);
    if (i != m_Incidents.end()) {
        i->second.s_RcaFailed = failed;
    }
}
}
}
