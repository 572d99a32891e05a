/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CIncidentGrouper.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <algorithm>
#include <limits>
#include <vector>

namespace rca {
namespace model {

CIncidentGrouper::CIncidentGrouper(CRcaConfig::SGrouper config, TIncidentCallback callback)
    : m_Config{std::move(config)}, m_Callback{std::move(callback)} {
}

std::string CIncidentGrouper::addAnomaly(const SAnomaly& anomaly) {
    std::string key{m_Config.correlationKey(anomaly.s_Service)};
    TGroupPtr group{this->group(key)};
    std::lock_guard<std::mutex> lock{group->s_Mutex};

    auto known = group->s_AnomalyIncidents.find(anomaly.s_Id);
    if (known != group->s_AnomalyIncidents.end()) {
        SIncidentState& state = group->s_Incidents[known->second];
        merge(state, anomaly);
        this->publish(state.s_Incident, E_Updated);
        return state.s_Incident.s_Id;
    }

    // Prefer the most recently active incident if several overlap.
    SIncidentState* target{nullptr};
    for (auto& incident : group->s_Incidents) {
        SIncidentState& state = incident.second;
        if (this->overlaps(state, anomaly) &&
            (target == nullptr ||
             state.s_Incident.s_LastActivity > target->s_Incident.s_LastActivity)) {
            target = &state;
        }
    }

    if (target != nullptr) {
        merge(*target, anomaly);
        group->s_AnomalyIncidents[anomaly.s_Id] = target->s_Incident.s_Id;
        LOG_DEBUG(<< "Attached " << anomaly.s_Id << " to " << target->s_Incident.s_Id);
        this->publish(target->s_Incident, E_Updated);
        return target->s_Incident.s_Id;
    }

    SIncidentState state;
    state.s_Incident.s_Id = this->nextId();
    state.s_Incident.s_Status = model_t::E_Open;
    state.s_Incident.s_Start = anomaly.s_Start;
    state.s_Incident.s_CorrelationKey = key;
    state.s_Incident.s_LastActivity = anomaly.s_End;
    merge(state, anomaly);

    std::string id{state.s_Incident.s_Id};
    group->s_AnomalyIncidents[anomaly.s_Id] = id;
    SIncidentState& inserted = group->s_Incidents.emplace(id, std::move(state)).first->second;
    ++core::CProgramCounters::counter(counter_t::E_RcaNumberIncidents);
    LOG_INFO(<< "Opened incident " << id << " \"" << inserted.s_Incident.s_Title
             << "\" for " << anomaly.s_Id);
    this->publish(inserted.s_Incident, E_Created);
    return id;
}

void CIncidentGrouper::closeQuietIncidents(core_t::TTime now) {
    std::vector<TGroupPtr> groups;
    {
        std::lock_guard<std::mutex> lock{m_GroupsMutex};
        groups.reserve(m_Groups.size());
        for (const auto& group : m_Groups) {
            groups.push_back(group.second);
        }
    }

    for (const auto& group : groups) {
        std::lock_guard<std::mutex> lock{group->s_Mutex};
        for (auto i = group->s_Incidents.begin(); i != group->s_Incidents.end(); /**/) {
            SIncidentState& state = i->second;
            if (state.s_OpenAnomalies.empty() &&
                now - state.s_Incident.s_LastActivity >= m_Config.s_QuietPeriod) {
                state.s_Incident.s_Status = model_t::E_Closed;
                LOG_INFO(<< "Closed incident " << state.s_Incident.s_Id << " after "
                         << core::CTimeUtils::durationToString(now - state.s_Incident.s_LastActivity)
                         << " quiet");
                this->publish(state.s_Incident, E_Closed);
                for (const auto& anomaly : state.s_AnomalyEnds) {
                    group->s_AnomalyIncidents.erase(anomaly.first);
                }
                i = group->s_Incidents.erase(i);
            } else {
                ++i;
            }
        }
    }
}

std::size_t CIncidentGrouper::numberOpenIncidents() const {
    std::vector<TGroupPtr> groups;
    {
        std::lock_guard<std::mutex> lock{m_GroupsMutex};
        for (const auto& group : m_Groups) {
            groups.push_back(group.second);
        }
    }
    std::size_t result{0};
    for (const auto& group : groups) {
        std::lock_guard<std::mutex> lock{group->s_Mutex};
        result += group->s_Incidents.size();
    }
    return result;
}

std::string CIncidentGrouper::title(const model_t::TStrSet& services) {
    if (services.size() == 1) {
        return "Incident in " + *services.begin();
    }
    return "Incident affecting " + core::CStringUtils::join(services, ", ");
}

CIncidentGrouper::TGroupPtr CIncidentGrouper::group(const std::string& key) {
    std::lock_guard<std::mutex> lock{m_GroupsMutex};
    TGroupPtr& result = m_Groups[key];
    if (result == nullptr) {
        result = std::make_shared<SGroup>();
    }
    return result;
}

bool CIncidentGrouper::overlaps(const SIncidentState& state, const SAnomaly& anomaly) const {
    const SIncident& incident = state.s_Incident;
    core_t::TTime windowStart{incident.s_Start - m_Config.s_GraceMargin};
    core_t::TTime windowEnd{incident.s_End ? *incident.s_End + m_Config.s_GraceMargin
                                           : std::numeric_limits<core_t::TTime>::max()};
    return anomaly.s_Start <= windowEnd && anomaly.s_End >= windowStart;
}

void CIncidentGrouper::merge(SIncidentState& state, const SAnomaly& anomaly) {
    SIncident& incident = state.s_Incident;

    TStrTimeMap::iterator end{state.s_AnomalyEnds.find(anomaly.s_Id)};
    if (end == state.s_AnomalyEnds.end()) {
        state.s_AnomalyEnds.emplace(anomaly.s_Id, anomaly.s_End);
    } else {
        end->second = std::max(end->second, anomaly.s_End);
    }
    if (anomaly.s_Open) {
        state.s_OpenAnomalies.insert(anomaly.s_Id);
    } else {
        state.s_OpenAnomalies.erase(anomaly.s_Id);
    }

    incident.s_AnomalyIds.insert(anomaly.s_Id);
    incident.s_Services.insert(anomaly.s_Service);
    incident.s_Metrics.insert(anomaly.s_Metric);
    incident.s_Start = std::min(incident.s_Start, anomaly.s_Start);
    incident.s_LastActivity = std::max(incident.s_LastActivity, anomaly.s_End);

    if (state.s_OpenAnomalies.empty()) {
        core_t::TTime latest{incident.s_Start};
        for (const auto& anomalyEnd : state.s_AnomalyEnds) {
            latest = std::max(latest, anomalyEnd.second);
        }
        incident.s_End = latest;
    } else {
        incident.s_End.reset();
    }

    incident.s_Title = title(incident.s_Services);
    incident.s_Summary = "Anomalous " + core::CStringUtils::join(incident.s_Metrics, ", ") +
                         " across " +
                         core::CStringUtils::typeToString(incident.s_AnomalyIds.size()) +
                         (incident.s_AnomalyIds.size() == 1 ? " anomaly" : " anomalies");
}

std::string CIncidentGrouper::nextId() {
    return "inc-" + core::CStringUtils::typeToString(++m_NextId);
}

void CIncidentGrouper::publish(const SIncident& incident, EChange change) const {
    if (m_Callback) {
        m_Callback(incident, change);
    }
}
}
}
