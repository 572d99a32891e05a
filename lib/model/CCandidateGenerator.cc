/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CCandidateGenerator.h>

#include <core/CLogger.h>

#include <algorithm>
#include <set>
#include <utility>

namespace rca {
namespace model {

CCandidateGenerator::CCandidateGenerator(CRcaConfig::SCandidates config, TTelemetryStorePtr store)
    : m_Config{std::move(config)}, m_Store{std::move(store)} {
}

TCandidateVec CCandidateGenerator::generate(const SIncident& incident) const {
    core_t::TTime from{incident.s_Start - m_Config.s_Lookback};
    core_t::TTime to{incident.s_Start + m_Config.s_Lookahead};
    if (incident.s_End) {
        to = std::min(to, *incident.s_End);
    }

    CTelemetryStore::TChangeEventVec changes{m_Store->changes(incident.s_Services, from, to, true)};

    TCandidateVec result;
    result.reserve(changes.size());
    for (const auto& change : changes) {
        SCandidate candidate;
        candidate.s_IncidentId = incident.s_Id;
        candidate.s_Type = change.type();
        candidate.s_Key = change.s_Id;
        candidate.s_ChangeTime = change.s_Time;
        candidate.s_Service = change.s_Service;
        candidate.s_PayloadText = change.payloadText();
        result.push_back(std::move(candidate));
    }

    std::stable_sort(result.begin(), result.end(), [](const SCandidate& lhs, const SCandidate& rhs) {
        if (lhs.s_ChangeTime != rhs.s_ChangeTime) {
            return lhs.s_ChangeTime > rhs.s_ChangeTime;
        }
        int lhsPriority{model_t::suspectTypePriority(lhs.s_Type)};
        int rhsPriority{model_t::suspectTypePriority(rhs.s_Type)};
        if (lhsPriority != rhsPriority) {
            return lhsPriority > rhsPriority;
        }
        return lhs.s_Key < rhs.s_Key;
    });

    // The same change can be reported more than once: keep the latest.
    std::set<std::pair<model_t::ESuspectType, std::string>> seen;
    result.erase(std::remove_if(result.begin(), result.end(),
                                [&seen](const SCandidate& candidate) {
                                    return seen.emplace(candidate.s_Type, candidate.s_Key).second == false;
                                }),
                 result.end());

    LOG_DEBUG(<< "Generated " << result.size() << " candidates for " << incident.s_Id
              << " from " << changes.size() << " changes");

    return result;
}
}
}
