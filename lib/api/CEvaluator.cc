/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CEvaluator.h>

#include <core/CLogger.h>

#include <maths/CRankingMetrics.h>

#include <api/CRcaEngine.h>

#include <algorithm>

namespace rca {
namespace api {
namespace {
bool matches(const model::SSuspect& suspect, const model::SLabel& label) {
    return suspect.s_Id == label.s_SuspectId ||
           (suspect.s_Type == label.s_SuspectType && suspect.s_Key == label.s_SuspectKey);
}

CEvaluator::TOptionalDouble mean(double sum, std::size_t count) {
    if (count == 0) {
        return CEvaluator::TOptionalDouble{};
    }
    return sum / static_cast<double>(count);
}
}

CEvaluator::SIncidentResult CEvaluator::evaluate(const model::SIncident& incident,
                                                 const model::TSuspectVec& suspects,
                                                 const TAnomalyVec& anomalies,
                                                 const model::TLabelVec& latestLabels) {
    SIncidentResult result;
    result.s_IncidentId = incident.s_Id;

    for (const auto& label : latestLabels) {
        if (label.s_IncidentId != incident.s_Id || label.s_IsCause == false) {
            continue;
        }
        result.s_HasTrueCause = true;
        for (const auto& suspect : suspects) {
            if (matches(suspect, label) &&
                (result.s_TrueCauseRank == 0 || suspect.s_Rank < result.s_TrueCauseRank)) {
                result.s_TrueCauseRank = suspect.s_Rank;
            }
        }
    }

    if (anomalies.empty() == false) {
        auto first = std::min_element(anomalies.begin(), anomalies.end(),
                                      [](const model::SAnomaly& lhs, const model::SAnomaly& rhs) {
                                          return lhs.s_Start < rhs.s_Start;
                                      });
        result.s_TimeToDetectMinutes =
            static_cast<double>(first->s_Start - incident.s_Start) / 60.0;
    }

    return result;
}

CEvaluator::SSummary CEvaluator::evaluate(const CRcaEngine& engine) {
    model::TLabelVec labels{engine.feedback().latestLabels()};

    TIncidentResultVec results;
    for (const auto& incident : engine.incidents()) {
        bool labelled{std::any_of(labels.begin(), labels.end(),
                                  [&incident](const model::SLabel& label) {
                                      return label.s_IncidentId == incident.s_Id;
                                  })};
        if (labelled) {
            results.push_back(evaluate(incident, engine.suspects(incident.s_Id),
                                       engine.anomalies(incident.s_Id), labels));
        }
    }
    LOG_DEBUG(<< "Evaluated " << results.size() << " labelled incidents");

    return summarise(std::move(results));
}

CEvaluator::SSummary CEvaluator::summarise(TIncidentResultVec results) {
    SSummary summary;
    summary.s_NumberIncidents = results.size();

    double precisionAt1{0.0};
    double precisionAt3{0.0};
    double reciprocalRank{0.0};
    double timeToDetect{0.0};
    std::size_t detected{0};
    for (const auto& result : results) {
        if (result.s_HasTrueCause) {
            ++summary.s_NumberWithTrueCause;
            precisionAt1 += maths::CRankingMetrics::precisionAtK(result.s_TrueCauseRank, 1);
            precisionAt3 += maths::CRankingMetrics::precisionAtK(result.s_TrueCauseRank, 3);
            reciprocalRank += maths::CRankingMetrics::reciprocalRank(result.s_TrueCauseRank);
        }
        if (result.s_TimeToDetectMinutes) {
            timeToDetect += *result.s_TimeToDetectMinutes;
            ++detected;
        }
    }

    summary.s_PrecisionAt1 = mean(precisionAt1, summary.s_NumberWithTrueCause);
    summary.s_PrecisionAt3 = mean(precisionAt3, summary.s_NumberWithTrueCause);
    summary.s_MeanReciprocalRank = mean(reciprocalRank, summary.s_NumberWithTrueCause);
    summary.s_MeanTimeToDetectMinutes = mean(timeToDetect, detected);
    summary.s_Incidents = std::move(results);

    return summary;
}
}
}
