/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CSuspectRanker.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>

#include <maths/CTools.h>

#include <model/CRcaError.h>

#include <algorithm>
#include <cmath>

namespace rca {
namespace model {

CSuspectRanker::CSuspectRanker(CRcaConfig::SRanker weights, const CRankingModelRegistry* registry)
    : m_Weights{std::move(weights)}, m_Registry{registry} {
}

double CSuspectRanker::heuristicScore(const SEvidence& evidence) const {
    double score{0.0};
    if (evidence.s_IsBeforeIncident) {
        score += m_Weights.s_IsBeforeWeight;
        score += m_Weights.s_RecencyWeight *
                 maths::CTools::exponentialDecay(std::fabs(evidence.s_MinutesBeforeIncident),
                                                 m_Weights.s_RecencyScale);
    }
    score += m_Weights.s_MetricDeltaWeight * std::min(1.0, std::max(0.0, evidence.s_MaxMetricDelta));
    score += m_Weights.s_ErrorLogDeltaWeight *
             maths::CTools::truncate(evidence.s_ErrorLogDelta / m_Weights.s_ErrorLogDeltaScale, 0.0, 1.0);
    score += m_Weights.s_NewErrorSignatureWeight * (evidence.s_NewErrorSignature ? 1.0 : 0.0);
    score += m_Weights.s_DiffKeywordWeight * (evidence.s_DiffKeywordHit ? 1.0 : 0.0);
    score += m_Weights.s_HistoricalRiskWeight * evidence.s_HistoricalRisk;
    return score;
}

CSuspectRanker::SResult CSuspectRanker::rank(const TCandidateEvidencePrVec& candidates) const {
    SResult result;
    result.s_Suspects.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        SSuspect suspect;
        suspect.s_Id = SSuspect::makeId(candidate.first);
        suspect.s_IncidentId = candidate.first.s_IncidentId;
        suspect.s_Type = candidate.first.s_Type;
        suspect.s_Key = candidate.first.s_Key;
        suspect.s_Service = candidate.first.s_Service;
        suspect.s_ChangeTime = candidate.first.s_ChangeTime;
        suspect.s_Evidence = candidate.second;
        result.s_Suspects.push_back(std::move(suspect));
    }

    CRankingModelRegistry::TRankingModelCPtr active{
        m_Registry != nullptr ? m_Registry->active() : nullptr};

    bool scored{false};
    if (active != nullptr) {
        try {
            if (active->isValid() == false) {
                throw CModelSchemaError("Model " + active->version() +
                                        " doesn't match the evidence schema");
            }
            std::vector<double> scores;
            scores.reserve(result.s_Suspects.size());
            for (const auto& suspect : result.s_Suspects) {
                scores.push_back(active->score(suspect.s_Evidence));
            }
            for (std::size_t i = 0; i < scores.size(); ++i) {
                result.s_Suspects[i].s_Score = scores[i];
                result.s_Suspects[i].s_ScoredBy = active->version();
            }
            result.s_ScoredBy = active->version();
            scored = true;
        } catch (const CModelSchemaError& e) {
            LOG_WARN(<< "Falling back to heuristic ranking: " << e.what());
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberModelFallbacks);
            result.s_FellBack = true;
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Model " << active->version()
                      << " failed, falling back to heuristic ranking: " << e.what());
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberModelFallbacks);
            result.s_FellBack = true;
        }
    }

    if (scored == false) {
        for (auto& suspect : result.s_Suspects) {
            suspect.s_Score = this->heuristicScore(suspect.s_Evidence);
            suspect.s_ScoredBy = SSuspect::HEURISTIC;
        }
        result.s_ScoredBy = SSuspect::HEURISTIC;
    }

    order(result.s_Suspects);

    return result;
}

void CSuspectRanker::order(TSuspectVec& suspects) {
    std::sort(suspects.begin(), suspects.end(), [](const SSuspect& lhs, const SSuspect& rhs) {
        if (lhs.s_Score != rhs.s_Score) {
            return lhs.s_Score > rhs.s_Score;
        }
        const SEvidence& lhsEvidence = lhs.s_Evidence;
        const SEvidence& rhsEvidence = rhs.s_Evidence;
        if (lhsEvidence.s_IsBeforeIncident != rhsEvidence.s_IsBeforeIncident) {
            return lhsEvidence.s_IsBeforeIncident;
        }
        if (lhsEvidence.s_MinutesBeforeIncident != rhsEvidence.s_MinutesBeforeIncident) {
            return lhsEvidence.s_MinutesBeforeIncident < rhsEvidence.s_MinutesBeforeIncident;
        }
        int lhsPriority{model_t::suspectTypePriority(lhs.s_Type)};
        int rhsPriority{model_t::suspectTypePriority(rhs.s_Type)};
        if (lhsPriority != rhsPriority) {
            return lhsPriority > rhsPriority;
        }
        return lhs.s_Key < rhs.s_Key;
    });
    for (std::size_t i = 0; i < suspects.size(); ++i) {
        suspects[i].s_Rank = i + 1;
    }
}
}
}
