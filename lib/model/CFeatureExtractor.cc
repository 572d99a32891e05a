/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CFeatureExtractor.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CStringUtils.h>
#include <core/CoreTypes.h>

#include <maths/CBasicStatistics.h>
#include <maths/CTools.h>

#include <boost/unordered_map.hpp>

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>

namespace rca {
namespace model {
namespace {
using TDoubleVec = std::vector<double>;
using TDoubleVecDoubleVecPr = std::pair<TDoubleVec, TDoubleVec>;
using TStrDoubleVecDoubleVecPrUMap = boost::unordered_map<std::string, TDoubleVecDoubleVecPr>;

//! The number of minutes over which time proximity decays to zero.
const double PROXIMITY_HORIZON_MINUTES{60.0};
}

CFeatureExtractor::CFeatureExtractor(CRcaConfig::SFeatures config,
                                     TTelemetryStorePtr store,
                                     THistoricalRiskFunc historicalRisk)
    : m_Config{std::move(config)}, m_Store{std::move(store)},
      m_HistoricalRisk{std::move(historicalRisk)},
      m_Executor{core::makeExecutor(m_Config.s_ExtractionThreads)} {
}

SEvidence CFeatureExtractor::extract(const SIncident& incident, const SCandidate& candidate) const {
    if (candidate.s_Key.empty()) {
        throw std::invalid_argument("candidate for " + incident.s_Id + " has no key");
    }

    model_t::TStrSet services{incident.s_Services};
    if (candidate.s_Service.empty() == false) {
        services.insert(candidate.s_Service);
    }

    SEvidence evidence;
    this->timeFeatures(incident, candidate, evidence);
    this->metricFeatures(services, candidate, evidence);
    this->logFeatures(services, candidate, evidence);
    this->payloadFeatures(candidate, evidence);
    this->historyFeatures(incident, candidate, evidence);
    return evidence;
}

CFeatureExtractor::TOptionalEvidenceVec
CFeatureExtractor::extractAll(const SIncident& incident,
                              const TCandidateVec& candidates,
                              const TCancelledFunc& cancelled) const {
    std::vector<std::future<TOptionalEvidence>> futures;
    futures.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        futures.push_back(core::async(*m_Executor, [&, this]() -> TOptionalEvidence {
            if (cancelled && cancelled()) {
                return TOptionalEvidence{};
            }
            return this->extract(incident, candidate);
        }));
    }

    TOptionalEvidenceVec result;
    result.reserve(candidates.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            result.push_back(futures[i].get());
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to extract evidence for " << candidates[i].s_Key
                      << " on " << incident.s_Id << ": " << e.what());
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberExtractionFailures);
            result.push_back(TOptionalEvidence{});
        }
    }
    return result;
}

void CFeatureExtractor::timeFeatures(const SIncident& incident,
                                     const SCandidate& candidate,
                                     SEvidence& evidence) const {
    double minutesBefore{static_cast<double>(incident.s_Start - candidate.s_ChangeTime) /
                         static_cast<double>(constants::MINUTE)};
    evidence.s_MinutesBeforeIncident = minutesBefore;
    evidence.s_IsBeforeIncident = minutesBefore >= 0.0;
    evidence.value(SEvidence::TIME_PROXIMITY_SCORE,
                   std::max(0.0, 1.0 - std::fabs(minutesBefore) / PROXIMITY_HORIZON_MINUTES));
}

void CFeatureExtractor::metricFeatures(const model_t::TStrSet& services,
                                       const SCandidate& candidate,
                                       SEvidence& evidence) const {
    try {
        core_t::TTime change{candidate.s_ChangeTime};
        TStrDoubleVecDoubleVecPrUMap windows;
        for (const auto& service : services) {
            for (const auto& sample : m_Store->metrics(service, change - m_Config.s_Window,
                                                       change + m_Config.s_Window)) {
                auto& window = windows[service + '/' + sample.s_Metric];
                (sample.s_Time < change ? window.first : window.second).push_back(sample.s_Value);
            }
        }

        TDoubleVec deltas;
        std::size_t moved{0};
        for (const auto& window : windows) {
            const TDoubleVec& before = window.second.first;
            const TDoubleVec& after = window.second.second;
            if (before.empty() || after.empty()) {
                continue;
            }
            double meanBefore{maths::CBasicStatistics::mean(before)};
            double meanAfter{maths::CBasicStatistics::mean(after)};
            if (meanBefore == 0.0) {
                continue;
            }
            double delta{std::fabs(meanAfter - meanBefore) / std::fabs(meanBefore)};
            deltas.push_back(delta);
            if (delta > m_Config.s_MinimumMetricChange) {
                ++moved;
            }
        }

        evidence.s_MetricDeltaCount = moved;
        evidence.s_MaxMetricDelta =
            deltas.empty() ? 0.0 : *std::max_element(deltas.begin(), deltas.end());
        evidence.value(SEvidence::AVG_METRIC_DELTA, maths::CBasicStatistics::mean(deltas));
    } catch (const std::exception& e) {
        LOG_WARN(<< "Error extracting metric features for " << candidate.s_Key << ": " << e.what());
        evidence.s_MetricDeltaCount = 0;
        evidence.s_MaxMetricDelta = 0.0;
        evidence.value(SEvidence::AVG_METRIC_DELTA, 0.0);
    }
}

void CFeatureExtractor::logFeatures(const model_t::TStrSet& services,
                                    const SCandidate& candidate,
                                    SEvidence& evidence) const {
    core_t::TTime change{candidate.s_ChangeTime};

    try {
        std::size_t before{0};
        std::size_t after{0};
        for (const auto& service : services) {
            for (const auto& entry : m_Store->logs(service, change - m_Config.s_Window,
                                                   change + m_Config.s_Window)) {
                if (model_t::isErrorLevel(entry.s_Level)) {
                    ++(entry.s_Time < change ? before : after);
                }
            }
        }
        evidence.s_ErrorLogDelta = (static_cast<double>(after) - static_cast<double>(before)) /
                                   static_cast<double>(std::max(before, std::size_t{1}));
    } catch (const std::exception& e) {
        LOG_WARN(<< "Error extracting error log delta for " << candidate.s_Key << ": " << e.what());
        evidence.s_ErrorLogDelta = 0.0;
    }

    try {
        model_t::TStrSet baseline;
        model_t::TStrSet recent;
        for (const auto& service : services) {
            for (const auto& entry : m_Store->logs(service, change - m_Config.s_SignatureBaseline,
                                                   change + m_Config.s_Window)) {
                if (entry.s_Signature.empty()) {
                    continue;
                }
                if (entry.s_Time < change) {
                    baseline.insert(entry.s_Signature);
                } else if (model_t::isErrorLevel(entry.s_Level)) {
                    recent.insert(entry.s_Signature);
                }
            }
        }
        evidence.s_NewErrorSignature = std::any_of(
            recent.begin(), recent.end(), [&baseline](const std::string& signature) {
                return baseline.count(signature) == 0;
            });
    } catch (const std::exception& e) {
        LOG_WARN(<< "Error extracting error signatures for " << candidate.s_Key << ": " << e.what());
        evidence.s_NewErrorSignature = false;
    }
}

void CFeatureExtractor::payloadFeatures(const SCandidate& candidate, SEvidence& evidence) const {
    std::string text{core::CStringUtils::toLower(candidate.s_PayloadText)};
    std::size_t hits{0};
    for (const auto& keyword : m_Config.s_RiskKeywords) {
        if (keyword.empty() == false && text.find(keyword) != std::string::npos) {
            ++hits;
        }
    }
    evidence.s_DiffKeywordHit = hits > 0;
    evidence.value(SEvidence::DIFF_KEYWORD_COUNT, static_cast<double>(hits));
    evidence.value(SEvidence::DIFF_LENGTH, static_cast<double>(candidate.s_PayloadText.size()));
}

void CFeatureExtractor::historyFeatures(const SIncident& incident,
                                        const SCandidate& candidate,
                                        SEvidence& evidence) const {
    if (!m_HistoricalRisk) {
        return;
    }
    try {
        double risk{m_HistoricalRisk(candidate.s_Type, candidate.s_Service, incident.s_Id)};
        evidence.s_HistoricalRisk = std::isfinite(risk) ? maths::CTools::truncate(risk, 0.0, 1.0) : 0.0;
    } catch (const std::exception& e) {
        LOG_WARN(<< "Error computing historical risk for " << candidate.s_Key << ": " << e.what());
        evidence.s_HistoricalRisk = 0.0;
    }
}
}
}
