/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CMetricAnomalyDetector.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>

#include <maths/CBasicStatistics.h>

#include <algorithm>
#include <cmath>
#include <tuple>
#include <vector>

namespace rca {
namespace model {

const std::string CMetricAnomalyDetector::NAME{"robust_zscore"};

CMetricAnomalyDetector::CMetricAnomalyDetector(CRcaConfig::SDetector config, TAnomalyCallback callback)
    : m_Config{std::move(config)}, m_Callback{std::move(callback)} {
}

CMetricAnomalyDetector::EResult CMetricAnomalyDetector::addSample(const SMetricSample& sample) {
    if (std::isfinite(sample.s_Value) == false) {
        return E_Invalid;
    }

    TKeyStatePtr state{this->state(sample.s_Service, sample.s_Metric)};
    std::lock_guard<std::mutex> lock{state->s_Mutex};

    if (state->s_HasLatest && sample.s_Time < state->s_Latest) {
        if (state->s_Latest - sample.s_Time > m_Config.s_Lateness) {
            LOG_DEBUG(<< "Dropping late sample for " << sample.s_Service << "/"
                      << sample.s_Metric << " at " << sample.s_Time << ", latest "
                      << state->s_Latest);
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberLateSamplesDropped);
            return E_Dropped;
        }
        auto position = std::upper_bound(
            state->s_History.begin(), state->s_History.end(), sample.s_Time,
            [](core_t::TTime time, const SPoint& point) { return time < point.s_Time; });
        state->s_History.insert(position, SPoint{sample.s_Time, sample.s_Value, false});
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberMetricSamples);
        return E_Late;
    }

    SScore score{this->score(*state, sample.s_Metric, sample)};

    core_t::TTime horizon{sample.s_Time - m_Config.s_BaselineWindow - m_Config.s_Lateness};
    while (state->s_History.empty() == false && state->s_History.front().s_Time < horizon) {
        state->s_History.pop_front();
    }
    state->s_History.push_back(SPoint{sample.s_Time, sample.s_Value, score.s_Breach});
    state->s_HasLatest = true;
    state->s_Latest = sample.s_Time;
    ++core::CProgramCounters::counter(counter_t::E_RcaNumberMetricSamples);

    this->updateEpisode(*state, sample, score);

    return E_Accepted;
}

void CMetricAnomalyDetector::flush(core_t::TTime now) {
    std::vector<TKeyStatePtr> states;
    {
        std::lock_guard<std::mutex> lock{m_KeysMutex};
        states.reserve(m_Keys.size());
        for (const auto& key : m_Keys) {
            states.push_back(key.second);
        }
    }

    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock{state->s_Mutex};
        if (state->s_Episode && now - state->s_LastBreach >= this->effectiveCooldown()) {
            this->closeEpisode(*state);
        }
    }
}

std::size_t CMetricAnomalyDetector::numberKeys() const {
    std::lock_guard<std::mutex> lock{m_KeysMutex};
    return m_Keys.size();
}

std::size_t CMetricAnomalyDetector::numberOpenEpisodes() const {
    std::vector<TKeyStatePtr> states;
    {
        std::lock_guard<std::mutex> lock{m_KeysMutex};
        for (const auto& key : m_Keys) {
            states.push_back(key.second);
        }
    }
    std::size_t result{0};
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock{state->s_Mutex};
        result += state->s_Episode ? 1 : 0;
    }
    return result;
}

CMetricAnomalyDetector::TKeyStatePtr
CMetricAnomalyDetector::state(const std::string& service, const std::string& metric) {
    std::lock_guard<std::mutex> lock{m_KeysMutex};
    TKeyStatePtr& result = m_Keys[TStrStrPr{service, metric}];
    if (result == nullptr) {
        result = std::make_shared<SKeyState>(m_Config.s_MaximumHistory);
    }
    return result;
}

CMetricAnomalyDetector::SScore
CMetricAnomalyDetector::score(const SKeyState& state,
                              const std::string& metric,
                              const SMetricSample& sample) const {
    SScore result;

    // The evaluation window is the new sample and the latest ones before it.
    std::size_t history{state.s_History.size()};
    std::size_t numberPrevious{
        std::min(std::max(m_Config.s_EvaluationSamples, std::size_t{1}) - 1, history)};
    std::size_t evaluationStart{history - numberPrevious};

    maths::CBasicStatistics::TDoubleVec evaluation{sample.s_Value};
    for (std::size_t i = evaluationStart; i < history; ++i) {
        evaluation.push_back(state.s_History[i].s_Value);
    }

    maths::CBasicStatistics::TDoubleVec baseline;
    core_t::TTime baselineStart{sample.s_Time - m_Config.s_BaselineWindow};
    for (std::size_t i = 0; i < evaluationStart; ++i) {
        const SPoint& point = state.s_History[i];
        if (point.s_Time >= baselineStart && point.s_Time < sample.s_Time &&
            point.s_Breach == false) {
            baseline.push_back(point.s_Value);
        }
    }

    if (baseline.size() < m_Config.s_MinimumBaselinePoints) {
        return result;
    }

    double median;
    double mad;
    std::tie(median, mad) = maths::CBasicStatistics::medianAndMad(baseline);
    double spread{std::max(maths::CBasicStatistics::MAD_TO_STANDARD_DEVIATION * mad,
                           m_Config.s_MinimumSpread)};
    double aggregate{maths::CBasicStatistics::mean(evaluation)};
    double z{maths::CBasicStatistics::robustZScore(aggregate, median, mad,
                                                   m_Config.s_MinimumSpread)};
    model_t::EDirection direction{m_Config.direction(metric)};

    result.s_Breach = this->isBreach(direction, z, aggregate, median);
    result.s_ZScore = z;
    result.s_Details.s_BaselineMedian = median;
    result.s_Details.s_BaselineSpread = spread;
    result.s_Details.s_Direction = direction;
    result.s_Details.s_Aggregate = aggregate;
    result.s_Details.s_Threshold = m_Config.s_ZThreshold;

    return result;
}

bool CMetricAnomalyDetector::isBreach(model_t::EDirection direction,
                                      double z,
                                      double aggregate,
                                      double median) const {
    bool up{z > m_Config.s_ZThreshold};
    bool down{z < -m_Config.s_ZThreshold};
    if (m_Config.s_RelativeThreshold > 0.0 && median != 0.0) {
        double relative{(aggregate - median) / std::fabs(median)};
        up = up || relative > m_Config.s_RelativeThreshold;
        down = down || relative < -m_Config.s_RelativeThreshold;
    }
    switch (direction) {
    case model_t::E_Up:
        return up;
    case model_t::E_Down:
        return down;
    case model_t::E_Both:
        return up || down;
    }
    return false;
}

void CMetricAnomalyDetector::updateEpisode(SKeyState& state,
                                           const SMetricSample& sample,
                                           const SScore& score) {
    core_t::TTime cooldown{this->effectiveCooldown()};

    if (score.s_Breach == false) {
        if (state.s_Episode && sample.s_Time - state.s_LastBreach >= cooldown) {
            this->closeEpisode(state);
        }
        return;
    }

    if (state.s_Episode && sample.s_Time - state.s_LastBreach > cooldown) {
        // The stream went quiet for longer than the cooldown: this is a
        // new episode.
        this->closeEpisode(state);
    }

    double magnitude{std::fabs(score.s_ZScore)};
    if (state.s_Episode) {
        SAnomaly& anomaly = *state.s_Episode;
        anomaly.s_End = sample.s_Time;
        if (magnitude > anomaly.s_Score) {
            anomaly.s_Score = magnitude;
            anomaly.s_Details = score.s_Details;
        }
        LOG_TRACE(<< "Extended " << anomaly.s_Id << " to " << anomaly.s_End);
    } else {
        SAnomaly anomaly;
        anomaly.s_Id = SAnomaly::makeId(sample.s_Service, sample.s_Metric, sample.s_Time);
        anomaly.s_Service = sample.s_Service;
        anomaly.s_Metric = sample.s_Metric;
        anomaly.s_Start = sample.s_Time;
        anomaly.s_End = sample.s_Time;
        anomaly.s_Score = magnitude;
        anomaly.s_Detector = NAME;
        anomaly.s_Open = true;
        anomaly.s_Details = score.s_Details;
        state.s_Episode = std::move(anomaly);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberAnomalies);
        LOG_DEBUG(<< "Opened " << state.s_Episode->s_Id << " with z-score "
                  << score.s_ZScore << " against median "
                  << score.s_Details.s_BaselineMedian);
    }
    state.s_LastBreach = sample.s_Time;

    if (m_Callback) {
        m_Callback(*state.s_Episode);
    }
}

void CMetricAnomalyDetector::closeEpisode(SKeyState& state) {
    SAnomaly anomaly{std::move(*state.s_Episode)};
    state.s_Episode.reset();
    anomaly.s_Open = false;
    LOG_DEBUG(<< "Closed " << anomaly.s_Id << " spanning " << anomaly.s_Start
              << " to " << anomaly.s_End);
    if (m_Callback) {
        m_Callback(anomaly);
    }
}

core_t::TTime CMetricAnomalyDetector::effectiveCooldown() const {
    return std::max(m_Config.s_Cooldown, m_Config.s_GapTolerance);
}
}
}
