/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CEvidence.h>

#include <algorithm>

namespace rca {
namespace model {

const std::string SEvidence::MINUTES_BEFORE_INCIDENT{"minutes_before_incident"};
const std::string SEvidence::IS_BEFORE_INCIDENT{"is_before_incident"};
const std::string SEvidence::METRIC_DELTA_COUNT{"metric_delta_count"};
const std::string SEvidence::MAX_METRIC_DELTA{"max_metric_delta"};
const std::string SEvidence::ERROR_LOG_DELTA{"error_log_delta"};
const std::string SEvidence::NEW_ERROR_SIGNATURE{"new_error_signature"};
const std::string SEvidence::DIFF_KEYWORD_HIT{"diff_keyword_hit"};
const std::string SEvidence::HISTORICAL_RISK{"historical_risk"};
const std::string SEvidence::TIME_PROXIMITY_SCORE{"time_proximity_score"};
const std::string SEvidence::AVG_METRIC_DELTA{"avg_metric_delta"};
const std::string SEvidence::DIFF_KEYWORD_COUNT{"diff_keyword_count"};
const std::string SEvidence::DIFF_LENGTH{"diff_length"};

const model_t::TStrVec& SEvidence::featureNames() {
    static const model_t::TStrVec NAMES{
        MINUTES_BEFORE_INCIDENT, IS_BEFORE_INCIDENT, METRIC_DELTA_COUNT,
        MAX_METRIC_DELTA,        ERROR_LOG_DELTA,    NEW_ERROR_SIGNATURE,
        DIFF_KEYWORD_HIT,        HISTORICAL_RISK,    TIME_PROXIMITY_SCORE,
        AVG_METRIC_DELTA,        DIFF_KEYWORD_COUNT, DIFF_LENGTH};
    return NAMES;
}

SEvidence::TOptionalDouble SEvidence::value(const std::string& name) const {
    if (name == MINUTES_BEFORE_INCIDENT) {
        return s_MinutesBeforeIncident;
    }
    if (name == IS_BEFORE_INCIDENT) {
        return s_IsBeforeIncident ? 1.0 : 0.0;
    }
    if (name == METRIC_DELTA_COUNT) {
        return static_cast<double>(s_MetricDeltaCount);
    }
    if (name == MAX_METRIC_DELTA) {
        return s_MaxMetricDelta;
    }
    if (name == ERROR_LOG_DELTA) {
        return s_ErrorLogDelta;
    }
    if (name == NEW_ERROR_SIGNATURE) {
        return s_NewErrorSignature ? 1.0 : 0.0;
    }
    if (name == DIFF_KEYWORD_HIT) {
        return s_DiffKeywordHit ? 1.0 : 0.0;
    }
    if (name == HISTORICAL_RISK) {
        return s_HistoricalRisk;
    }
    auto i = s_Extensions.find(name);
    if (i != s_Extensions.end()) {
        return i->second;
    }
    // Known extension fields which weren't computed take their default.
    const auto& names = featureNames();
    if (std::find(names.begin(), names.end(), name) != names.end()) {
        return 0.0;
    }
    return TOptionalDouble{};
}

void SEvidence::value(const std::string& name, double value) {
    if (name == MINUTES_BEFORE_INCIDENT) {
        s_MinutesBeforeIncident = value;
    } else if (name == IS_BEFORE_INCIDENT) {
        s_IsBeforeIncident = value != 0.0;
    } else if (name == METRIC_DELTA_COUNT) {
        s_MetricDeltaCount = value > 0.0 ? static_cast<std::size_t>(value + 0.5) : 0;
    } else if (name == MAX_METRIC_DELTA) {
        s_MaxMetricDelta = value;
    } else if (name == ERROR_LOG_DELTA) {
        s_ErrorLogDelta = value;
    } else if (name == NEW_ERROR_SIGNATURE) {
        s_NewErrorSignature = value != 0.0;
    } else if (name == DIFF_KEYWORD_HIT) {
        s_DiffKeywordHit = value != 0.0;
    } else if (name == HISTORICAL_RISK) {
        s_HistoricalRisk = value;
    } else {
        s_Extensions[name] = value;
    }
}

bool SEvidence::toFeatureVector(const model_t::TStrVec& names,
                                model_t::TDoubleVec& result) const {
    result.clear();
    result.reserve(names.size());
    for (const auto& name : names) {
        TOptionalDouble x{this->value(name)};
        if (!x) {
            return false;
        }
        result.push_back(*x);
    }
    return true;
}

model_t::TStrDoubleMap SEvidence::toMap() const {
    model_t::TStrDoubleMap result{s_Extensions};
    for (const auto& name : featureNames()) {
        result[name] = *this->value(name);
    }
    return result;
}
}
}
