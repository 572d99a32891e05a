/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CRcaConfig.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>

namespace rca {
namespace model {
namespace {
const std::string DETECTOR_STANZA{"detector"};
const std::string GROUPER_STANZA{"grouper"};
const std::string CANDIDATES_STANZA{"candidates"};
const std::string FEATURES_STANZA{"features"};
const std::string RANKER_STANZA{"ranker"};
const std::string FEEDBACK_STANZA{"feedback"};
const std::string ENGINE_STANZA{"engine"};

const std::string BAD_DIRECTION_PREFIX{"bad_direction."};
const std::string GROUP_PREFIX{"group."};
const std::string GROUP_KEY_PREFIX{"group:"};

//! Read a property value, logging if it is invalid.
template<typename T, typename PREDICATE>
bool readProperty(const std::string& propName,
                  const std::string& propValue,
                  T& target,
                  PREDICATE isValid) {
    T value{};
    if (core::CStringUtils::stringToType(propValue, value) == false || isValid(value) == false) {
        LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
        return false;
    }
    target = value;
    return true;
}

//! Read a comma separated list of names.
model_t::TStrVec readList(const std::string& propValue) {
    model_t::TStrVec tokens;
    std::string remainder;
    core::CStringUtils::tokenise(",", propValue, tokens, remainder);
    tokens.push_back(remainder);
    model_t::TStrVec result;
    for (auto& token : tokens) {
        core::CStringUtils::trimWhitespace(token);
        if (token.empty() == false) {
            result.push_back(token);
        }
    }
    return result;
}

bool hasPrefix(const std::string& name, const std::string& prefix) {
    return name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
}

const auto POSITIVE = [](auto value) { return value > 0; };
const auto NON_NEGATIVE = [](auto value) { return value >= 0; };
const auto ANY = [](auto) { return true; };
}

const core_t::TTime CRcaConfig::DEFAULT_BASELINE_WINDOW(constants::HOUR);
const std::size_t CRcaConfig::DEFAULT_MINIMUM_BASELINE_POINTS(5);
const std::size_t CRcaConfig::DEFAULT_EVALUATION_SAMPLES(1);
const double CRcaConfig::DEFAULT_Z_THRESHOLD(3.0);
const double CRcaConfig::DEFAULT_RELATIVE_THRESHOLD(0.0);
const double CRcaConfig::DEFAULT_MINIMUM_SPREAD(1e-6);
const core_t::TTime CRcaConfig::DEFAULT_GAP_TOLERANCE(2 * constants::MINUTE);
const core_t::TTime CRcaConfig::DEFAULT_COOLDOWN(5 * constants::MINUTE);
const core_t::TTime CRcaConfig::DEFAULT_LATENESS(constants::MINUTE);
const std::size_t CRcaConfig::DEFAULT_MAXIMUM_HISTORY(1440);
const core_t::TTime CRcaConfig::DEFAULT_GRACE_MARGIN(10 * constants::MINUTE);
const core_t::TTime CRcaConfig::DEFAULT_QUIET_PERIOD(10 * constants::MINUTE);
const core_t::TTime CRcaConfig::DEFAULT_LOOKBACK(2 * constants::HOUR);
const core_t::TTime CRcaConfig::DEFAULT_LOOKAHEAD(0);
const core_t::TTime CRcaConfig::DEFAULT_FEATURE_WINDOW(10 * constants::MINUTE);
const double CRcaConfig::DEFAULT_MINIMUM_METRIC_CHANGE(0.1);
const core_t::TTime CRcaConfig::DEFAULT_SIGNATURE_BASELINE(constants::HOUR);
const model_t::TStrVec CRcaConfig::DEFAULT_RISK_KEYWORDS{
    "timeout", "retry", "cache", "db", "database", "connection", "pool"};
const std::size_t CRcaConfig::DEFAULT_EXTRACTION_THREADS(4);
const double CRcaConfig::DEFAULT_IS_BEFORE_WEIGHT(3.0);
const double CRcaConfig::DEFAULT_RECENCY_WEIGHT(2.0);
const double CRcaConfig::DEFAULT_RECENCY_SCALE(30.0);
const double CRcaConfig::DEFAULT_METRIC_DELTA_WEIGHT(2.5);
const double CRcaConfig::DEFAULT_ERROR_LOG_DELTA_WEIGHT(2.0);
const double CRcaConfig::DEFAULT_ERROR_LOG_DELTA_SCALE(10.0);
const double CRcaConfig::DEFAULT_NEW_ERROR_SIGNATURE_WEIGHT(1.5);
const double CRcaConfig::DEFAULT_DIFF_KEYWORD_WEIGHT(1.0);
const double CRcaConfig::DEFAULT_HISTORICAL_RISK_WEIGHT(1.0);
const std::size_t CRcaConfig::DEFAULT_MINIMUM_LABELS(10);
const double CRcaConfig::DEFAULT_HOLDOUT_FRACTION(0.2);
const double CRcaConfig::DEFAULT_REGULARISATION(0.01);
const std::size_t CRcaConfig::DEFAULT_MAXIMUM_TRAINING_ITERATIONS(2000);
const bool CRcaConfig::DEFAULT_AUTO_RETRAIN(true);
const std::size_t CRcaConfig::DEFAULT_RETRAIN_EVERY(5);
const std::int64_t CRcaConfig::DEFAULT_RUN_TIMEOUT_MS(30000);
const std::size_t CRcaConfig::DEFAULT_MAXIMUM_CONSECUTIVE_FAILURES(3);
const std::size_t CRcaConfig::DEFAULT_RUN_THREADS(2);
const core_t::TTime CRcaConfig::DEFAULT_RERUN_DEBOUNCE(constants::MINUTE);
const std::size_t CRcaConfig::DEFAULT_ACTIVITY_CAPACITY(10000);

model_t::EDirection CRcaConfig::SDetector::direction(const std::string& metric) const {
    auto i = s_BadDirections.find(metric);
    return i == s_BadDirections.end() ? model_t::E_Up : i->second;
}

std::string CRcaConfig::SGrouper::correlationKey(const std::string& service) const {
    for (const auto& group : s_CorrelationGroups) {
        for (const auto& member : group.second) {
            if (member == service) {
                return GROUP_KEY_PREFIX + group.first;
            }
        }
    }
    return service;
}

CRcaConfig::TStrDirectionMap CRcaConfig::defaultBadDirections() {
    return {{"p95_latency_ms", model_t::E_Up},
            {"p99_latency_ms", model_t::E_Up},
            {"error_rate", model_t::E_Up},
            {"qps", model_t::E_Down}};
}

bool CRcaConfig::init(const std::string& configFile) {
    LOG_DEBUG(<< "Reading config file " << configFile);

    boost::property_tree::ptree propTree;
    try {
        std::ifstream strm(configFile.c_str());
        if (!strm.is_open()) {
            LOG_ERROR(<< "Error opening config file " << configFile);
            return false;
        }
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config file " << configFile << " : " << e.what());
        return false;
    }

    if (this->init(propTree) == false) {
        LOG_ERROR(<< "Error reading config file " << configFile);
        return false;
    }

    return true;
}

bool CRcaConfig::init(const boost::property_tree::ptree& propTree) {
    bool result = true;

    for (const auto& stanza : propTree) {
        const std::string& stanzaName = stanza.first;
        const boost::property_tree::ptree& propertyTree = stanza.second;

        bool ok = true;
        if (stanzaName == DETECTOR_STANZA) {
            ok = this->processDetectorStanza(propertyTree);
        } else if (stanzaName == GROUPER_STANZA) {
            ok = this->processGrouperStanza(propertyTree);
        } else if (stanzaName == CANDIDATES_STANZA) {
            ok = this->processCandidatesStanza(propertyTree);
        } else if (stanzaName == FEATURES_STANZA) {
            ok = this->processFeaturesStanza(propertyTree);
        } else if (stanzaName == RANKER_STANZA) {
            ok = this->processRankerStanza(propertyTree);
        } else if (stanzaName == FEEDBACK_STANZA) {
            ok = this->processFeedbackStanza(propertyTree);
        } else if (stanzaName == ENGINE_STANZA) {
            ok = this->processEngineStanza(propertyTree);
        } else {
            LOG_WARN(<< "Ignoring unknown config stanza: " << stanzaName);
        }
        if (ok == false) {
            LOG_ERROR(<< "Error reading config stanza: " << stanzaName);
            result = false;
        }
    }

    return result;
}

bool CRcaConfig::processDetectorStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "baseline_window") {
            ok = readProperty(propName, propValue, m_Detector.s_BaselineWindow, POSITIVE);
        } else if (propName == "min_baseline_points") {
            ok = readProperty(propName, propValue, m_Detector.s_MinimumBaselinePoints, POSITIVE);
        } else if (propName == "evaluation_samples") {
            ok = readProperty(propName, propValue, m_Detector.s_EvaluationSamples, POSITIVE);
        } else if (propName == "z_threshold") {
            ok = readProperty(propName, propValue, m_Detector.s_ZThreshold, POSITIVE);
        } else if (propName == "relative_threshold") {
            ok = readProperty(propName, propValue, m_Detector.s_RelativeThreshold, NON_NEGATIVE);
        } else if (propName == "minimum_spread") {
            ok = readProperty(propName, propValue, m_Detector.s_MinimumSpread, POSITIVE);
        } else if (propName == "gap_tolerance") {
            ok = readProperty(propName, propValue, m_Detector.s_GapTolerance, NON_NEGATIVE);
        } else if (propName == "cooldown") {
            ok = readProperty(propName, propValue, m_Detector.s_Cooldown, NON_NEGATIVE);
        } else if (propName == "lateness") {
            ok = readProperty(propName, propValue, m_Detector.s_Lateness, NON_NEGATIVE);
        } else if (propName == "max_history") {
            ok = readProperty(propName, propValue, m_Detector.s_MaximumHistory, POSITIVE);
        } else if (hasPrefix(propName, BAD_DIRECTION_PREFIX)) {
            model_t::EDirection direction;
            if (model_t::parseDirection(propValue, direction) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                ok = false;
            } else {
                m_Detector.s_BadDirections[propName.substr(BAD_DIRECTION_PREFIX.size())] = direction;
            }
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << DETECTOR_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processGrouperStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "grace_margin") {
            ok = readProperty(propName, propValue, m_Grouper.s_GraceMargin, NON_NEGATIVE);
        } else if (propName == "quiet_period") {
            ok = readProperty(propName, propValue, m_Grouper.s_QuietPeriod, POSITIVE);
        } else if (hasPrefix(propName, GROUP_PREFIX)) {
            std::string group{propName.substr(GROUP_PREFIX.size())};
            model_t::TStrVec services{readList(propValue)};
            for (const auto& service : services) {
                std::string existing{m_Grouper.correlationKey(service)};
                if (existing != service && existing != GROUP_KEY_PREFIX + group) {
                    LOG_ERROR(<< "Service " << service << " in group " << group
                              << " already belongs to " << existing);
                    ok = false;
                }
            }
            if (services.empty()) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                ok = false;
            }
            if (ok) {
                m_Grouper.s_CorrelationGroups[group] = std::move(services);
            }
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << GROUPER_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processCandidatesStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "lookback") {
            ok = readProperty(propName, propValue, m_Candidates.s_Lookback, NON_NEGATIVE);
        } else if (propName == "lookahead") {
            ok = readProperty(propName, propValue, m_Candidates.s_Lookahead, NON_NEGATIVE);
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << CANDIDATES_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processFeaturesStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "window") {
            ok = readProperty(propName, propValue, m_Features.s_Window, POSITIVE);
        } else if (propName == "min_metric_change") {
            ok = readProperty(propName, propValue, m_Features.s_MinimumMetricChange, NON_NEGATIVE);
        } else if (propName == "signature_baseline") {
            ok = readProperty(propName, propValue, m_Features.s_SignatureBaseline, POSITIVE);
        } else if (propName == "risk_keywords") {
            m_Features.s_RiskKeywords.clear();
            for (const auto& keyword : readList(propValue)) {
                m_Features.s_RiskKeywords.push_back(core::CStringUtils::toLower(keyword));
            }
        } else if (propName == "extraction_threads") {
            ok = readProperty(propName, propValue, m_Features.s_ExtractionThreads, ANY);
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << FEATURES_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processRankerStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "is_before_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_IsBeforeWeight, NON_NEGATIVE);
        } else if (propName == "recency_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_RecencyWeight, NON_NEGATIVE);
        } else if (propName == "recency_scale") {
            ok = readProperty(propName, propValue, m_Ranker.s_RecencyScale, POSITIVE);
        } else if (propName == "metric_delta_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_MetricDeltaWeight, NON_NEGATIVE);
        } else if (propName == "error_log_delta_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_ErrorLogDeltaWeight, NON_NEGATIVE);
        } else if (propName == "error_log_delta_scale") {
            ok = readProperty(propName, propValue, m_Ranker.s_ErrorLogDeltaScale, POSITIVE);
        } else if (propName == "new_error_signature_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_NewErrorSignatureWeight, NON_NEGATIVE);
        } else if (propName == "diff_keyword_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_DiffKeywordWeight, NON_NEGATIVE);
        } else if (propName == "historical_risk_weight") {
            ok = readProperty(propName, propValue, m_Ranker.s_HistoricalRiskWeight, NON_NEGATIVE);
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << RANKER_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processFeedbackStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "min_labels") {
            ok = readProperty(propName, propValue, m_Feedback.s_MinimumLabels, POSITIVE);
        } else if (propName == "holdout_fraction") {
            ok = readProperty(propName, propValue, m_Feedback.s_HoldoutFraction,
                              [](double value) { return value > 0.0 && value < 1.0; });
        } else if (propName == "regularisation") {
            ok = readProperty(propName, propValue, m_Feedback.s_Regularisation, NON_NEGATIVE);
        } else if (propName == "max_training_iterations") {
            ok = readProperty(propName, propValue,
                              m_Feedback.s_MaximumTrainingIterations, POSITIVE);
        } else if (propName == "auto_retrain") {
            ok = readProperty(propName, propValue, m_Feedback.s_AutoRetrain, ANY);
        } else if (propName == "retrain_every") {
            ok = readProperty(propName, propValue, m_Feedback.s_RetrainEvery, POSITIVE);
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << FEEDBACK_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}

bool CRcaConfig::processEngineStanza(const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        bool ok = true;
        if (propName == "run_timeout_ms") {
            ok = readProperty(propName, propValue, m_Engine.s_RunTimeoutMs, POSITIVE);
        } else if (propName == "max_consecutive_failures") {
            ok = readProperty(propName, propValue,
                              m_Engine.s_MaximumConsecutiveFailures, POSITIVE);
        } else if (propName == "run_threads") {
            ok = readProperty(propName, propValue, m_Engine.s_RunThreads, ANY);
        } else if (propName == "rerun_debounce") {
            ok = readProperty(propName, propValue, m_Engine.s_RerunDebounce, NON_NEGATIVE);
        } else if (propName == "activity_capacity") {
            ok = readProperty(propName, propValue, m_Engine.s_ActivityCapacity, POSITIVE);
        } else {
            LOG_ERROR(<< "Unknown property " << propName << " in stanza " << ENGINE_STANZA);
            ok = false;
        }
        result = result && ok;
    }

    return result;
}
}
}
