/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CRcaConfig_h
#define INCLUDED_rca_model_CRcaConfig_h

#include <core/CoreTypes.h>

#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/property_tree/ptree_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief Holds configuration for every stage of root cause analysis.
//!
//! DESCRIPTION:\n
//! Thresholds, window lengths and heuristic weights for the detector,
//! grouper, candidate generator, feature extractor, ranker, feedback loop
//! and engine. Every value has a default in code and can be overridden
//! from an INI file with one stanza per stage, for example:
//! \code
//! [detector]
//! z_threshold = 3.5
//! bad_direction.qps = down
//!
//! [grouper]
//! group.checkout = cart, payments, checkout
//! \endcode
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each stage takes its own nested settings object by value so it can be
//! constructed and tested without a full configuration.
//!
//! Unknown stanzas are ignored with a warning. Unknown properties and
//! invalid values are errors.
class MODEL_EXPORT CRcaConfig {
public:
    using TStrDirectionMap = std::map<std::string, model_t::EDirection>;
    using TStrStrVecMap = std::map<std::string, model_t::TStrVec>;

public:
    //! \name Detector defaults.
    //@{
    static const core_t::TTime DEFAULT_BASELINE_WINDOW;
    static const std::size_t DEFAULT_MINIMUM_BASELINE_POINTS;
    static const std::size_t DEFAULT_EVALUATION_SAMPLES;
    static const double DEFAULT_Z_THRESHOLD;
    //! Zero disables the relative threshold.
    static const double DEFAULT_RELATIVE_THRESHOLD;
    static const double DEFAULT_MINIMUM_SPREAD;
    static const core_t::TTime DEFAULT_GAP_TOLERANCE;
    static const core_t::TTime DEFAULT_COOLDOWN;
    static const core_t::TTime DEFAULT_LATENESS;
    static const std::size_t DEFAULT_MAXIMUM_HISTORY;
    //@}

    //! \name Grouper defaults.
    //@{
    static const core_t::TTime DEFAULT_GRACE_MARGIN;
    static const core_t::TTime DEFAULT_QUIET_PERIOD;
    //@}

    //! \name Candidate generator defaults.
    //@{
    static const core_t::TTime DEFAULT_LOOKBACK;
    static const core_t::TTime DEFAULT_LOOKAHEAD;
    //@}

    //! \name Feature extractor defaults.
    //@{
    static const core_t::TTime DEFAULT_FEATURE_WINDOW;
    static const double DEFAULT_MINIMUM_METRIC_CHANGE;
    static const core_t::TTime DEFAULT_SIGNATURE_BASELINE;
    static const model_t::TStrVec DEFAULT_RISK_KEYWORDS;
    static const std::size_t DEFAULT_EXTRACTION_THREADS;
    //@}

    //! \name Heuristic ranking weight defaults.
    //@{
    static const double DEFAULT_IS_BEFORE_WEIGHT;
    static const double DEFAULT_RECENCY_WEIGHT;
    static const double DEFAULT_RECENCY_SCALE;
    static const double DEFAULT_METRIC_DELTA_WEIGHT;
    static const double DEFAULT_ERROR_LOG_DELTA_WEIGHT;
    static const double DEFAULT_ERROR_LOG_DELTA_SCALE;
    static const double DEFAULT_NEW_ERROR_SIGNATURE_WEIGHT;
    static const double DEFAULT_DIFF_KEYWORD_WEIGHT;
    static const double DEFAULT_HISTORICAL_RISK_WEIGHT;
    //@}

    //! \name Feedback defaults.
    //@{
    static const std::size_t DEFAULT_MINIMUM_LABELS;
    static const double DEFAULT_HOLDOUT_FRACTION;
    static const double DEFAULT_REGULARISATION;
    static const std::size_t DEFAULT_MAXIMUM_TRAINING_ITERATIONS;
    static const bool DEFAULT_AUTO_RETRAIN;
    static const std::size_t DEFAULT_RETRAIN_EVERY;
    //@}

    //! \name Engine defaults.
    //@{
    static const std::int64_t DEFAULT_RUN_TIMEOUT_MS;
    static const std::size_t DEFAULT_MAXIMUM_CONSECUTIVE_FAILURES;
    static const std::size_t DEFAULT_RUN_THREADS;
    static const core_t::TTime DEFAULT_RERUN_DEBOUNCE;
    static const std::size_t DEFAULT_ACTIVITY_CAPACITY;
    //@}

    //! \brief Anomaly detector settings.
    struct MODEL_EXPORT SDetector {
        //! Get the harmful direction of \p metric.
        model_t::EDirection direction(const std::string& metric) const;

        core_t::TTime s_BaselineWindow{DEFAULT_BASELINE_WINDOW};
        std::size_t s_MinimumBaselinePoints{DEFAULT_MINIMUM_BASELINE_POINTS};
        std::size_t s_EvaluationSamples{DEFAULT_EVALUATION_SAMPLES};
        double s_ZThreshold{DEFAULT_Z_THRESHOLD};
        double s_RelativeThreshold{DEFAULT_RELATIVE_THRESHOLD};
        double s_MinimumSpread{DEFAULT_MINIMUM_SPREAD};
        core_t::TTime s_GapTolerance{DEFAULT_GAP_TOLERANCE};
        core_t::TTime s_Cooldown{DEFAULT_COOLDOWN};
        core_t::TTime s_Lateness{DEFAULT_LATENESS};
        std::size_t s_MaximumHistory{DEFAULT_MAXIMUM_HISTORY};
        TStrDirectionMap s_BadDirections{defaultBadDirections()};
    };

    //! \brief Incident grouper settings.
    struct MODEL_EXPORT SGrouper {
        //! Get the correlation key of \p service: its group if it belongs
        //! to one and otherwise the service itself.
        std::string correlationKey(const std::string& service) const;

        core_t::TTime s_GraceMargin{DEFAULT_GRACE_MARGIN};
        core_t::TTime s_QuietPeriod{DEFAULT_QUIET_PERIOD};
        //! Named groups of services which fail together.
        TStrStrVecMap s_CorrelationGroups;
    };

    //! \brief Candidate generator settings.
    struct MODEL_EXPORT SCandidates {
        core_t::TTime s_Lookback{DEFAULT_LOOKBACK};
        core_t::TTime s_Lookahead{DEFAULT_LOOKAHEAD};
    };

    //! \brief Feature extractor settings.
    struct MODEL_EXPORT SFeatures {
        core_t::TTime s_Window{DEFAULT_FEATURE_WINDOW};
        double s_MinimumMetricChange{DEFAULT_MINIMUM_METRIC_CHANGE};
        core_t::TTime s_SignatureBaseline{DEFAULT_SIGNATURE_BASELINE};
        model_t::TStrVec s_RiskKeywords{DEFAULT_RISK_KEYWORDS};
        std::size_t s_ExtractionThreads{DEFAULT_EXTRACTION_THREADS};
    };

    //! \brief Heuristic ranking weights.
    struct MODEL_EXPORT SRanker {
        double s_IsBeforeWeight{DEFAULT_IS_BEFORE_WEIGHT};
        double s_RecencyWeight{DEFAULT_RECENCY_WEIGHT};
        //! The recency decay scale in minutes.
        double s_RecencyScale{DEFAULT_RECENCY_SCALE};
        double s_MetricDeltaWeight{DEFAULT_METRIC_DELTA_WEIGHT};
        double s_ErrorLogDeltaWeight{DEFAULT_ERROR_LOG_DELTA_WEIGHT};
        //! The error log delta at which its contribution saturates.
        double s_ErrorLogDeltaScale{DEFAULT_ERROR_LOG_DELTA_SCALE};
        double s_NewErrorSignatureWeight{DEFAULT_NEW_ERROR_SIGNATURE_WEIGHT};
        double s_DiffKeywordWeight{DEFAULT_DIFF_KEYWORD_WEIGHT};
        double s_HistoricalRiskWeight{DEFAULT_HISTORICAL_RISK_WEIGHT};
    };

    //! \brief Feedback and retraining settings.
    struct MODEL_EXPORT SFeedback {
        std::size_t s_MinimumLabels{DEFAULT_MINIMUM_LABELS};
        double s_HoldoutFraction{DEFAULT_HOLDOUT_FRACTION};
        double s_Regularisation{DEFAULT_REGULARISATION};
        std::size_t s_MaximumTrainingIterations{DEFAULT_MAXIMUM_TRAINING_ITERATIONS};
        bool s_AutoRetrain{DEFAULT_AUTO_RETRAIN};
        //! The number of new labels between automatic retrains.
        std::size_t s_RetrainEvery{DEFAULT_RETRAIN_EVERY};
    };

    //! \brief Engine settings.
    struct MODEL_EXPORT SEngine {
        std::int64_t s_RunTimeoutMs{DEFAULT_RUN_TIMEOUT_MS};
        std::size_t s_MaximumConsecutiveFailures{DEFAULT_MAXIMUM_CONSECUTIVE_FAILURES};
        //! Zero runs analysis synchronously on the ingesting thread.
        std::size_t s_RunThreads{DEFAULT_RUN_THREADS};
        core_t::TTime s_RerunDebounce{DEFAULT_RERUN_DEBOUNCE};
        std::size_t s_ActivityCapacity{DEFAULT_ACTIVITY_CAPACITY};
    };

public:
    //! Get the default directions in which metrics are harmful.
    static TStrDirectionMap defaultBadDirections();

    //! Initialize from an INI file.
    bool init(const std::string& configFile);

    //! Initialize from a property tree.
    bool init(const boost::property_tree::ptree& propTree);

    const SDetector& detector() const { return m_Detector; }
    SDetector& detector() { return m_Detector; }
    const SGrouper& grouper() const { return m_Grouper; }
    SGrouper& grouper() { return m_Grouper; }
    const SCandidates& candidates() const { return m_Candidates; }
    SCandidates& candidates() { return m_Candidates; }
    const SFeatures& features() const { return m_Features; }
    SFeatures& features() { return m_Features; }
    const SRanker& ranker() const { return m_Ranker; }
    SRanker& ranker() { return m_Ranker; }
    const SFeedback& feedback() const { return m_Feedback; }
    SFeedback& feedback() { return m_Feedback; }
    const SEngine& engine() const { return m_Engine; }
    SEngine& engine() { return m_Engine; }

private:
    bool processDetectorStanza(const boost::property_tree::ptree& propertyTree);
    bool processGrouperStanza(const boost::property_tree::ptree& propertyTree);
    bool processCandidatesStanza(const boost::property_tree::ptree& propertyTree);
    bool processFeaturesStanza(const boost::property_tree::ptree& propertyTree);
    bool processRankerStanza(const boost::property_tree::ptree& propertyTree);
    bool processFeedbackStanza(const boost::property_tree::ptree& propertyTree);
    bool processEngineStanza(const boost::property_tree::ptree& propertyTree);

private:
    SDetector m_Detector;
    SGrouper m_Grouper;
    SCandidates m_Candidates;
    SFeatures m_Features;
    SRanker m_Ranker;
    SFeedback m_Feedback;
    SEngine m_Engine;
};
}
}

#endif // INCLUDED_rca_model_CRcaConfig_h
