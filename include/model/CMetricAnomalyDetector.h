/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CMetricAnomalyDetector_h
#define INCLUDED_rca_model_CMetricAnomalyDetector_h

#include <core/CNonCopyable.h>
#include <core/CoreTypes.h>

#include <model/CAnomaly.h>
#include <model/CRcaConfig.h>
#include <model/CTelemetryTypes.h>
#include <model/ImportExport.h>

#include <boost/circular_buffer.hpp>
#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace rca {
namespace model {

//! \brief Detects deviation episodes in individual metric streams.
//!
//! DESCRIPTION:\n
//! Maintains for each (service, metric) a bounded history of samples.
//! Each new sample is scored against a robust baseline, the median and
//! scaled median absolute deviation of the trailing window, excluding
//! the evaluation window and samples which were themselves breaches.
//! The evaluation aggregate is the mean of the latest samples.
//!
//! A breach opens an anomaly episode. The episode is extended by later
//! breaches and closed once the metric has stayed within threshold for
//! the cooldown period. Every transition is published to the callback:
//! open, each extension and close.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Only deviations in a metric's harmful direction are breaches. Too
//! little history means no signal rather than an error.
//!
//! Samples which arrive out of order within the lateness bound are kept
//! for future baselines but are not evaluated. Later samples are dropped.
//!
//! Distinct keys are processed in parallel. Samples for one key are
//! serialised by a per key lock which is held while publishing so that
//! transitions of an episode are seen in order.
class MODEL_EXPORT CMetricAnomalyDetector : private core::CNonCopyable {
public:
    using TAnomalyCallback = std::function<void(const SAnomaly&)>;

    //! The outcome of adding a sample.
    enum EResult {
        E_Accepted, //!< The sample was evaluated.
        E_Late,     //!< Out of order within lateness, stored but not evaluated.
        E_Dropped,  //!< Out of order beyond lateness, discarded.
        E_Invalid   //!< Not a finite value.
    };

    //! The name recorded on anomalies found by this detector.
    static const std::string NAME;

public:
    CMetricAnomalyDetector(CRcaConfig::SDetector config, TAnomalyCallback callback);

    //! Add a sample and publish any resulting episode transitions.
    EResult addSample(const SMetricSample& sample);

    //! Close every episode whose cooldown has expired by \p now.
    void flush(core_t::TTime now);

    //! Get the number of (service, metric) keys seen.
    std::size_t numberKeys() const;

    //! Get the number of episodes currently open.
    std::size_t numberOpenEpisodes() const;

private:
    struct SPoint {
        core_t::TTime s_Time;
        double s_Value;
        bool s_Breach;
    };
    using TPointBuffer = boost::circular_buffer<SPoint>;
    using TOptionalAnomaly = boost::optional<SAnomaly>;

    struct SKeyState {
        explicit SKeyState(std::size_t capacity) : s_History(capacity) {}

        std::mutex s_Mutex;
        TPointBuffer s_History;
        bool s_HasLatest{false};
        core_t::TTime s_Latest{0};
        TOptionalAnomaly s_Episode;
        core_t::TTime s_LastBreach{0};
    };
    using TKeyStatePtr = std::shared_ptr<SKeyState>;
    using TStrStrPr = std::pair<std::string, std::string>;
    using TStrStrPrKeyStatePtrUMap = boost::unordered_map<TStrStrPr, TKeyStatePtr>;

    //! The result of scoring the evaluation window.
    struct SScore {
        bool s_Breach{false};
        double s_ZScore{0.0};
        SAnomalyDetails s_Details;
    };

private:
    TKeyStatePtr state(const std::string& service, const std::string& metric);

    //! Score a new sample against the history of \p state.
    SScore score(const SKeyState& state, const std::string& metric, const SMetricSample& sample) const;

    //! Is \p z, or the relative change of \p aggregate, a breach in \p direction?
    bool isBreach(model_t::EDirection direction, double z, double aggregate, double median) const;

    //! Advance the episode state of \p state given the latest score.
    void updateEpisode(SKeyState& state, const SMetricSample& sample, const SScore& score);

    //! Close the open episode of \p state.
    void closeEpisode(SKeyState& state);

    //! The quiet time after the last breach before an episode closes.
    core_t::TTime effectiveCooldown() const;

private:
    CRcaConfig::SDetector m_Config;
    TAnomalyCallback m_Callback;
    mutable std::mutex m_KeysMutex;
    TStrStrPrKeyStatePtrUMap m_Keys;
};
}
}

#endif // INCLUDED_rca_model_CMetricAnomalyDetector_h
