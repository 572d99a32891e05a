/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CRetrainer_h
#define INCLUDED_rca_model_CRetrainer_h

#include <core/CNonCopyable.h>
#include <core/CoreTypes.h>

#include <model/CFeedbackStore.h>
#include <model/CRankingModelRegistry.h>
#include <model/CRcaConfig.h>
#include <model/CSuspectRanker.h>
#include <model/ImportExport.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace rca {
namespace model {

//! \brief Fits new ranking models from labelled suspects.
//!
//! DESCRIPTION:\n
//! Once at least the minimum number of labelled examples exist, fits a
//! logistic regression on (evidence, label) pairs using the latest label
//! for each suspect. The candidate model is validated on a held out split
//! against the heuristic scorer and is only activated if its AUC is at
//! least the heuristic's. The activated model is then refitted on every
//! label.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The hold out split is stratified and deterministic: every k'th example
//! of each class in submission order is held out. If that leaves the hold
//! out without both classes the comparison uses every example.
//!
//! Asynchronous retraining runs on a single background thread. A request
//! while one is running is rejected rather than queued.
class MODEL_EXPORT CRetrainer : private core::CNonCopyable {
public:
    //! The outcome of a retraining attempt.
    enum EOutcome {
        E_InsufficientLabels, //!< Fewer labels than the minimum.
        E_FitFailed,          //!< The model couldn't be fitted.
        E_Rejected,           //!< The model didn't beat the heuristic.
        E_Activated           //!< A new model version is active.
    };

    struct MODEL_EXPORT SResult {
        EOutcome s_Outcome{E_InsufficientLabels};
        std::size_t s_Labels{0};
        std::string s_Version;
        double s_ModelAuc{0.0};
        double s_HeuristicAuc{0.0};
    };

    using TResultCallback = std::function<void(const SResult&)>;

public:
    CRetrainer(CRcaConfig::SFeedback config,
               CRcaConfig::SRanker weights,
               const CFeedbackStore& store,
               CRankingModelRegistry& registry,
               TResultCallback callback = TResultCallback{});
    ~CRetrainer();

    //! Retrain now on the calling thread.
    SResult retrain(core_t::TTime now);

    //! Retrain on a background thread.
    //!
    //! \return False if retraining is already in progress.
    bool retrainAsync(core_t::TTime now);

    //! Is background retraining in progress?
    bool busy() const;

    //! Wait for any background retraining to finish.
    void wait();

    //! Get the name of \p outcome.
    static std::string print(EOutcome outcome);

private:
    SResult retrainImpl(core_t::TTime now);

private:
    CRcaConfig::SFeedback m_Config;
    CSuspectRanker m_Heuristic;
    const CFeedbackStore& m_Store;
    CRankingModelRegistry& m_Registry;
    TResultCallback m_Callback;
    //! Serialises retraining.
    std::mutex m_RetrainMutex;
    std::mutex m_ThreadMutex;
    std::atomic<bool> m_Running{false};
    std::thread m_Thread;
};
}
}

#endif // INCLUDED_rca_model_CRetrainer_h
