/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CRetrainer.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>

#include <maths/CLogisticRegression.h>
#include <maths/CRankingMetrics.h>

#include <model/CEvidence.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace rca {
namespace model {
namespace {
using TDoubleVec = std::vector<double>;
using TDoubleVecVec = std::vector<TDoubleVec>;
using TSizeVec = std::vector<std::size_t>;

bool hasBothClasses(const TSizeVec& indices, const TDoubleVec& y) {
    bool positive{false};
    bool negative{false};
    for (auto i : indices) {
        (y[i] > 0.5 ? positive : negative) = true;
    }
    return positive && negative;
}
}

CRetrainer::CRetrainer(CRcaConfig::SFeedback config,
                       CRcaConfig::SRanker weights,
                       const CFeedbackStore& store,
                       CRankingModelRegistry& registry,
                       TResultCallback callback)
    : m_Config{std::move(config)}, m_Heuristic{std::move(weights)}, m_Store{store},
      m_Registry{registry}, m_Callback{std::move(callback)} {
}

CRetrainer::~CRetrainer() {
    this->wait();
}

CRetrainer::SResult CRetrainer::retrain(core_t::TTime now) {
    SResult result{this->retrainImpl(now)};
    if (m_Callback) {
        m_Callback(result);
    }
    return result;
}

bool CRetrainer::retrainAsync(core_t::TTime now) {
    std::lock_guard<std::mutex> lock{m_ThreadMutex};
    if (m_Running.load()) {
        LOG_DEBUG(<< "Retraining already in progress");
        return false;
    }
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    m_Running.store(true);
    m_Thread = std::thread([this, now] {
        try {
            this->retrain(now);
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Background retraining failed: " << e.what());
        }
        m_Running.store(false);
    });
    return true;
}

bool CRetrainer::busy() const {
    return m_Running.load();
}

void CRetrainer::wait() {
    std::lock_guard<std::mutex> lock{m_ThreadMutex};
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

std::string CRetrainer::print(EOutcome outcome) {
    switch (outcome) {
    case E_InsufficientLabels:
        return "insufficient_labels";
    case E_FitFailed:
        return "fit_failed";
    case E_Rejected:
        return "rejected";
    case E_Activated:
        return "activated";
    }
    return "unknown";
}

CRetrainer::SResult CRetrainer::retrainImpl(core_t::TTime now) {
    std::lock_guard<std::mutex> lock{m_RetrainMutex};

    SResult result;
    TLabelVec labels{m_Store.latestLabels()};
    result.s_Labels = labels.size();
    if (labels.size() < m_Config.s_MinimumLabels) {
        LOG_DEBUG(<< "Not retraining with " << labels.size() << " labels, need "
                  << m_Config.s_MinimumLabels);
        result.s_Outcome = E_InsufficientLabels;
        return result;
    }

    ++core::CProgramCounters::counter(counter_t::E_RcaNumberRetrains);

    const model_t::TStrVec& names = SEvidence::featureNames();
    TDoubleVecVec x;
    TDoubleVec y;
    TDoubleVec heuristic;
    x.reserve(labels.size());
    for (const auto& label : labels) {
        TDoubleVec features;
        if (label.s_Evidence.toFeatureVector(names, features) == false) {
            LOG_ERROR(<< "Label " << label.s_Sequence << " has incomplete evidence");
            result.s_Outcome = E_FitFailed;
            return result;
        }
        x.push_back(std::move(features));
        y.push_back(label.s_IsCause ? 1.0 : 0.0);
        heuristic.push_back(m_Heuristic.heuristicScore(label.s_Evidence));
    }

    TSizeVec all(labels.size());
    for (std::size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    if (hasBothClasses(all, y) == false) {
        LOG_INFO(<< "Not retraining: all " << labels.size() << " labels are in one class");
        result.s_Outcome = E_FitFailed;
        return result;
    }

    // Stratified split holding out every k'th example of each class.
    std::size_t k{std::max(std::size_t{2},
                           static_cast<std::size_t>(std::round(1.0 / m_Config.s_HoldoutFraction)))};
    TSizeVec training;
    TSizeVec holdout;
    std::size_t seen[]{0, 0};
    for (std::size_t i = 0; i < labels.size(); ++i) {
        std::size_t& count = seen[y[i] > 0.5 ? 1 : 0];
        ((++count % k) == 0 ? holdout : training).push_back(i);
    }
    if (hasBothClasses(training, y) == false) {
        training = all;
    }
    if (hasBothClasses(holdout, y) == false) {
        LOG_DEBUG(<< "Hold out lacks both classes, validating on all labels");
        holdout = all;
    }

    maths::CLogisticRegression candidate{m_Config.s_Regularisation,
                                         m_Config.s_MaximumTrainingIterations};
    {
        TDoubleVecVec trainingX;
        TDoubleVec trainingY;
        for (auto i : training) {
            trainingX.push_back(x[i]);
            trainingY.push_back(y[i]);
        }
        if (candidate.learn(trainingX, trainingY) == false) {
            LOG_ERROR(<< "Failed to fit ranking model on " << training.size() << " labels");
            result.s_Outcome = E_FitFailed;
            return result;
        }
    }

    TDoubleVec modelScores;
    TDoubleVec heuristicScores;
    TDoubleVec holdoutY;
    for (auto i : holdout) {
        double probability;
        if (candidate.predict(x[i], probability) == false) {
            result.s_Outcome = E_FitFailed;
            return result;
        }
        modelScores.push_back(probability);
        heuristicScores.push_back(heuristic[i]);
        holdoutY.push_back(y[i]);
    }
    result.s_ModelAuc = maths::CRankingMetrics::auc(modelScores, holdoutY);
    result.s_HeuristicAuc = maths::CRankingMetrics::auc(heuristicScores, holdoutY);

    if (result.s_ModelAuc < result.s_HeuristicAuc) {
        LOG_INFO(<< "Rejected retrained model with AUC " << result.s_ModelAuc
                 << " below heuristic AUC " << result.s_HeuristicAuc);
        result.s_Outcome = E_Rejected;
        return result;
    }

    maths::CLogisticRegression refitted{m_Config.s_Regularisation,
                                        m_Config.s_MaximumTrainingIterations};
    if (refitted.learn(x, y) == false) {
        LOG_ERROR(<< "Failed to fit ranking model on " << labels.size() << " labels");
        result.s_Outcome = E_FitFailed;
        return result;
    }

    auto trained = std::make_shared<const CRankingModel>(
        m_Registry.nextVersion(), names, std::move(refitted), labels.size(),
        result.s_ModelAuc, now);
    if (m_Registry.publish(trained) == false) {
        result.s_Outcome = E_FitFailed;
        return result;
    }

    result.s_Version = trained->version();
    result.s_Outcome = E_Activated;
    return result;
}
}
}
