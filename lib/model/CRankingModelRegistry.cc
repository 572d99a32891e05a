/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CRankingModelRegistry.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CStringUtils.h>

#include <atomic>

namespace rca {
namespace model {

CRankingModelRegistry::TRankingModelCPtr CRankingModelRegistry::active() const {
    return std::atomic_load(&m_Active);
}

bool CRankingModelRegistry::publish(TRankingModelCPtr model, bool activate) {
    if (model == nullptr) {
        LOG_ERROR(<< "Can't publish a null ranking model");
        return false;
    }
    if (model->isValid() == false) {
        LOG_ERROR(<< "Can't publish invalid ranking model " << model->version());
        return false;
    }

    std::lock_guard<std::mutex> lock{m_HistoryMutex};
    for (const auto& existing : m_History) {
        if (existing->version() == model->version()) {
            LOG_ERROR(<< "Ranking model version " << model->version() << " already exists");
            return false;
        }
    }
    m_History.push_back(model);
    if (activate) {
        std::atomic_store(&m_Active, model);
        ++core::CProgramCounters::counter(counter_t::E_RcaNumberModelActivations);
        LOG_INFO(<< "Activated ranking model " << model->version() << " trained on "
                 << model->trainedOn() << " labels with AUC " << model->auc());
    }
    return true;
}

bool CRankingModelRegistry::activate(const std::string& version) {
    std::lock_guard<std::mutex> lock{m_HistoryMutex};
    for (const auto& model : m_History) {
        if (model->version() == version) {
            std::atomic_store(&m_Active, model);
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberModelActivations);
            LOG_INFO(<< "Activated ranking model " << version);
            return true;
        }
    }
    LOG_ERROR(<< "Unknown ranking model version " << version);
    return false;
}

void CRankingModelRegistry::deactivate() {
    std::atomic_store(&m_Active, TRankingModelCPtr{});
    LOG_INFO(<< "Deactivated ranking model, scoring heuristically");
}

CRankingModelRegistry::TRankingModelCPtrVec CRankingModelRegistry::versions() const {
    std::lock_guard<std::mutex> lock{m_HistoryMutex};
    return m_History;
}

std::string CRankingModelRegistry::nextVersion() const {
    std::lock_guard<std::mutex> lock{m_HistoryMutex};
    std::size_t n{m_History.size() + 1};
    for (;;) {
        std::string candidate{"v" + core::CStringUtils::typeToString(n)};
        bool used{false};
        for (const auto& model : m_History) {
            used = used || model->version() == candidate;
        }
        if (used == false) {
            return candidate;
        }
        ++n;
    }
}
}
}
