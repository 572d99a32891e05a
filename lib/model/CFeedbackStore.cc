/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CFeedbackStore.h>

#include <core/CProgramCounters.h>

#include <map>
#include <set>
#include <utility>

namespace rca {
namespace model {

std::uint64_t CFeedbackStore::append(SLabel label) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    label.s_Sequence = m_Labels.size() + 1;
    m_Labels.push_back(std::move(label));
    ++core::CProgramCounters::counter(counter_t::E_RcaNumberLabels);
    return m_Labels.back().s_Sequence;
}

TLabelVec CFeedbackStore::labels() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Labels;
}

TLabelVec CFeedbackStore::latestLabels() const {
    using TStrStrPr = std::pair<std::string, std::string>;
    using TStrStrPrSizeMap = std::map<TStrStrPr, std::size_t>;

    TLabelVec result;
    TStrStrPrSizeMap positions;
    std::lock_guard<std::mutex> lock{m_Mutex};
    for (const auto& label : m_Labels) {
        auto inserted = positions.emplace(TStrStrPr{label.s_IncidentId, label.s_SuspectId},
                                          result.size());
        if (inserted.second) {
            result.push_back(label);
        } else {
            result[inserted.first->second] = label;
        }
    }
    return result;
}

std::size_t CFeedbackStore::size() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_Labels.size();
}

double CFeedbackStore::historicalRisk(model_t::ESuspectType type,
                                      const std::string& service,
                                      const std::string& excludeIncidentId) const {
    model_t::TStrSet labelled;
    model_t::TStrSet caused;
    for (const auto& label : this->latestLabels()) {
        if (label.s_IncidentId == excludeIncidentId || label.s_SuspectType != type ||
            label.s_Service != service) {
            continue;
        }
        labelled.insert(label.s_IncidentId);
        if (label.s_IsCause) {
            caused.insert(label.s_IncidentId);
        }
    }
    return labelled.empty() ? 0.0
                            : static_cast<double>(caused.size()) /
                                  static_cast<double>(labelled.size());
}
}
}
