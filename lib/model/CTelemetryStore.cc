/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CTelemetryStore.h>

#include <algorithm>

namespace rca {
namespace model {
namespace {

//! Insert \p value keeping \p values sorted by time. Equal times keep
//! arrival order.
template<typename T>
void insertSorted(std::vector<T>& values, const T& value) {
    auto position = std::upper_bound(
        values.begin(), values.end(), value.s_Time,
        [](core_t::TTime time, const T& other) { return time < other.s_Time; });
    values.insert(position, value);
}

//! Copy the values with time in [\p from, \p to).
template<typename T>
std::vector<T> slice(const std::vector<T>& values, core_t::TTime from, core_t::TTime to) {
    auto begin = std::lower_bound(
        values.begin(), values.end(), from,
        [](const T& value, core_t::TTime time) { return value.s_Time < time; });
    auto end = std::lower_bound(
        begin, values.end(), to,
        [](const T& value, core_t::TTime time) { return value.s_Time < time; });
    return std::vector<T>(begin, end);
}
}

void CInMemoryTelemetryStore::addMetric(const SMetricSample& sample) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    insertSorted(m_Metrics[sample.s_Service], sample);
    m_MetricNames[sample.s_Service].insert(sample.s_Metric);
}

void CInMemoryTelemetryStore::addLog(const SLogEntry& entry) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    insertSorted(m_Logs[entry.s_Service], entry);
}

void CInMemoryTelemetryStore::addChange(const SChangeEvent& change) {
    std::lock_guard<std::mutex> lock{m_Mutex};
    insertSorted(m_Changes[change.isGlobal() ? std::string{} : change.s_Service], change);
}

CTelemetryStore::TMetricSampleVec
CInMemoryTelemetryStore::metrics(const std::string& service, core_t::TTime from, core_t::TTime to) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Metrics.find(service);
    return i == m_Metrics.end() ? TMetricSampleVec{} : slice(i->second, from, to);
}

CTelemetryStore::TLogEntryVec
CInMemoryTelemetryStore::logs(const std::string& service, core_t::TTime from, core_t::TTime to) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_Logs.find(service);
    return i == m_Logs.end() ? TLogEntryVec{} : slice(i->second, from, to);
}

CTelemetryStore::TChangeEventVec
CInMemoryTelemetryStore::changes(const model_t::TStrSet& services,
                                 core_t::TTime from,
                                 core_t::TTime to,
                                 bool includeGlobal) const {
    if (to < from) {
        return {};
    }

    model_t::TStrSet keys{services};
    keys.erase(std::string{});
    if (includeGlobal) {
        keys.insert(std::string{});
    }

    TChangeEventVec result;
    std::lock_guard<std::mutex> lock{m_Mutex};
    for (const auto& key : keys) {
        auto i = m_Changes.find(key);
        if (i != m_Changes.end()) {
            TChangeEventVec changes{slice(i->second, from, to + 1)};
            result.insert(result.end(), changes.begin(), changes.end());
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const SChangeEvent& lhs, const SChangeEvent& rhs) {
                         return lhs.s_Time < rhs.s_Time;
                     });
    return result;
}

model_t::TStrSet CInMemoryTelemetryStore::metricNames(const std::string& service) const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    auto i = m_MetricNames.find(service);
    return i == m_MetricNames.end() ? model_t::TStrSet{} : i->second;
}
}
}
