/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CTelemetryStore_h
#define INCLUDED_rca_model_CTelemetryStore_h

#include <core/CoreTypes.h>

#include <model/CTelemetryTypes.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/unordered_map.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief Interface to the store of raw telemetry.
//!
//! DESCRIPTION:\n
//! Metric samples, logs and change events are written by ingestion and
//! read by feature extraction and candidate generation. Implementations
//! must be safe to read and write concurrently.
//!
//! Metric and log queries cover the half open interval [\p from, \p to).
//! Change queries cover the closed interval [\p from, \p to].
class MODEL_EXPORT CTelemetryStore {
public:
    using TMetricSampleVec = std::vector<SMetricSample>;
    using TLogEntryVec = std::vector<SLogEntry>;
    using TChangeEventVec = std::vector<SChangeEvent>;

public:
    virtual ~CTelemetryStore() = default;

    virtual void addMetric(const SMetricSample& sample) = 0;
    virtual void addLog(const SLogEntry& entry) = 0;
    virtual void addChange(const SChangeEvent& change) = 0;

    //! Get the samples of every metric of \p service in time order.
    virtual TMetricSampleVec
    metrics(const std::string& service, core_t::TTime from, core_t::TTime to) const = 0;

    //! Get the logs of \p service in time order.
    virtual TLogEntryVec
    logs(const std::string& service, core_t::TTime from, core_t::TTime to) const = 0;

    //! Get the changes to any of \p services in time order.
    //!
    //! \param[in] includeGlobal If true also return changes which apply
    //! to every service.
    virtual TChangeEventVec changes(const model_t::TStrSet& services,
                                    core_t::TTime from,
                                    core_t::TTime to,
                                    bool includeGlobal) const = 0;

    //! Get the names of the metrics seen for \p service.
    virtual model_t::TStrSet metricNames(const std::string& service) const = 0;
};

//! \brief A thread safe in-memory telemetry store.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Records are kept per service sorted by time. Inserts are usually
//! appends so the cost of keeping them sorted is small.
class MODEL_EXPORT CInMemoryTelemetryStore : public CTelemetryStore {
public:
    void addMetric(const SMetricSample& sample) override;
    void addLog(const SLogEntry& entry) override;
    void addChange(const SChangeEvent& change) override;

    TMetricSampleVec
    metrics(const std::string& service, core_t::TTime from, core_t::TTime to) const override;
    TLogEntryVec
    logs(const std::string& service, core_t::TTime from, core_t::TTime to) const override;
    TChangeEventVec changes(const model_t::TStrSet& services,
                            core_t::TTime from,
                            core_t::TTime to,
                            bool includeGlobal) const override;
    model_t::TStrSet metricNames(const std::string& service) const override;

private:
    using TStrMetricSampleVecUMap = boost::unordered_map<std::string, TMetricSampleVec>;
    using TStrLogEntryVecUMap = boost::unordered_map<std::string, TLogEntryVec>;
    using TStrChangeEventVecUMap = boost::unordered_map<std::string, TChangeEventVec>;
    using TStrStrSetUMap = boost::unordered_map<std::string, model_t::TStrSet>;

private:
    mutable std::mutex m_Mutex;
    TStrMetricSampleVecUMap m_Metrics;
    TStrLogEntryVecUMap m_Logs;
    //! Keyed by service, global changes under the empty string.
    TStrChangeEventVecUMap m_Changes;
    TStrStrSetUMap m_MetricNames;
};

using TTelemetryStorePtr = std::shared_ptr<CTelemetryStore>;
}
}

#endif // INCLUDED_rca_model_CTelemetryStore_h
