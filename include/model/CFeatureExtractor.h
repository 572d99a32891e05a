/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CFeatureExtractor_h
#define INCLUDED_rca_model_CFeatureExtractor_h

#include <core/CNonCopyable.h>
#include <core/Concurrency.h>

#include <model/CEvidence.h>
#include <model/CIncident.h>
#include <model/CRcaConfig.h>
#include <model/CSuspect.h>
#include <model/CTelemetryStore.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <boost/optional.hpp>

#include <functional>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief Computes the evidence linking candidate changes to an incident.
//!
//! DESCRIPTION:\n
//! For each candidate computes:
//!   -# Time proximity: the signed minutes from the change to the
//!      incident start.
//!   -# Metric movement: for every metric of the candidate's service and
//!      the incident's services, the fractional change of the mean in the
//!      window after the change relative to the window before it.
//!   -# Error logs: the relative change in error log count over the same
//!      windows, and whether an error signature appeared after the change
//!      which was not seen in the baseline before it.
//!   -# Payload: whether the change text mentions a risk keyword.
//!   -# History: the fraction of past incidents in which a change of the
//!      same type to the same service was confirmed as the cause.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each computation which fails leaves its fields at zero and extraction
//! carries on. A candidate which can't be processed at all is excluded.
//!
//! Candidates are processed in parallel on a pool owned by the extractor
//! which is shared by all analysis runs.
class MODEL_EXPORT CFeatureExtractor : private core::CNonCopyable {
public:
    //! Computes the historical risk of (type, service) ignoring labels on
    //! the given incident.
    using THistoricalRiskFunc =
        std::function<double(model_t::ESuspectType, const std::string&, const std::string&)>;
    using TCancelledFunc = std::function<bool()>;
    using TOptionalEvidence = boost::optional<SEvidence>;
    using TOptionalEvidenceVec = std::vector<TOptionalEvidence>;

public:
    CFeatureExtractor(CRcaConfig::SFeatures config,
                      TTelemetryStorePtr store,
                      THistoricalRiskFunc historicalRisk = THistoricalRiskFunc{});

    //! Compute the evidence for \p candidate.
    //!
    //! \throws std::invalid_argument If \p candidate is malformed.
    SEvidence extract(const SIncident& incident, const SCandidate& candidate) const;

    //! Compute the evidence for every candidate in parallel.
    //!
    //! \return The evidence in candidate order. Entries are empty for
    //! candidates which failed or were skipped after \p cancelled
    //! returned true.
    TOptionalEvidenceVec extractAll(const SIncident& incident,
                                    const TCandidateVec& candidates,
                                    const TCancelledFunc& cancelled = TCancelledFunc{}) const;

private:
    void timeFeatures(const SIncident& incident, const SCandidate& candidate, SEvidence& evidence) const;
    void metricFeatures(const model_t::TStrSet& services,
                        const SCandidate& candidate,
                        SEvidence& evidence) const;
    void logFeatures(const model_t::TStrSet& services,
                     const SCandidate& candidate,
                     SEvidence& evidence) const;
    void payloadFeatures(const SCandidate& candidate, SEvidence& evidence) const;
    void historyFeatures(const SIncident& incident,
                         const SCandidate& candidate,
                         SEvidence& evidence) const;

private:
    CRcaConfig::SFeatures m_Config;
    TTelemetryStorePtr m_Store;
    THistoricalRiskFunc m_HistoricalRisk;
    core::TExecutorUPtr m_Executor;
};
}
}

#endif // INCLUDED_rca_model_CFeatureExtractor_h
