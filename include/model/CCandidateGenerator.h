/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CCandidateGenerator_h
#define INCLUDED_rca_model_CCandidateGenerator_h

#include <model/CIncident.h>
#include <model/CRcaConfig.h>
#include <model/CSuspect.h>
#include <model/CTelemetryStore.h>
#include <model/ImportExport.h>

namespace rca {
namespace model {

//! \brief Proposes the change events near an incident as candidate causes.
//!
//! DESCRIPTION:\n
//! Retrieves the deployments, config changes and flag flips for the
//! incident's services, and flag flips which apply to every service, in
//! the window [start - lookback, start + lookahead]. Changes after the
//! incident's end are excluded.
//!
//! There is one candidate per (type, key) and candidates are ordered by
//! change time descending, then type priority, then key.
class MODEL_EXPORT CCandidateGenerator {
public:
    CCandidateGenerator(CRcaConfig::SCandidates config, TTelemetryStorePtr store);

    //! Get the candidates for \p incident.
    TCandidateVec generate(const SIncident& incident) const;

private:
    CRcaConfig::SCandidates m_Config;
    TTelemetryStorePtr m_Store;
};
}
}

#endif // INCLUDED_rca_model_CCandidateGenerator_h
