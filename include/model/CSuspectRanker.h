/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CSuspectRanker_h
#define INCLUDED_rca_model_CSuspectRanker_h

#include <model/CEvidence.h>
#include <model/CRankingModelRegistry.h>
#include <model/CRcaConfig.h>
#include <model/CSuspect.h>
#include <model/ImportExport.h>

#include <string>
#include <utility>
#include <vector>

namespace rca {
namespace model {

//! \brief Scores candidates and orders them into ranked suspects.
//!
//! DESCRIPTION:\n
//! In heuristic mode the score is the weighted sum
//! <pre class="fragment">
//!   w_b * before + w_r * before * exp(-|minutes| / s_r)
//!     + w_m * min(1, max_metric_delta)
//!     + w_e * min(1, max(0, error_log_delta / s_e))
//!     + w_s * new_error_signature + w_k * diff_keyword_hit
//!     + w_h * historical_risk
//! </pre>
//! so changes after the incident started lose the before and recency
//! terms but are still ranked.
//!
//! In learned mode the active model's predicted probability is the
//! score. If the model can't score any candidate the whole run falls back
//! to the heuristic so scores are comparable.
//!
//! Suspects are ordered by score descending, then changes before the
//! incident first, then fewer minutes before the incident, then type
//! priority and finally key. Ranks are 1..N.
class MODEL_EXPORT CSuspectRanker {
public:
    using TCandidateEvidencePr = std::pair<SCandidate, SEvidence>;
    using TCandidateEvidencePrVec = std::vector<TCandidateEvidencePr>;

    //! \brief The outcome of ranking.
    struct MODEL_EXPORT SResult {
        TSuspectVec s_Suspects;
        //! Either "heuristic" or the version of the model used.
        std::string s_ScoredBy;
        //! True if a model was active but couldn't be used.
        bool s_FellBack{false};
    };

public:
    explicit CSuspectRanker(CRcaConfig::SRanker weights,
                            const CRankingModelRegistry* registry = nullptr);

    //! Get the heuristic score of \p evidence.
    double heuristicScore(const SEvidence& evidence) const;

    //! Score and rank \p candidates.
    SResult rank(const TCandidateEvidencePrVec& candidates) const;

    //! Sort \p suspects into rank order and assign their ranks.
    static void order(TSuspectVec& suspects);

private:
    CRcaConfig::SRanker m_Weights;
    const CRankingModelRegistry* m_Registry;
};
}
}

#endif // INCLUDED_rca_model_CSuspectRanker_h
