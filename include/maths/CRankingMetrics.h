/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_maths_CRankingMetrics_h
#define INCLUDED_rca_maths_CRankingMetrics_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cstddef>
#include <vector>

namespace rca {
namespace maths {

//! \brief Measures of how well scores order a set of labelled items.
//!
//! DESCRIPTION:\n
//! The area under the ROC curve is used to decide whether a newly trained
//! ranking model beats the heuristic on held out labels.  The rank based
//! measures summarise where the true cause of an incident landed in its
//! ranked suspect list.
class MATHS_EXPORT CRankingMetrics : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;

public:
    //! Compute the area under the ROC curve of \p scores for binary
    //! \p labels.  Tied scores contribute half.
    //!
    //! \note Returns 0.5 if either class is absent since no ordering is
    //! then better than chance.
    static double auc(const TDoubleVec& scores, const TDoubleVec& labels);

    //! One if the 1-based \p rank is at most \p k, zero otherwise.  A rank
    //! of zero means the item wasn't ranked.
    static double precisionAtK(std::size_t rank, std::size_t k);

    //! The reciprocal of the 1-based \p rank or zero if unranked.
    static double reciprocalRank(std::size_t rank);
};
}
}

#endif // INCLUDED_rca_maths_CRankingMetrics_h
