/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_maths_CBasicStatistics_h
#define INCLUDED_rca_maths_CBasicStatistics_h

#include <maths/ImportExport.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace rca {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Some utilities for computing basic sample statistics such
//! as means and robust measures of location and spread.
class MATHS_EXPORT CBasicStatistics {
public:
    using TDoubleDoublePr = std::pair<double, double>;
    using TDoubleVec = std::vector<double>;

public:
    //! The factor which makes the MAD a consistent estimator of the
    //! standard deviation for normally distributed data.
    static const double MAD_TO_STANDARD_DEVIATION;

public:
    //! Compute the mean of a pair.
    static double mean(const TDoubleDoublePr& samples);

    //! Compute the sample mean.
    //!
    //! \note Returns zero for empty \p data.
    static double mean(const TDoubleVec& data);

    //! Compute the sample median.
    static double median(const TDoubleVec& data);

    //! Compute the median absolute deviation.
    static double mad(const TDoubleVec& data);

    //! Compute the sample median and MAD in one pass over a copy of
    //! \p data.
    static TDoubleDoublePr medianAndMad(const TDoubleVec& data);

    //! Compute the robust z-score of \p x with respect to a baseline with
    //! \p median and \p mad.  The spread estimate is floored at \p minimumSpread.
    static double robustZScore(double x, double median, double mad, double minimumSpread);

    //! Compute the maximum of \p first, \p second and \p third.
    template<typename T>
    static T max(T first, T second, T third) {
        return std::max(std::max(first, second), third);
    }

    //! Compute the minimum of \p first, \p second and \p third.
    template<typename T>
    static T min(T first, T second, T third) {
        return std::min(std::min(first, second), third);
    }
};
}
}

#endif // INCLUDED_rca_maths_CBasicStatistics_h
