/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_maths_CTools_h
#define INCLUDED_rca_maths_CTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cmath>

namespace rca {
namespace maths {

//! \brief A collection of utility functions primarily for use by the
//! scoring and learning code.
class MATHS_EXPORT CTools : private core::CNonInstantiatable {
public:
    //! Compute \p x * \p x.
    static double pow2(double x) { return x * x; }

    //! Truncate \p x to the range [\p a, \p b].
    //!
    //! \tparam T Must support operator<.
    template<typename T>
    static const T& truncate(const T& x, const T& a, const T& b) {
        return x < a ? a : (b < x ? b : x);
    }

    //! Sigmoid function of \p p.
    static double sigmoid(double p) {
        return p == 0.0 ? 0.0 : 1.0 / (1.0 + 1.0 / p);
    }

    //! The logistic function.
    //!
    //! i.e. \f$sigmoid\left(\frac{sign (x - x0)}{width}\right)\f$.
    //!
    //! \param[in] x The argument.
    //! \param[in] width The step width.
    //! \param[in] x0 The centre of the step.
    //! \param[in] sign Determines whether it's a step up or down.
    static double logisticFunction(double x, double width = 1.0, double x0 = 0.0, double sign = 1.0) {
        return sigmoid(std::exp(std::copysign(1.0, sign) * (x - x0) / width));
    }

    //! Exponential decay of \p x with characteristic scale \p scale,
    //! i.e. \f$e^{-|x| / scale}\f$.
    static double exponentialDecay(double x, double scale) {
        return std::exp(-std::fabs(x) / scale);
    }

    //! The log of the logistic function, computed stably for large |\p x|.
    static double logLogistic(double x) {
        return x < 0.0 ? x - std::log1p(std::exp(x)) : -std::log1p(std::exp(-x));
    }
};
}
}

#endif // INCLUDED_rca_maths_CTools_h
