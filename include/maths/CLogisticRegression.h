/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_maths_CLogisticRegression_h
#define INCLUDED_rca_maths_CLogisticRegression_h

#include <maths/ImportExport.h>

#include <cstddef>
#include <vector>

namespace rca {
namespace maths {

//! \brief L2 regularised logistic regression.
//!
//! DESCRIPTION:\n
//! Fits the model
//! <pre class="fragment">
//!   \f$P(y = 1 | x) = \frac{1}{1 + e^{-(\beta_0 + \beta^t z(x))}}\f$
//! </pre>
//! where \f$z(x)\f$ standardises each feature to zero mean and unit
//! variance over the training data.  The objective is the weighted mean
//! log-loss plus \f$\frac{\lambda}{2}\|\beta\|^2\f$; the intercept is
//! not penalised.
//!
//! With balanced class weights each example of class \f$c\f$ is weighted
//! by \f$\frac{n}{2 n_c}\f$ so that a rare positive class contributes as
//! much to the loss as the common negative class.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The objective is smooth and strictly convex so plain full batch
//! gradient descent converges; the step size is chosen from an upper
//! bound on the curvature of the standardised problem so no line search
//! is needed.  Training sets here are at most a few thousand labels.
class MATHS_EXPORT CLogisticRegression {
public:
    using TDoubleVec = std::vector<double>;
    using TDoubleVecVec = std::vector<TDoubleVec>;

public:
    static const double DEFAULT_LAMBDA;
    static const std::size_t DEFAULT_MAXIMUM_ITERATIONS;
    static const double DEFAULT_TOLERANCE;

public:
    explicit CLogisticRegression(double lambda = DEFAULT_LAMBDA,
                                 std::size_t maximumIterations = DEFAULT_MAXIMUM_ITERATIONS,
                                 bool balancedClassWeights = true);

    //! Fit the model to the rows \p x with targets \p y in {0, 1}.
    //!
    //! \return False if the data are unusable, i.e. empty, ragged or
    //! containing a single class.
    bool learn(const TDoubleVecVec& x, const TDoubleVec& y);

    //! Compute the probability that \p x belongs to class 1.
    //!
    //! \return False if \p x has the wrong dimension or the model hasn't
    //! been fitted.
    bool predict(const TDoubleVec& x, double& probability) const;

    //! Restore a fitted model from its parameters.
    bool parameters(TDoubleVec means, TDoubleVec scales, TDoubleVec weights, double bias);

    //! Get the number of features.
    std::size_t dimension() const;

    //! Has the model been fitted or restored?
    bool fitted() const;

    //! \name Parameters
    //@{
    const TDoubleVec& means() const;
    const TDoubleVec& scales() const;
    const TDoubleVec& weights() const;
    double bias() const;
    //@}

    //! Get the number of gradient descent iterations used by the last call to learn.
    std::size_t iterations() const;

private:
    //! Compute the linear predictor for standardised features \p z.
    double linearPredictor(const TDoubleVec& z) const;

    //! Standardise \p x using the stored means and scales.
    void standardise(const TDoubleVec& x, TDoubleVec& z) const;

private:
    double m_Lambda;
    std::size_t m_MaximumIterations;
    bool m_BalancedClassWeights;
    std::size_t m_Iterations;
    TDoubleVec m_Means;
    TDoubleVec m_Scales;
    TDoubleVec m_Weights;
    double m_Bias;
};
}
}

#endif // INCLUDED_rca_maths_CLogisticRegression_h
