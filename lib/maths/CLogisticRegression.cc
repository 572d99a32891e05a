/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CLogisticRegression.h>

#include <core/CLogger.h>

#include <maths/CTools.h>

#include <algorithm>
#include <cmath>

namespace rca {
namespace maths {
namespace {
const double MINIMUM_SCALE{1e-12};
}

const double CLogisticRegression::DEFAULT_LAMBDA{0.01};
const std::size_t CLogisticRegression::DEFAULT_MAXIMUM_ITERATIONS{2000};
const double CLogisticRegression::DEFAULT_TOLERANCE{1e-7};

CLogisticRegression::CLogisticRegression(double lambda, std::size_t maximumIterations, bool balancedClassWeights)
    : m_Lambda{std::max(lambda, 0.0)}, m_MaximumIterations{maximumIterations},
      m_BalancedClassWeights{balancedClassWeights}, m_Iterations{0}, m_Bias{0.0} {
}

bool CLogisticRegression::learn(const TDoubleVecVec& x, const TDoubleVec& y) {
    if (x.empty() || x.size() != y.size()) {
        LOG_ERROR(<< "Bad training data: " << x.size() << " rows and " << y.size() << " targets");
        return false;
    }
    std::size_t n{x.size()};
    std::size_t d{x[0].size()};
    for (const auto& row : x) {
        if (row.size() != d) {
            LOG_ERROR(<< "Ragged training data: expected " << d << " features got " << row.size());
            return false;
        }
    }

    std::size_t positives{static_cast<std::size_t>(
        std::count_if(y.begin(), y.end(), [](double yi) { return yi > 0.5; }))};
    if (positives == 0 || positives == n) {
        LOG_DEBUG(<< "Can't fit classifier to a single class");
        return false;
    }

    // Per example weights.
    TDoubleVec weights(n, 1.0);
    if (m_BalancedClassWeights) {
        double positiveWeight{static_cast<double>(n) / (2.0 * static_cast<double>(positives))};
        double negativeWeight{static_cast<double>(n) /
                              (2.0 * static_cast<double>(n - positives))};
        for (std::size_t i = 0; i < n; ++i) {
            weights[i] = y[i] > 0.5 ? positiveWeight : negativeWeight;
        }
    }
    double totalWeight{0.0};
    for (auto weight : weights) {
        totalWeight += weight;
    }

    // Standardise.
    m_Means.assign(d, 0.0);
    m_Scales.assign(d, 1.0);
    for (const auto& row : x) {
        for (std::size_t j = 0; j < d; ++j) {
            m_Means[j] += row[j] / static_cast<double>(n);
        }
    }
    TDoubleVec variances(d, 0.0);
    for (const auto& row : x) {
        for (std::size_t j = 0; j < d; ++j) {
            variances[j] += CTools::pow2(row[j] - m_Means[j]) / static_cast<double>(n);
        }
    }
    for (std::size_t j = 0; j < d; ++j) {
        double scale{std::sqrt(variances[j])};
        m_Scales[j] = scale > MINIMUM_SCALE ? scale : 1.0;
    }
    TDoubleVecVec z(n);
    for (std::size_t i = 0; i < n; ++i) {
        this->standardise(x[i], z[i]);
    }

    // The Hessian of the mean log-loss is bounded by 0.25 * (d + 1) for
    // standardised features plus the intercept.
    double curvature{0.25 * static_cast<double>(d + 1) + m_Lambda};
    double step{1.0 / curvature};

    m_Weights.assign(d, 0.0);
    m_Bias = 0.0;
    TDoubleVec gradient(d);
    for (m_Iterations = 0; m_Iterations < m_MaximumIterations; ++m_Iterations) {
        std::fill(gradient.begin(), gradient.end(), 0.0);
        double biasGradient{0.0};
        for (std::size_t i = 0; i < n; ++i) {
            double residual{CTools::logisticFunction(this->linearPredictor(z[i])) - y[i]};
            residual *= weights[i] / totalWeight;
            for (std::size_t j = 0; j < d; ++j) {
                gradient[j] += residual * z[i][j];
            }
            biasGradient += residual;
        }
        double norm{CTools::pow2(biasGradient)};
        for (std::size_t j = 0; j < d; ++j) {
            gradient[j] += m_Lambda * m_Weights[j];
            norm += CTools::pow2(gradient[j]);
        }
        if (std::sqrt(norm) < DEFAULT_TOLERANCE) {
            break;
        }
        for (std::size_t j = 0; j < d; ++j) {
            m_Weights[j] -= step * gradient[j];
        }
        m_Bias -= step * biasGradient;
    }
    LOG_DEBUG(<< "Fitted logistic regression to " << n << " examples in "
              << m_Iterations << " iterations");

    return true;
}

bool CLogisticRegression::predict(const TDoubleVec& x, double& probability) const {
    if (this->fitted() == false) {
        LOG_ERROR(<< "Predicting with an unfitted model");
        return false;
    }
    if (x.size() != m_Weights.size()) {
        LOG_ERROR(<< "Dimension mismatch: expected " << m_Weights.size()
                  << " features got " << x.size());
        return false;
    }
    TDoubleVec z;
    this->standardise(x, z);
    probability = CTools::logisticFunction(this->linearPredictor(z));
    return std::isfinite(probability);
}

bool CLogisticRegression::parameters(TDoubleVec means, TDoubleVec scales, TDoubleVec weights, double bias) {
    if (means.size() != weights.size() || scales.size() != weights.size()) {
        LOG_ERROR(<< "Inconsistent parameter dimensions " << means.size() << ", "
                  << scales.size() << ", " << weights.size());
        return false;
    }
    for (auto scale : scales) {
        if (!(scale > 0.0)) {
            LOG_ERROR(<< "Invalid feature scale " << scale);
            return false;
        }
    }
    m_Means = std::move(means);
    m_Scales = std::move(scales);
    m_Weights = std::move(weights);
    m_Bias = bias;
    return true;
}

std::size_t CLogisticRegression::dimension() const {
    return m_Weights.size();
}

bool CLogisticRegression::fitted() const {
    return m_Weights.empty() == false;
}

const CLogisticRegression::TDoubleVec& CLogisticRegression::means() const {
    return m_Means;
}

const CLogisticRegression::TDoubleVec& CLogisticRegression::scales() const {
    return m_Scales;
}

const CLogisticRegression::TDoubleVec& CLogisticRegression::weights() const {
    return m_Weights;
}

double CLogisticRegression::bias() const {
    return m_Bias;
}

std::size_t CLogisticRegression::iterations() const {
    return m_Iterations;
}

double CLogisticRegression::linearPredictor(const TDoubleVec& z) const {
    double result{m_Bias};
    for (std::size_t j = 0; j < m_Weights.size(); ++j) {
        result += m_Weights[j] * z[j];
    }
    return result;
}

void CLogisticRegression::standardise(const TDoubleVec& x, TDoubleVec& z) const {
    z.resize(x.size());
    for (std::size_t j = 0; j < x.size(); ++j) {
        z[j] = (x[j] - m_Means[j]) / m_Scales[j];
    }
}
}
}
