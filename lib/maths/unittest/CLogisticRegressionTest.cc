/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CLogisticRegression.h>
#include <maths/CRankingMetrics.h>

#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <vector>

BOOST_AUTO_TEST_SUITE(CLogisticRegressionTest)

using TDoubleVec = std::vector<double>;
using TDoubleVecVec = std::vector<TDoubleVec>;

namespace {

//! One informative feature on a large scale and one noise feature.
void generateData(std::size_t n, TDoubleVecVec& x, TDoubleVec& y) {
    rca::test::CRandomNumbers rng;
    TDoubleVec signal;
    TDoubleVec noise;
    TDoubleVec jitter;
    rng.generateNormalSamples(100.0, 400.0, n, signal);
    rng.generateUniformSamples(0.0, 1.0, n, noise);
    rng.generateNormalSamples(0.0, 25.0, n, jitter);

    x.clear();
    y.clear();
    for (std::size_t i = 0; i < n; ++i) {
        x.push_back({signal[i], noise[i]});
        // Positives are the rare high tail
        y.push_back(signal[i] + jitter[i] > 120.0 ? 1.0 : 0.0);
    }
}
}

BOOST_AUTO_TEST_CASE(testLearn) {
    TDoubleVecVec x;
    TDoubleVec y;
    generateData(500, x, y);

    rca::maths::CLogisticRegression regression;
    BOOST_TEST_REQUIRE(regression.fitted() == false);
    BOOST_TEST_REQUIRE(regression.learn(x, y));
    BOOST_TEST_REQUIRE(regression.fitted());
    BOOST_REQUIRE_EQUAL(2, regression.dimension());
    BOOST_TEST_MESSAGE("iterations = " << regression.iterations());
    BOOST_TEST_MESSAGE("weights = " << regression.weights()[0] << ", " << regression.weights()[1]);

    BOOST_TEST_REQUIRE(regression.weights()[0] > 1.0);
    BOOST_TEST_REQUIRE(std::fabs(regression.weights()[1]) < 0.25 * regression.weights()[0]);

    TDoubleVec scores;
    for (const auto& row : x) {
        double probability{0.0};
        BOOST_TEST_REQUIRE(regression.predict(row, probability));
        BOOST_TEST_REQUIRE(probability >= 0.0);
        BOOST_TEST_REQUIRE(probability <= 1.0);
        scores.push_back(probability);
    }
    double auc{rca::maths::CRankingMetrics::auc(scores, y)};
    BOOST_TEST_MESSAGE("auc = " << auc);
    BOOST_TEST_REQUIRE(auc > 0.9);

    // Monotonic in the informative feature
    double low{0.0};
    double high{0.0};
    BOOST_TEST_REQUIRE(regression.predict({80.0, 0.5}, low));
    BOOST_TEST_REQUIRE(regression.predict({140.0, 0.5}, high));
    BOOST_TEST_REQUIRE(high > low);
}

BOOST_AUTO_TEST_CASE(testBadData) {
    rca::maths::CLogisticRegression regression;

    BOOST_TEST_REQUIRE(regression.learn({}, {}) == false);
    BOOST_TEST_REQUIRE(regression.learn({{1.0}, {2.0}}, {1.0}) == false);
    BOOST_TEST_REQUIRE(regression.learn({{1.0}, {2.0, 3.0}}, {0.0, 1.0}) == false);
    // A single class can't be separated
    BOOST_TEST_REQUIRE(regression.learn({{1.0}, {2.0}}, {1.0, 1.0}) == false);
    BOOST_TEST_REQUIRE(regression.fitted() == false);

    double probability{0.0};
    BOOST_TEST_REQUIRE(regression.predict({1.0}, probability) == false);
}

BOOST_AUTO_TEST_CASE(testParameters) {
    TDoubleVecVec x;
    TDoubleVec y;
    generateData(200, x, y);

    rca::maths::CLogisticRegression trained;
    BOOST_TEST_REQUIRE(trained.learn(x, y));

    rca::maths::CLogisticRegression restored;
    BOOST_TEST_REQUIRE(restored.parameters(trained.means(), trained.scales(),
                                           trained.weights(), trained.bias()));
    for (const auto& row : x) {
        double expected{0.0};
        double actual{0.0};
        BOOST_TEST_REQUIRE(trained.predict(row, expected));
        BOOST_TEST_REQUIRE(restored.predict(row, actual));
        BOOST_REQUIRE_EQUAL(expected, actual);
    }

    double probability{0.0};
    BOOST_TEST_REQUIRE(restored.predict({1.0, 2.0, 3.0}, probability) == false);

    BOOST_TEST_REQUIRE(restored.parameters({0.0}, {1.0, 1.0}, {1.0}, 0.0) == false);
    BOOST_TEST_REQUIRE(restored.parameters({0.0}, {0.0}, {1.0}, 0.0) == false);
}

BOOST_AUTO_TEST_CASE(testBalancedWeights) {
    // With very few positives the unweighted fit barely predicts positives
    TDoubleVecVec x;
    TDoubleVec y;
    for (std::size_t i = 0; i < 100; ++i) {
        x.push_back({static_cast<double>(i % 10)});
        y.push_back(i % 10 == 9 && i < 30 ? 1.0 : 0.0);
    }

    rca::maths::CLogisticRegression balanced;
    rca::maths::CLogisticRegression unbalanced{rca::maths::CLogisticRegression::DEFAULT_LAMBDA,
                                               rca::maths::CLogisticRegression::DEFAULT_MAXIMUM_ITERATIONS,
                                               false};
    BOOST_TEST_REQUIRE(balanced.learn(x, y));
    BOOST_TEST_REQUIRE(unbalanced.learn(x, y));

    double pBalanced{0.0};
    double pUnbalanced{0.0};
    BOOST_TEST_REQUIRE(balanced.predict({9.0}, pBalanced));
    BOOST_TEST_REQUIRE(unbalanced.predict({9.0}, pUnbalanced));
    BOOST_TEST_MESSAGE("balanced = " << pBalanced << ", unbalanced = " << pUnbalanced);
    BOOST_TEST_REQUIRE(pBalanced > pUnbalanced);
}

BOOST_AUTO_TEST_SUITE_END()
