/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CRankingMetrics.h>

#include <core/CLogger.h>

#include <algorithm>
#include <numeric>
#include <utility>

namespace rca {
namespace maths {

double CRankingMetrics::auc(const TDoubleVec& scores, const TDoubleVec& labels) {
    if (scores.size() != labels.size()) {
        LOG_ERROR(<< "Score and label counts differ: " << scores.size() << " vs " << labels.size());
        return 0.5;
    }

    // Mann-Whitney: sum the ranks of the positives, using mid-ranks for ties.
    std::vector<std::size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&scores](std::size_t lhs, std::size_t rhs) { return scores[lhs] < scores[rhs]; });

    double positives{0.0};
    double positiveRankSum{0.0};
    for (std::size_t i = 0; i < order.size();) {
        std::size_t j{i + 1};
        while (j < order.size() && scores[order[j]] == scores[order[i]]) {
            ++j;
        }
        double midRank{0.5 * static_cast<double>(i + j + 1)};
        for (std::size_t k = i; k < j; ++k) {
            if (labels[order[k]] > 0.5) {
                positives += 1.0;
                positiveRankSum += midRank;
            }
        }
        i = j;
    }

    double negatives{static_cast<double>(scores.size()) - positives};
    if (positives == 0.0 || negatives == 0.0) {
        return 0.5;
    }
    return (positiveRankSum - positives * (positives + 1.0) / 2.0) / (positives * negatives);
}

double CRankingMetrics::precisionAtK(std::size_t rank, std::size_t k) {
    return rank > 0 && rank <= k ? 1.0 : 0.0;
}

double CRankingMetrics::reciprocalRank(std::size_t rank) {
    return rank > 0 ? 1.0 / static_cast<double>(rank) : 0.0;
}
}
}
