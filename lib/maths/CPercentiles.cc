/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CPercentiles.h>

#include <core/CLogger.h>

#include <algorithm>
#include <stdexcept>

namespace greenweb {
namespace maths {

double CPercentiles::nearestRankSorted(const TDoubleVec& sorted, std::size_t percentile) {
    if (sorted.empty()) {
        LOG_ERROR(<< "Can't compute percentile " << percentile << " of an empty sample");
        throw std::invalid_argument("empty sample");
    }
    std::size_t index{(sorted.size() * percentile) / 100};
    return sorted[std::min(index, sorted.size() - 1)];
}

double CPercentiles::countingPercentile(const TDoubleVec& sorted, double value) {
    if (sorted.empty()) {
        return 50.0;
    }
    auto position = std::lower_bound(sorted.begin(), sorted.end(), value) - sorted.begin();
    return 100.0 * static_cast<double>(position) / static_cast<double>(sorted.size());
}
}
}
