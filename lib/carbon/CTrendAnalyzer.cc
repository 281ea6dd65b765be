/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CTrendAnalyzer.h>

#include <maths/CSimpleLinearRegression.h>

#include <algorithm>
#include <cmath>

namespace greenweb {
namespace carbon {

const double CTrendAnalyzer::SLOPE_THRESHOLD(0.1);
const double CTrendAnalyzer::MAXIMUM_CONFIDENCE(0.8);

CTrendAnalyzer::CTrendAnalyzer(std::size_t minDataPoints)
    : m_MinDataPoints{minDataPoints} {
}

ETrendDirection CTrendAnalyzer::direction(const TSampleVec& samples) const {
    if (samples.size() < 2) {
        return E_Stable;
    }
    double slope{CTrendAnalyzer::slope(samples)};
    if (std::fabs(slope) < SLOPE_THRESHOLD) {
        return E_Stable;
    }
    return slope < 0.0 ? E_Improving : E_Worsening;
}

double CTrendAnalyzer::slope(const TSampleVec& samples) {
    maths::CSimpleLinearRegression regression;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        regression.add(static_cast<double>(i), samples[i].s_CarbonIntensity);
    }
    return regression.slope();
}

double CTrendAnalyzer::confidence(const TSampleVec& samples) const {
    if (samples.size() < m_MinDataPoints) {
        return 0.0;
    }
    if (m_MinDataPoints == 0) {
        return MAXIMUM_CONFIDENCE;
    }
    double ratio{static_cast<double>(samples.size()) /
                 static_cast<double>(4 * m_MinDataPoints)};
    return std::min(ratio, 1.0) * MAXIMUM_CONFIDENCE;
}
}
}
