/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CRelativeMetricsEngine.h>

#include <maths/CPercentiles.h>
#include <maths/CTools.h>

namespace greenweb {
namespace carbon {

const double CRelativeMetricsEngine::CLEAN_RANK_PERCENTILE(20.0);
const double CRelativeMetricsEngine::DIRTY_RANK_PERCENTILE(80.0);

CRelativeMetricsEngine::SClassification
CRelativeMetricsEngine::classify(double value, const CRegionPattern& pattern) {
    SClassification result;
    result.s_Percentile = percentile(value, pattern);
    result.s_Mode = mode(value, pattern);
    result.s_DailyRank = dailyRank(result.s_Percentile);
    result.s_TrendMagnitude = trendMagnitude(value, pattern);
    return result;
}

double CRelativeMetricsEngine::percentile(double value, const CRegionPattern& pattern) {
    double raw{maths::CPercentiles::countingPercentile(pattern.sortedIntensities(), value)};
    return maths::CTools::roundToDecimalPlaces(raw, 1);
}

ERelativeMode CRelativeMetricsEngine::mode(double value, const CRegionPattern& pattern) {
    if (value <= pattern.percentile20()) {
        return E_Clean;
    }
    if (value >= pattern.percentile80()) {
        return E_Dirty;
    }
    return E_Average;
}

std::string CRelativeMetricsEngine::dailyRank(double percentile) {
    // The percentages are truncated, not rounded
    if (percentile <= CLEAN_RANK_PERCENTILE) {
        return "top " + std::to_string(static_cast<int>(percentile)) + "% cleanest";
    }
    if (percentile >= DIRTY_RANK_PERCENTILE) {
        return "top " + std::to_string(static_cast<int>(100.0 - percentile)) + "% dirtiest";
    }
    return "average for this region";
}

double CRelativeMetricsEngine::trendMagnitude(double value, const CRegionPattern& pattern) {
    if (pattern.mean() <= 0.0) {
        return 0.0;
    }
    return (value - pattern.mean()) / pattern.mean() * 100.0;
}
}
}
