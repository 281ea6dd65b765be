/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CPatternCalculator.h>

#include <core/CLogger.h>
#include <core/CTimeUtils.h>

#include <maths/CBasicStatistics.h>
#include <maths/CPercentiles.h>

#include <carbon/CIntelligenceErrors.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace greenweb {
namespace carbon {

const std::size_t CPatternCalculator::LOW_PERCENTILE(20);
const std::size_t CPatternCalculator::HIGH_PERCENTILE(80);

CPatternCalculator::CPatternCalculator(std::size_t minDataPoints)
    : m_MinDataPoints{minDataPoints}, m_TrendAnalyzer{minDataPoints} {
}

TRegionPatternCPtr CPatternCalculator::compute(const std::string& region,
                                               TSampleVec samples,
                                               core_t::TTime now) const {
    if (samples.size() < m_MinDataPoints) {
        throw CInsufficientDataError{region, samples.size(), m_MinDataPoints};
    }

    using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator;
    using TMeanAccumulator = maths::CBasicStatistics::SSampleMean<double>::TAccumulator;

    TMeanVarAccumulator moments;
    std::array<TMeanAccumulator, CRegionPattern::HOURS_IN_DAY> hourly;
    maths::CPercentiles::TDoubleVec intensities;
    intensities.reserve(samples.size());

    for (const auto& sample : samples) {
        moments.add(sample.s_CarbonIntensity);
        hourly[core::CTimeUtils::hourOfDay(sample.s_Time)].add(sample.s_CarbonIntensity);
        intensities.push_back(sample.s_CarbonIntensity);
    }

    double mean{maths::CBasicStatistics::mean(moments)};
    double sd{std::sqrt(maths::CBasicStatistics::maximumLikelihoodVariance(moments))};

    double p20{0.0};
    double p80{0.0};
    if (intensities.empty() == false) {
        std::sort(intensities.begin(), intensities.end());
        p20 = maths::CPercentiles::nearestRankSorted(intensities, LOW_PERCENTILE);
        p80 = maths::CPercentiles::nearestRankSorted(intensities, HIGH_PERCENTILE);
    }

    CRegionPattern::THourlyArray hourlyAverages;
    for (std::size_t hour = 0; hour < hourly.size(); ++hour) {
        hourlyAverages[hour] = maths::CBasicStatistics::count(hourly[hour]) > 0.0
                                   ? maths::CBasicStatistics::mean(hourly[hour])
                                   : mean;
    }

    ETrendDirection direction{m_TrendAnalyzer.direction(samples)};
    double trendConfidence{m_TrendAnalyzer.confidence(samples)};

    auto result = std::make_shared<const CRegionPattern>(
        region, now, std::move(samples), mean, sd, p20, p80, hourlyAverages,
        direction, trendConfidence);
    LOG_DEBUG(<< "Computed pattern " << *result);
    return result;
}
}
}
