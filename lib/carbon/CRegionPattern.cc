/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CRegionPattern.h>

#include <core/CTimeUtils.h>

#include <algorithm>
#include <ostream>
#include <sstream>

namespace greenweb {
namespace carbon {

CRegionPattern::CRegionPattern(std::string region,
                               core_t::TTime lastUpdated,
                               TSampleVec samples,
                               double mean,
                               double stdDeviation,
                               double percentile20,
                               double percentile80,
                               const THourlyArray& hourlyAverages,
                               ETrendDirection trendDirection,
                               double trendConfidence)
    : m_Region{std::move(region)}, m_LastUpdated{lastUpdated},
      m_Samples{std::move(samples)}, m_Mean{mean}, m_StdDeviation{stdDeviation},
      m_Percentile20{percentile20}, m_Percentile80{percentile80},
      m_HourlyAverages(hourlyAverages), m_TrendDirection{trendDirection},
      m_TrendConfidence{trendConfidence} {
    m_SortedIntensities.reserve(m_Samples.size());
    for (const auto& sample : m_Samples) {
        m_SortedIntensities.push_back(sample.s_CarbonIntensity);
    }
    std::sort(m_SortedIntensities.begin(), m_SortedIntensities.end());
}

const std::string& CRegionPattern::region() const {
    return m_Region;
}

core_t::TTime CRegionPattern::lastUpdated() const {
    return m_LastUpdated;
}

const TSampleVec& CRegionPattern::samples() const {
    return m_Samples;
}

std::size_t CRegionPattern::numberSamples() const {
    return m_Samples.size();
}

const CRegionPattern::TDoubleVec& CRegionPattern::sortedIntensities() const {
    return m_SortedIntensities;
}

double CRegionPattern::mean() const {
    return m_Mean;
}

double CRegionPattern::stdDeviation() const {
    return m_StdDeviation;
}

double CRegionPattern::percentile20() const {
    return m_Percentile20;
}

double CRegionPattern::percentile80() const {
    return m_Percentile80;
}

double CRegionPattern::hourlyAverage(std::size_t hour) const {
    return m_HourlyAverages[hour % HOURS_IN_DAY];
}

const CRegionPattern::THourlyArray& CRegionPattern::hourlyAverages() const {
    return m_HourlyAverages;
}

bool CRegionPattern::hasHourlyData() const {
    return m_Samples.empty() == false;
}

core_t::TTime CRegionPattern::newestSampleTime() const {
    core_t::TTime newest{0};
    for (const auto& sample : m_Samples) {
        newest = std::max(newest, sample.s_Time);
    }
    return newest;
}

ETrendDirection CRegionPattern::trendDirection() const {
    return m_TrendDirection;
}

double CRegionPattern::trendConfidence() const {
    return m_TrendConfidence;
}

std::string CRegionPattern::print() const {
    std::ostringstream result;
    result << m_Region << " @ " << core::CTimeUtils::toIso8601(m_LastUpdated)
           << " n = " << m_Samples.size() << ", mean = " << m_Mean
           << ", sd = " << m_StdDeviation << ", P20 = " << m_Percentile20
           << ", P80 = " << m_Percentile80 << ", trend = " << m_TrendDirection
           << " (" << m_TrendConfidence << ")";
    return result.str();
}

std::ostream& operator<<(std::ostream& o, const CRegionPattern& pattern) {
    return o << pattern.print();
}
}
}
