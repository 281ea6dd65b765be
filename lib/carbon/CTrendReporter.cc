/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CTrendReporter.h>

#include <core/CTimeUtils.h>

#include <maths/CBasicStatistics.h>

#include <carbon/CIntelligenceErrors.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>
#include <vector>

namespace greenweb {
namespace carbon {
namespace {
using TMeanAccumulator = maths::CBasicStatistics::SSampleMean<double>::TAccumulator;
using TIntDoublePr = std::pair<int, double>;
using TIntDoublePrVec = std::vector<TIntDoublePr>;
}

const std::size_t CTrendReporter::NUMBER_RANKED_HOURS(3);
const std::string CTrendReporter::DAILY_PERIOD("daily");
const std::size_t CTrendReporter::MAX_SAMPLES_REPORTED(24);

CTrendReporter::CTrendReporter(std::size_t minDataPoints)
    : m_MinDataPoints{minDataPoints} {
}

SCarbonTrend CTrendReporter::report(const std::string& region,
                                    const std::string& period,
                                    const TSampleVec& samples,
                                    core_t::TTime start,
                                    core_t::TTime end) const {
    if (samples.size() < m_MinDataPoints) {
        throw CInsufficientDataError{region, samples.size(), m_MinDataPoints};
    }

    maths::CBasicStatistics::SSampleMeanVar<double>::TAccumulator moments;
    maths::CBasicStatistics::CMinMax<double> range;
    std::map<int, TMeanAccumulator> hourly;
    TMeanAccumulator weekday;
    TMeanAccumulator weekend;

    for (const auto& sample : samples) {
        moments.add(sample.s_CarbonIntensity);
        range.add(sample.s_CarbonIntensity);
        hourly[core::CTimeUtils::hourOfDay(sample.s_Time)].add(sample.s_CarbonIntensity);
        if (core::CTimeUtils::isWeekend(sample.s_Time)) {
            weekend.add(sample.s_CarbonIntensity);
        } else {
            weekday.add(sample.s_CarbonIntensity);
        }
    }

    SCarbonTrend result;
    result.s_Location = region;
    result.s_Period = period;
    result.s_Start = start;
    result.s_End = end;
    result.s_AverageIntensity = maths::CBasicStatistics::mean(moments);
    if (range.initialized()) {
        result.s_MinIntensity = range.min();
        result.s_MaxIntensity = range.max();
    }
    result.s_StdDeviation =
        std::sqrt(maths::CBasicStatistics::maximumLikelihoodVariance(moments));

    if (hourly.size() >= NUMBER_RANKED_HOURS) {
        TIntDoublePrVec averages;
        averages.reserve(hourly.size());
        for (const auto& hour : hourly) {
            averages.emplace_back(hour.first, maths::CBasicStatistics::mean(hour.second));
        }

        // The map is ordered by hour and stable_sort keeps that order for
        // equal averages.
        std::stable_sort(averages.begin(), averages.end(),
                         [](const TIntDoublePr& lhs, const TIntDoublePr& rhs) {
                             return lhs.second < rhs.second;
                         });
        for (std::size_t i = 0; i < NUMBER_RANKED_HOURS; ++i) {
            result.s_CleanestHours.push_back(averages[i].first);
        }

        std::stable_sort(averages.begin(), averages.end(),
                         [](const TIntDoublePr& lhs, const TIntDoublePr& rhs) {
                             return lhs.second > rhs.second ||
                                    (lhs.second == rhs.second && lhs.first < rhs.first);
                         });
        for (std::size_t i = 0; i < NUMBER_RANKED_HOURS; ++i) {
            result.s_DirtiestHours.push_back(averages[i].first);
        }
    }

    if (maths::CBasicStatistics::count(weekday) > 0.0) {
        result.s_WeekdayAverage = maths::CBasicStatistics::mean(weekday);
    }
    if (maths::CBasicStatistics::count(weekend) > 0.0) {
        result.s_WeekendAverage = maths::CBasicStatistics::mean(weekend);
    }

    if (period == DAILY_PERIOD && samples.size() <= MAX_SAMPLES_REPORTED) {
        result.s_Samples = samples;
    }

    return result;
}
}
}
