/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CWindowPredictor.h>

#include <core/CTimeUtils.h>

#include <carbon/CConfidenceScorer.h>

namespace greenweb {
namespace carbon {

CWindowPredictor::CWindowPredictor(const CConfidenceScorer& scorer)
    : m_Scorer(scorer) {
}

TOptionalOptimalWindow CWindowPredictor::predictNextWindow(const CRegionPattern& pattern,
                                                           core_t::TTime from) const {
    if (pattern.hasHourlyData() == false) {
        return {};
    }

    int currentHour{core::CTimeUtils::hourOfDay(from)};
    int bestHour{-1};
    double bestIntensity{0.0};
    for (int i = 1; i <= 24; ++i) {
        int hour{(currentHour + i) % 24};
        double intensity{pattern.hourlyAverage(static_cast<std::size_t>(hour))};
        if (bestHour == -1 || intensity < bestIntensity) {
            bestHour = hour;
            bestIntensity = intensity;
        }
    }

    core_t::TTime start{core::CTimeUtils::startOfDay(from) +
                        bestHour * core::CTimeUtils::SECONDS_IN_HOUR};
    if (bestHour <= currentHour) {
        start += core::CTimeUtils::SECONDS_IN_DAY;
    }

    SOptimalWindow window;
    window.s_Start = start;
    window.s_End = start + core::CTimeUtils::SECONDS_IN_HOUR;
    window.s_ExpectedIntensity = bestIntensity;
    window.s_Confidence = m_Scorer.confidence(pattern, from);
    window.s_Reason = reason(bestHour);
    return window;
}

std::string CWindowPredictor::reason(int hour) {
    if (hour >= 22 || hour <= 6) {
        return "Night wind patterns";
    }
    if (hour >= 10 && hour <= 16) {
        return "Solar generation peak";
    }
    return "Historical low-carbon period";
}
}
}
