/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CConfidenceScorer.h>

#include <core/CTimeUtils.h>

#include <maths/CTools.h>

#include <algorithm>

namespace greenweb {
namespace carbon {
namespace {
const double FRESH_HOURS{24.0};
const double DECAY_HOURS{168.0};
const double MINIMUM_FACTOR{0.5};
}

CConfidenceScorer::CConfidenceScorer(std::size_t historyRetentionDays)
    : m_HistoryRetentionDays{historyRetentionDays} {
}

double CConfidenceScorer::confidence(const CRegionPattern& pattern, core_t::TTime now) const {
    if (pattern.numberSamples() == 0) {
        return 0.0;
    }
    double score{this->completeness(pattern) * recency(pattern, now) * variation(pattern)};
    return maths::CTools::roundToDecimalPlaces(score, 2);
}

double CConfidenceScorer::completeness(const CRegionPattern& pattern) const {
    double expected{static_cast<double>(m_HistoryRetentionDays * 24)};
    if (expected <= 0.0) {
        return 1.0;
    }
    double ratio{static_cast<double>(pattern.numberSamples()) / expected};
    return maths::CTools::truncate(ratio, 0.0, 1.0);
}

double CConfidenceScorer::recency(const CRegionPattern& pattern, core_t::TTime now) {
    double hoursOld{static_cast<double>(now - pattern.newestSampleTime()) /
                    static_cast<double>(core::CTimeUtils::SECONDS_IN_HOUR)};
    if (hoursOld <= FRESH_HOURS) {
        return 1.0;
    }
    return maths::CTools::truncate(std::max(MINIMUM_FACTOR, 1.0 - hoursOld / DECAY_HOURS),
                                   0.0, 1.0);
}

double CConfidenceScorer::variation(const CRegionPattern& pattern) {
    if (pattern.mean() <= 0.0) {
        return 1.0;
    }
    double cv{pattern.stdDeviation() / pattern.mean()};
    return maths::CTools::truncate(std::max(MINIMUM_FACTOR, 1.0 - cv / 2.0), 0.0, 1.0);
}
}
}
