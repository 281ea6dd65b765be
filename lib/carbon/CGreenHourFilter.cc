/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CGreenHourFilter.h>

#include <stdexcept>

namespace greenweb {
namespace carbon {

const double CGreenHourFilter::HIGH_VARIATION_STD_DEVIATION(50.0);
const double CGreenHourFilter::HIGH_VARIATION_CONFIDENCE_FACTOR(0.8);

TGreenHourVec CGreenHourFilter::filter(const TGreenHourVec& hours,
                                       const CRegionPattern& pattern) {
    bool highVariation{pattern.stdDeviation() > HIGH_VARIATION_STD_DEVIATION};

    TGreenHourVec result;
    for (const auto& hour : hours) {
        if (hour.s_CarbonIntensity <= pattern.percentile20()) {
            result.push_back(hour);
        } else if (highVariation && hour.s_CarbonIntensity < pattern.mean()) {
            result.push_back(hour);
            result.back().s_Confidence *= HIGH_VARIATION_CONFIDENCE_FACTOR;
        }
    }
    return result;
}

const SGreenHour& CGreenHourFilter::bestWindow(const TGreenHourVec& hours) {
    if (hours.empty()) {
        throw std::invalid_argument("No green hours to choose from");
    }
    const SGreenHour* best{&hours.front()};
    for (const auto& hour : hours) {
        if (hour.s_CarbonIntensity < best->s_CarbonIntensity) {
            best = &hour;
        }
    }
    return *best;
}
}
}
