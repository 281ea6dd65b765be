/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CRelativeMetricsEngine_h
#define INCLUDED_greenweb_carbon_CRelativeMetricsEngine_h

#include <carbon/CRegionPattern.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Places a carbon intensity reading within its region's history.
//!
//! DESCRIPTION:\n
//! The percentile is the share of historical samples strictly cleaner
//! than the reading, rounded to one decimal place.  The mode compares
//! the reading with the pattern's own 20th and 80th percentiles, so the
//! same reading can be clean in one region and dirty in another.
//!
class CARBON_EXPORT CRelativeMetricsEngine {
public:
    struct CARBON_EXPORT SClassification {
        double s_Percentile{50.0};
        ERelativeMode s_Mode{E_Average};
        std::string s_DailyRank;
        double s_TrendMagnitude{0.0};
    };

    //! Percentiles at or below this are ranked amongst the cleanest.
    static const double CLEAN_RANK_PERCENTILE;
    //! Percentiles at or above this are ranked amongst the dirtiest.
    static const double DIRTY_RANK_PERCENTILE;

public:
    //! Classify \p value against \p pattern.
    static SClassification classify(double value, const CRegionPattern& pattern);

    //! Get the percentile of \p value in the history of \p pattern.
    static double percentile(double value, const CRegionPattern& pattern);

    static ERelativeMode mode(double value, const CRegionPattern& pattern);

    static std::string dailyRank(double percentile);

    //! Get the percentage by which \p value exceeds the regional mean,
    //! zero if the mean isn't positive.
    static double trendMagnitude(double value, const CRegionPattern& pattern);
};
}
}

#endif // INCLUDED_greenweb_carbon_CRelativeMetricsEngine_h
