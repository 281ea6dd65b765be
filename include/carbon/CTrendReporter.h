/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CTrendReporter_h
#define INCLUDED_greenweb_carbon_CTrendReporter_h

#include <core/CoreTypes.h>

#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <cstddef>
#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Summarises a region's carbon intensity over a period.
//!
//! DESCRIPTION:\n
//! Reports the mean, range and population standard deviation of the
//! samples, the three cleanest and dirtiest UTC hours of day and the
//! weekday and weekend averages.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Hours are ranked by their average intensity.  Equal averages are
//! ordered by hour for both rankings, so the result doesn't depend on
//! the order of the samples.  Hour rankings are only reported when at
//! least NUMBER_RANKED_HOURS distinct hours are present.
//!
class CARBON_EXPORT CTrendReporter {
public:
    static const std::size_t NUMBER_RANKED_HOURS;
    //! Reports for this period include the raw samples if there are few.
    static const std::string DAILY_PERIOD;
    static const std::size_t MAX_SAMPLES_REPORTED;

public:
    explicit CTrendReporter(std::size_t minDataPoints);

    //! \throws CInsufficientDataError if \p samples has fewer than the
    //! minimum number of data points.
    SCarbonTrend report(const std::string& region,
                        const std::string& period,
                        const TSampleVec& samples,
                        core_t::TTime start,
                        core_t::TTime end) const;

private:
    std::size_t m_MinDataPoints;
};
}
}

#endif // INCLUDED_greenweb_carbon_CTrendReporter_h
