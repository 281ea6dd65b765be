/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CPatternCalculator_h
#define INCLUDED_greenweb_carbon_CPatternCalculator_h

#include <core/CoreTypes.h>

#include <carbon/CRegionPattern.h>
#include <carbon/CTrendAnalyzer.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <cstddef>
#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Learns a CRegionPattern from a region's historical samples.
//!
//! DESCRIPTION:\n
//! Computes the population mean and standard deviation of the sample
//! intensities, their 20th and 80th nearest rank percentiles, the average
//! for each UTC hour of day and the trend.
//!
//! IMPLEMENTATION DECISIONS:\n
//! A pure function of its arguments: the same samples and time always give
//! the same pattern.  The samples are used in the order given and are not
//! re-sorted, because the trend depends on that order.
//!
class CARBON_EXPORT CPatternCalculator {
public:
    static const std::size_t LOW_PERCENTILE;
    static const std::size_t HIGH_PERCENTILE;

public:
    explicit CPatternCalculator(std::size_t minDataPoints);

    //! Compute the pattern for \p region from \p samples, recording \p now as
    //! the time it was updated.
    //!
    //! \throws CInsufficientDataError if there are fewer samples than the
    //! minimum number of data points.
    TRegionPatternCPtr compute(const std::string& region,
                               TSampleVec samples,
                               core_t::TTime now) const;

private:
    std::size_t m_MinDataPoints;
    CTrendAnalyzer m_TrendAnalyzer;
};
}
}

#endif // INCLUDED_greenweb_carbon_CPatternCalculator_h
