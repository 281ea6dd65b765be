/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CRegionPattern_h
#define INCLUDED_greenweb_carbon_CRegionPattern_h

#include <core/CoreTypes.h>

#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <array>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace greenweb {
namespace carbon {

//! \brief
//! The learned statistical model of one region's carbon intensity.
//!
//! DESCRIPTION:\n
//! Holds the samples a pattern was learned from together with their
//! mean, population standard deviation, 20th and 80th percentiles, the
//! average intensity for each UTC hour of day and the direction of the
//! trend through the samples.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Immutable.  A refresh builds a new object and swaps the pointer the
//! store holds, so readers holding a TRegionPatternCPtr always see a
//! consistent pattern without locking.
//!
//! The intensities are also kept sorted because every classification
//! needs them that way.
//!
class CARBON_EXPORT CRegionPattern {
public:
    static const std::size_t HOURS_IN_DAY = 24;

    using TDoubleVec = std::vector<double>;
    using THourlyArray = std::array<double, HOURS_IN_DAY>;

public:
    CRegionPattern(std::string region,
                   core_t::TTime lastUpdated,
                   TSampleVec samples,
                   double mean,
                   double stdDeviation,
                   double percentile20,
                   double percentile80,
                   const THourlyArray& hourlyAverages,
                   ETrendDirection trendDirection,
                   double trendConfidence);

    const std::string& region() const;
    core_t::TTime lastUpdated() const;
    const TSampleVec& samples() const;
    std::size_t numberSamples() const;

    //! The intensities of samples() in ascending order.
    const TDoubleVec& sortedIntensities() const;

    double mean() const;
    double stdDeviation() const;
    double percentile20() const;
    double percentile80() const;

    //! The average intensity of samples in UTC hour \p hour, or the overall
    //! mean if there were none.
    double hourlyAverage(std::size_t hour) const;
    const THourlyArray& hourlyAverages() const;

    //! False if the pattern was built from no samples, in which case the
    //! hourly averages carry no information.
    bool hasHourlyData() const;

    //! The time of the most recent sample, zero if there are none.
    core_t::TTime newestSampleTime() const;

    ETrendDirection trendDirection() const;
    double trendConfidence() const;

    //! Debug representation.
    std::string print() const;

private:
    std::string m_Region;
    core_t::TTime m_LastUpdated;
    TSampleVec m_Samples;
    TDoubleVec m_SortedIntensities;
    double m_Mean;
    double m_StdDeviation;
    double m_Percentile20;
    double m_Percentile80;
    THourlyArray m_HourlyAverages;
    ETrendDirection m_TrendDirection;
    double m_TrendConfidence;
};

using TRegionPatternCPtr = std::shared_ptr<const CRegionPattern>;

CARBON_EXPORT std::ostream& operator<<(std::ostream& o, const CRegionPattern& pattern);
}
}

#endif // INCLUDED_greenweb_carbon_CRegionPattern_h
