/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CTrendAnalyzer_h
#define INCLUDED_greenweb_carbon_CTrendAnalyzer_h

#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <cstddef>

namespace greenweb {
namespace carbon {

//! \brief
//! Finds the direction of the linear trend through a region's history.
//!
//! DESCRIPTION:\n
//! Fits intensity against the position of each sample in the sequence,
//! not its timestamp, so gaps in the history are ignored.  A slope within
//! +/- SLOPE_THRESHOLD g/kWh per sample is treated as stable.
//!
class CARBON_EXPORT CTrendAnalyzer {
public:
    static const double SLOPE_THRESHOLD;
    //! The highest confidence a trend is ever given.
    static const double MAXIMUM_CONFIDENCE;

public:
    explicit CTrendAnalyzer(std::size_t minDataPoints);

    //! Get the trend direction of \p samples.  Fewer than two samples are
    //! always stable.
    ETrendDirection direction(const TSampleVec& samples) const;

    //! Get the least squares slope of intensity against sample index.
    static double slope(const TSampleVec& samples);

    //! Get the confidence in a trend computed from \p samples which grows
    //! linearly to MAXIMUM_CONFIDENCE at four times the minimum number of
    //! data points and is zero below the minimum.
    double confidence(const TSampleVec& samples) const;

private:
    std::size_t m_MinDataPoints;
};
}
}

#endif // INCLUDED_greenweb_carbon_CTrendAnalyzer_h
