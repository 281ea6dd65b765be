/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CConfidenceScorer_h
#define INCLUDED_greenweb_carbon_CConfidenceScorer_h

#include <core/CoreTypes.h>

#include <carbon/CRegionPattern.h>
#include <carbon/ImportExport.h>

#include <cstddef>

namespace greenweb {
namespace carbon {

//! \brief
//! Scores how far a regional pattern can be trusted.
//!
//! DESCRIPTION:\n
//! The score is the product of three factors, each in [0, 1]:
//!   -# completeness, the fraction of the hourly samples the retention
//!      period should hold;
//!   -# recency, which decays from one day after the newest sample to a
//!      floor of 0.5 a week later;
//!   -# variation, which falls with the coefficient of variation to a floor
//!      of 0.5.
//!
//! The product is rounded to two decimal places.  A pattern with no samples
//! scores zero.
//!
class CARBON_EXPORT CConfidenceScorer {
public:
    explicit CConfidenceScorer(std::size_t historyRetentionDays);

    //! Get the confidence in \p pattern at time \p now.
    double confidence(const CRegionPattern& pattern, core_t::TTime now) const;

    //! \name Factors
    //@{
    double completeness(const CRegionPattern& pattern) const;
    static double recency(const CRegionPattern& pattern, core_t::TTime now);
    static double variation(const CRegionPattern& pattern);
    //@}

private:
    std::size_t m_HistoryRetentionDays;
};
}
}

#endif // INCLUDED_greenweb_carbon_CConfidenceScorer_h
