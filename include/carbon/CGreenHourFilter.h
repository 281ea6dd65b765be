/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CGreenHourFilter_h
#define INCLUDED_greenweb_carbon_CGreenHourFilter_h

#include <carbon/CRegionPattern.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

namespace greenweb {
namespace carbon {

//! \brief
//! Re-ranks forecast green hours against a region's own history.
//!
//! DESCRIPTION:\n
//! An hour is kept if its intensity is no higher than the region's 20th
//! percentile.  In a region whose standard deviation exceeds
//! HIGH_VARIATION_STD_DEVIATION an hour below the mean is also kept but
//! its confidence is scaled by HIGH_VARIATION_CONFIDENCE_FACTOR.
//!
class CARBON_EXPORT CGreenHourFilter {
public:
    static const double HIGH_VARIATION_STD_DEVIATION;
    static const double HIGH_VARIATION_CONFIDENCE_FACTOR;

public:
    //! Get the hours of \p hours which are green for \p pattern, in order.
    static TGreenHourVec filter(const TGreenHourVec& hours, const CRegionPattern& pattern);

    //! Get the hour of \p hours with the lowest intensity, the first on
    //! ties.
    //!
    //! \note \p hours must not be empty.
    static const SGreenHour& bestWindow(const TGreenHourVec& hours);
};
}
}

#endif // INCLUDED_greenweb_carbon_CGreenHourFilter_h
