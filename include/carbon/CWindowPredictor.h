/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CWindowPredictor_h
#define INCLUDED_greenweb_carbon_CWindowPredictor_h

#include <core/CoreTypes.h>

#include <carbon/CRegionPattern.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <string>

namespace greenweb {
namespace carbon {
class CConfidenceScorer;

//! \brief
//! Predicts the next hour with the lowest historical carbon intensity.
//!
//! DESCRIPTION:\n
//! Looks at the hourly averages of the next 24 hours starting with the
//! hour after the current one.  The first hour with the strictly lowest
//! average wins, so ties go to the nearest future hour.  The window is
//! one hour long and starts on the hour after \p from.
//!
class CARBON_EXPORT CWindowPredictor {
public:
    explicit CWindowPredictor(const CConfidenceScorer& scorer);

    //! Get the next low carbon window after \p from, or none if the pattern
    //! has no hourly data.
    TOptionalOptimalWindow predictNextWindow(const CRegionPattern& pattern,
                                             core_t::TTime from) const;

    //! The usual cause of low carbon intensity at UTC hour \p hour.
    static std::string reason(int hour);

private:
    const CConfidenceScorer& m_Scorer;
};
}
}

#endif // INCLUDED_greenweb_carbon_CWindowPredictor_h
