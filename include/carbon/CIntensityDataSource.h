/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CIntensityDataSource_h
#define INCLUDED_greenweb_carbon_CIntensityDataSource_h

#include <core/CDeadline.h>
#include <core/CoreTypes.h>

#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Interface to a supplier of carbon intensity data.
//!
//! DESCRIPTION:\n
//! Abstract interface for fetching the history, current reading and
//! forecast for a region.  Implementations must be callable from several
//! threads at once.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Every call is given the deadline of the caller that triggered it.  An
//! implementation doing slow I/O should give up once it has passed; the
//! engine won't wait beyond it anyway.
//!
//! All failures are reported by throwing CCollaboratorFetchError.
//!
class CARBON_EXPORT CIntensityDataSource {
public:
    virtual ~CIntensityDataSource() = default;

    //! Get the samples for \p region between \p start and \p end inclusive
    //! in ascending time order.
    virtual TSampleVec historicalSamples(const std::string& region,
                                         core_t::TTime start,
                                         core_t::TTime end,
                                         const core::CDeadline& deadline) = 0;

    //! Get the latest reading for \p region.
    virtual SCurrentIntensity currentIntensity(const std::string& region,
                                               const core::CDeadline& deadline) = 0;

    //! Get the forecast green hours for \p region over the next \p hours.
    virtual SGreenHoursForecast greenHoursForecast(const std::string& region,
                                                   int hours,
                                                   const core::CDeadline& deadline) = 0;
};
}
}

#endif // INCLUDED_greenweb_carbon_CIntensityDataSource_h
