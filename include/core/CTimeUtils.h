/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CTimeUtils_h
#define INCLUDED_greenweb_core_CTimeUtils_h

#include <core/CNonInstantiatable.h>
#include <core/CoreTypes.h>
#include <core/ImportExport.h>

#include <string>

namespace greenweb {
namespace core {

//! \brief
//! A holder of time utility methods.
//!
//! DESCRIPTION:\n
//! A holder of time utility methods.  All methods are static; an object of
//! this class should never be constructed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Every calendar calculation here is done in UTC.  Regional patterns are
//! keyed on UTC hour of day and UTC day of week, whatever the region's own
//! time zone.
//!
class CORE_EXPORT CTimeUtils : private CNonInstantiatable {
public:
    static const core_t::TTime SECONDS_IN_HOUR;
    static const core_t::TTime SECONDS_IN_DAY;

public:
    //! Current time
    static core_t::TTime now();

    //! Date and time to string in the form 2024-05-01T13:00:00Z
    static std::string toIso8601(core_t::TTime t);

    //! Parse either an ISO 8601 UTC time such as 2024-05-01T13:00:00Z
    //! or an integer number of seconds since the epoch.
    static bool fromIso8601(const std::string& str, core_t::TTime& t);

    //! The UTC hour of day, 0 to 23
    static int hourOfDay(core_t::TTime t);

    //! The UTC day of week, 0 is Sunday and 6 is Saturday
    static int dayOfWeek(core_t::TTime t);

    //! Is the UTC day of week Saturday or Sunday?
    static bool isWeekend(core_t::TTime t);

    //! The start of the UTC day containing t
    static core_t::TTime startOfDay(core_t::TTime t);
};
}
}

#endif // INCLUDED_greenweb_core_CTimeUtils_h
