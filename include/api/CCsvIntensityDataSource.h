/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_api_CCsvIntensityDataSource_h
#define INCLUDED_greenweb_api_CCsvIntensityDataSource_h

#include <core/CoreTypes.h>

#include <carbon/CIntensityDataSource.h>
#include <carbon/CarbonTypes.h>

#include <api/ImportExport.h>

#include <string>

namespace greenweb {
namespace api {

//! \brief
//! Reads carbon intensity data from CSV files.
//!
//! DESCRIPTION:\n
//! Each region has a history file named \<region\>.csv in the data
//! directory with the columns
//! <pre>time,intensity,renewable</pre>
//! and optionally a forecast file named \<region\>_forecast.csv with the
//! columns
//! <pre>start,end,intensity,renewable,confidence</pre>
//! Times are seconds since the epoch or ISO 8601 UTC timestamps.  A
//! header row is optional.
//!
//! The current reading is the latest row of the history file.  Forecasts
//! cover the requested number of hours from the earliest window in the
//! forecast file.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Rows which can't be parsed are logged and skipped so that one bad line
//! doesn't lose a region's history.  A file which can't be opened is an
//! error.  Files are read afresh on every call so they can be replaced
//! while the program runs.
//!
class API_EXPORT CCsvIntensityDataSource : public carbon::CIntensityDataSource {
public:
    static const std::string HISTORY_SUFFIX;
    static const std::string FORECAST_SUFFIX;
    static const std::string SOURCE_NAME;

public:
    explicit CCsvIntensityDataSource(std::string dataDir);

    //! \name CIntensityDataSource Interface
    //@{
    carbon::TSampleVec historicalSamples(const std::string& region,
                                         core_t::TTime start,
                                         core_t::TTime end,
                                         const core::CDeadline& deadline) override;
    carbon::SCurrentIntensity currentIntensity(const std::string& region,
                                               const core::CDeadline& deadline) override;
    carbon::SGreenHoursForecast greenHoursForecast(const std::string& region,
                                                   int hours,
                                                   const core::CDeadline& deadline) override;
    //@}

private:
    using TGreenHourVec = carbon::TGreenHourVec;

private:
    //! Every valid row of the history file sorted by time.
    carbon::TSampleVec readHistory(const std::string& region,
                                   const core::CDeadline& deadline) const;

    //! Every valid row of the forecast file sorted by start time.
    TGreenHourVec readForecast(const std::string& region,
                               const core::CDeadline& deadline) const;

    //! The path of \p region's file with \p suffix.
    std::string fileName(const std::string& region, const std::string& suffix) const;

private:
    std::string m_DataDir;
};
}
}

#endif // INCLUDED_greenweb_api_CCsvIntensityDataSource_h
