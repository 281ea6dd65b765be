/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_api_CJsonResultWriter_h
#define INCLUDED_greenweb_api_CJsonResultWriter_h

#include <core/CNonCopyable.h>

#include <carbon/CRegionPattern.h>
#include <carbon/CarbonTypes.h>

#include <api/ImportExport.h>

#include <boost/json.hpp>

#include <iosfwd>
#include <mutex>
#include <string>

namespace greenweb {
namespace api {

//! \brief
//! Writes carbon intelligence results as JSON.
//!
//! DESCRIPTION:\n
//! Each result is written as a single line JSON document of the form
//! <pre>{"region":"PL","operation":"relative","result":{...}}</pre>
//! so that the output can be read one line at a time.  Times are written
//! as ISO 8601 UTC strings.  Failures are written in the same way with an
//! "error" member in place of "result".
//!
//! IMPLEMENTATION DECISIONS:\n
//! Writes are serialised by a mutex so results produced on different
//! threads never interleave.
//!
class API_EXPORT CJsonResultWriter : private core::CNonCopyable {
public:
    //! \name Field Names
    //@{
    static const std::string REGION;
    static const std::string OPERATION;
    static const std::string RESULT;
    static const std::string ERROR_MEMBER;
    //@}

    //! \name Operations
    //@{
    static const std::string RELATIVE;
    static const std::string GREEN_HOURS;
    static const std::string TRENDS;
    static const std::string STRATEGY;
    static const std::string PATTERN;
    //@}

public:
    explicit CJsonResultWriter(std::ostream& strm);

    void writeRelative(const std::string& region, const carbon::SRelativeCarbonIntensity& result);
    void writeGreenHours(const std::string& region, const carbon::SGreenHoursForecast& result);
    void writeTrend(const std::string& region, const carbon::SCarbonTrend& result);
    void writeStrategy(const std::string& region, const carbon::SRegionalStrategy& result);
    void writePattern(const std::string& region, const carbon::CRegionPattern& result);
    void writeError(const std::string& region, const std::string& operation, const std::string& error);

    //! The number of documents written.
    std::size_t numberWritten() const;

    //! \name Conversions
    //@{
    static boost::json::object toJson(const carbon::SCurrentIntensity& current);
    static boost::json::object toJson(const carbon::SRelativeCarbonIntensity& result);
    static boost::json::object toJson(const carbon::SGreenHour& window);
    static boost::json::object toJson(const carbon::SGreenHoursForecast& result);
    static boost::json::object toJson(const carbon::SCarbonTrend& result);
    static boost::json::object toJson(const carbon::SRegionalStrategy& result);
    static boost::json::object toJson(const carbon::CRegionPattern& result);
    //@}

private:
    void write(const std::string& region,
               const std::string& operation,
               const std::string& member,
               boost::json::value value);

private:
    std::ostream& m_Strm;
    mutable std::mutex m_Mutex;
    std::size_t m_NumberWritten{0};
};
}
}

#endif // INCLUDED_greenweb_api_CJsonResultWriter_h
