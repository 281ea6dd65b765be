/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CIntelligenceErrors_h
#define INCLUDED_greenweb_carbon_CIntelligenceErrors_h

#include <carbon/ImportExport.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Too few samples to learn a regional pattern or report a trend.
class CARBON_EXPORT CInsufficientDataError : public std::runtime_error {
public:
    CInsufficientDataError(const std::string& region, std::size_t actual, std::size_t required);

    const std::string& region() const;
    std::size_t actual() const;
    std::size_t required() const;

private:
    std::string m_Region;
    std::size_t m_Actual;
    std::size_t m_Required;
};

//! \brief
//! A data source failed to supply history, a current reading or a
//! forecast for a region.
class CARBON_EXPORT CCollaboratorFetchError : public std::runtime_error {
public:
    CCollaboratorFetchError(const std::string& region, const std::string& what);

    const std::string& region() const;

private:
    std::string m_Region;
};

//! \brief
//! There is no cached pattern for a region and it couldn't be computed.
//!
//! DESCRIPTION:\n
//! Raised by the pattern store only when there is nothing to fall back
//! on.  The message includes the reason the computation failed.
class CARBON_EXPORT CNoPatternAvailable : public std::runtime_error {
public:
    CNoPatternAvailable(const std::string& region, const std::string& cause);

    const std::string& region() const;

private:
    std::string m_Region;
};
}
}

#endif // INCLUDED_greenweb_carbon_CIntelligenceErrors_h
