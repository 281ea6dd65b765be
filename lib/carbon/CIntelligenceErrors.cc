/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CIntelligenceErrors.h>

namespace greenweb {
namespace carbon {

CInsufficientDataError::CInsufficientDataError(const std::string& region,
                                               std::size_t actual,
                                               std::size_t required)
    : std::runtime_error{"Insufficient data for region '" + region + "': got " +
                         std::to_string(actual) + " points, need " +
                         std::to_string(required)},
      m_Region{region}, m_Actual{actual}, m_Required{required} {
}

const std::string& CInsufficientDataError::region() const {
    return m_Region;
}

std::size_t CInsufficientDataError::actual() const {
    return m_Actual;
}

std::size_t CInsufficientDataError::required() const {
    return m_Required;
}

CCollaboratorFetchError::CCollaboratorFetchError(const std::string& region, const std::string& what)
    : std::runtime_error{"Failed to fetch data for region '" + region + "': " + what},
      m_Region{region} {
}

const std::string& CCollaboratorFetchError::region() const {
    return m_Region;
}

CNoPatternAvailable::CNoPatternAvailable(const std::string& region, const std::string& cause)
    : std::runtime_error{"No pattern available for region '" + region + "': " + cause},
      m_Region{region} {
}

const std::string& CNoPatternAvailable::region() const {
    return m_Region;
}
}
}
