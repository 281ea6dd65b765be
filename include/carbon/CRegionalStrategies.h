/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CRegionalStrategies_h
#define INCLUDED_greenweb_carbon_CRegionalStrategies_h

#include <core/CNonInstantiatable.h>

#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <string>

namespace greenweb {
namespace carbon {

//! \brief
//! Fixed scheduling advice for regions whose grids vary a lot.
//!
//! DESCRIPTION:\n
//! Regions without their own entry get a generic strategy built around
//! typical night and midday demand troughs.
//!
class CARBON_EXPORT CRegionalStrategies : private core::CNonInstantiatable {
public:
    //! Get the strategy for \p region.
    static SRegionalStrategy strategy(const std::string& region);
};
}
}

#endif // INCLUDED_greenweb_carbon_CRegionalStrategies_h
