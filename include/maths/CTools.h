/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_maths_CTools_h
#define INCLUDED_greenweb_maths_CTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

namespace greenweb {
namespace maths {

//! \brief A collection of utility functions.
//!
//! DESCRIPTION:\n
//! Stateless numeric helpers shared by the carbon analytics: clamping
//! factors to a range and rounding reported values.
class MATHS_EXPORT CTools : private core::CNonInstantiatable {
public:
    //! Truncate \p x to the range [\p a, \p b].
    template<typename T>
    static const T& truncate(const T& x, const T& a, const T& b) {
        return x < a ? a : (b < x ? b : x);
    }

    //! Round \p x half away from zero to \p decimalPlaces.
    static double roundToDecimalPlaces(double x, int decimalPlaces);
};
}
}

#endif // INCLUDED_greenweb_maths_CTools_h
