/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_maths_CSimpleLinearRegression_h
#define INCLUDED_greenweb_maths_CSimpleLinearRegression_h

#include <maths/ImportExport.h>


namespace greenweb {
namespace maths {

//! \brief
//! Ordinary least squares fit of a straight line y = a + b x.
//!
//! DESCRIPTION:\n
//! Accumulates the sums needed for the normal equations as points are
//! added, so the slope is available at any time in constant time.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The fit is degenerate with fewer than two distinct abscissas, in
//! which case the slope is zero.
//!
class MATHS_EXPORT CSimpleLinearRegression {
public:
    //! Add the point (\p x, \p y).
    void add(double x, double y);

    //! The least squares slope.
    double slope() const;

private:
    double m_N{0.0};
    double m_SumX{0.0};
    double m_SumY{0.0};
    double m_SumXY{0.0};
    double m_SumXX{0.0};
};
}
}

#endif // INCLUDED_greenweb_maths_CSimpleLinearRegression_h
