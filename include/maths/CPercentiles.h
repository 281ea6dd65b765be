/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_maths_CPercentiles_h
#define INCLUDED_greenweb_maths_CPercentiles_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cstddef>
#include <vector>

namespace greenweb {
namespace maths {

//! \brief
//! Two simple percentile estimators for a sample of values.
//!
//! DESCRIPTION:\n
//! nearestRankSorted() maps a percentile to a value of the sample and
//! countingPercentile() maps a value to a percentile of the sample.
//!
//! IMPLEMENTATION DECISIONS:\n
//! These are not inverses of one another.  The nearest rank estimator
//! truncates the index n * k / 100 and does no interpolation.  The counting
//! estimator counts values strictly less than the query.  Thresholds and
//! classifications built on each must keep these exact definitions, so they
//! are deliberately not unified.
//!
class MATHS_EXPORT CPercentiles : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;

public:
    //! Get the value at index floor(n * \p percentile / 100) of \p sorted,
    //! which must be in ascending order.  The index is clamped to the last
    //! element only if it would run past the end.
    //!
    //! \note \p sorted must not be empty.
    static double nearestRankSorted(const TDoubleVec& sorted, std::size_t percentile);

    //! Get 100 * #{x in \p sorted : x < \p value} / n.  Returns 50 if
    //! \p sorted is empty.
    static double countingPercentile(const TDoubleVec& sorted, double value);
};
}
}

#endif // INCLUDED_greenweb_maths_CPercentiles_h
