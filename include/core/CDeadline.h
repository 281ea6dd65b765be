/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CDeadline_h
#define INCLUDED_greenweb_core_CDeadline_h

#include <core/ImportExport.h>

#include <chrono>

namespace greenweb {
namespace core {

//! \brief
//! A point in time after which a caller no longer wants an answer.
//!
//! DESCRIPTION:\n
//! Passed down through blocking calls so that each of them waits at most
//! until the caller's deadline.  A deadline built by never() does not
//! expire.
//!
class CORE_EXPORT CDeadline {
public:
    using TClock = std::chrono::steady_clock;
    using TTimePoint = TClock::time_point;

public:
    //! A deadline which never expires.
    CDeadline();

    explicit CDeadline(TTimePoint when);

    //! A deadline \p duration from now.
    template<typename REP, typename PERIOD>
    static CDeadline fromNow(const std::chrono::duration<REP, PERIOD>& duration) {
        return CDeadline{TClock::now() +
                         std::chrono::duration_cast<TClock::duration>(duration)};
    }

    //! A deadline which never expires.
    static CDeadline never();

    //! Has the deadline passed?
    bool expired() const;

    //! Does this deadline ever expire?
    bool isNever() const;

    //! The time point, TTimePoint::max() if it never expires.
    TTimePoint when() const;

private:
    TTimePoint m_When;
};
}
}

#endif // INCLUDED_greenweb_core_CDeadline_h
