/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CRefreshScheduler_h
#define INCLUDED_greenweb_carbon_CRefreshScheduler_h

#include <core/CNonCopyable.h>

#include <carbon/ImportExport.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace greenweb {
namespace carbon {
class CRegionPatternStore;

//! \brief
//! Periodically refreshes every cached regional pattern.
//!
//! DESCRIPTION:\n
//! Once started, a background thread calls refreshAll() every interval
//! until stop() is called.  refreshAll() can also be called directly, which
//! is how tests drive it.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Regions are refreshed one after another and each is given at most the
//! refresh timeout.  A failed or slow refresh is logged and the region's
//! cached pattern is left in place.
//!
//! The refreshes go through the store, so they share any computation
//! already in flight for a region.
//!
class CARBON_EXPORT CRefreshScheduler : private core::CNonCopyable {
public:
    using TDuration = std::chrono::milliseconds;

public:
    CRefreshScheduler(CRegionPatternStore& store, TDuration interval, TDuration timeout);
    ~CRefreshScheduler();

    //! Start the background thread.  Returns false if it is already running.
    bool start();

    //! Stop the background thread and wait for it to exit.  Returns false if
    //! it wasn't running.
    bool stop();

    //! Refresh each cached region once and return the number refreshed
    //! successfully.
    std::size_t refreshAll();

private:
    void loop();

private:
    CRegionPatternStore& m_Store;
    TDuration m_Interval;
    TDuration m_Timeout;

    std::mutex m_Mutex;
    std::condition_variable m_Condition;
    bool m_Running{false};
    bool m_StopRequested{false};
    std::thread m_Thread;
};
}
}

#endif // INCLUDED_greenweb_carbon_CRefreshScheduler_h
