/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CRegionPatternStore_h
#define INCLUDED_greenweb_carbon_CRegionPatternStore_h

#include <core/CDeadline.h>
#include <core/CNonCopyable.h>
#include <core/CStaticThreadPool.h>
#include <core/CTimeUtils.h>
#include <core/CoreTypes.h>

#include <carbon/CIntelligenceConfig.h>
#include <carbon/CPatternCalculator.h>
#include <carbon/CRegionPattern.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace greenweb {
namespace carbon {
class CIntensityDataSource;

//! \brief
//! The cache of learned regional patterns.
//!
//! DESCRIPTION:\n
//! Maps a region to its most recent pattern.  A pattern is recomputed from
//! the data source when it is read for the first time, when it is read and
//! is older than the update interval, or when a refresh is forced.  Patterns
//! are only removed by clear() and clearAll().
//!
//! If a recomputation fails or doesn't finish by the caller's deadline the
//! previous pattern, if there is one, is returned in its place.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Readers take a shared lock on the map and get a pointer to an immutable
//! pattern, so they never block one another.  The lock is held exclusively
//! only to swap in a new pointer.
//!
//! Computations run on a small pool owned by the store.  At most one runs
//! per region: the shared future of the computation in flight is kept in
//! a map keyed by region and anyone else asking for that region waits on
//! it.  This lets each caller stop waiting at its own deadline while the
//! computation carries on and installs its result for the next reader.
//!
//! A computation which was started before its region, or the whole store,
//! was cleared still returns its result to its waiters but isn't installed.
//! Clearing one region doesn't affect computations for any other.
//!
class CARBON_EXPORT CRegionPatternStore : private core::CNonCopyable {
public:
    using TClock = std::function<core_t::TTime()>;

public:
    CRegionPatternStore(CIntensityDataSource& source,
                        const CIntelligenceConfig& config,
                        TClock clock = &core::CTimeUtils::now);
    ~CRegionPatternStore();

    //! Get the pattern for \p region, computing it if it is missing or
    //! stale.
    //!
    //! \throws CNoPatternAvailable if there is no cached pattern and one
    //! can't be computed by \p deadline.
    TRegionPatternCPtr pattern(const std::string& region,
                               const core::CDeadline& deadline = core::CDeadline::never());

    //! Recompute the pattern for \p region whatever its age.
    //!
    //! \throws the error which caused the computation to fail, or
    //! CNoPatternAvailable if it doesn't finish by \p deadline.
    TRegionPatternCPtr refresh(const std::string& region,
                               const core::CDeadline& deadline = core::CDeadline::never());

    //! Get the cached pattern for \p region, null if there isn't one.
    TRegionPatternCPtr cached(const std::string& region) const;

    //! Remove \p region returning true if it was present.
    bool clear(const std::string& region);

    //! Remove every region.
    void clearAll();

    //! The regions with a cached pattern, sorted.
    TStrVec regions() const;

    //! Is \p pattern older than the update interval at \p now?
    bool isStale(const CRegionPattern& pattern, core_t::TTime now) const;

    //! The current time according to the store's clock.
    core_t::TTime now() const;

    const CIntelligenceConfig& config() const;

private:
    using TPatternFuture = std::shared_future<TRegionPatternCPtr>;
    using TPatternPromise = std::promise<TRegionPatternCPtr>;
    using TPatternPromisePtr = std::shared_ptr<TPatternPromise>;
    using TStrPatternCPtrMap = std::map<std::string, TRegionPatternCPtr>;
    using TStrPatternFutureMap = std::map<std::string, TPatternFuture>;
    using TStrUInt64Map = std::map<std::string, std::uint64_t>;
    //! The store and region generations when a computation started.
    using TGeneration = std::pair<std::uint64_t, std::uint64_t>;

private:
    //! Get the computation in flight for \p region starting one if there
    //! is none. If \p reuseFresh is true and a fresh pattern was installed
    //! since the caller last looked, that is returned instead.
    TPatternFuture computation(const std::string& region, bool reuseFresh);

    //! The current generation of \p region. The caller must hold
    //! m_PatternsMutex.
    TGeneration generation(const std::string& region) const;

    //! Fetch the history for \p region and compute its pattern.
    TRegionPatternCPtr compute(const std::string& region) const;

    //! Run on the pool to compute \p region and publish the result.
    void run(const std::string& region,
             const TGeneration& generation,
             const TPatternPromisePtr& promise);

    void failed(const std::string& region,
                const TPatternPromisePtr& promise,
                std::exception_ptr error,
                const std::string& reason);

    //! Wait for \p future until \p deadline returning true if it's ready.
    static bool waitUntil(const TPatternFuture& future, const core::CDeadline& deadline);

private:
    CIntensityDataSource& m_Source;
    CIntelligenceConfig m_Config;
    TClock m_Clock;
    CPatternCalculator m_Calculator;

    mutable std::shared_mutex m_PatternsMutex;
    TStrPatternCPtrMap m_Patterns;
    //! Bumped by clearAll.
    std::uint64_t m_Generation{0};
    //! Bumped by clear for the region cleared.
    TStrUInt64Map m_RegionGenerations;

    std::mutex m_InFlightMutex;
    TStrPatternFutureMap m_InFlight;

    //! This must be last so that it finishes all tasks before anything
    //! they use is destroyed.
    core::CStaticThreadPool m_Pool;
};
}
}

#endif // INCLUDED_greenweb_carbon_CRegionPatternStore_h
