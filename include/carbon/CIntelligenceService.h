/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_CIntelligenceService_h
#define INCLUDED_greenweb_carbon_CIntelligenceService_h

#include <core/CDeadline.h>
#include <core/CNonCopyable.h>
#include <core/CTimeUtils.h>

#include <carbon/CConfidenceScorer.h>
#include <carbon/CIntelligenceConfig.h>
#include <carbon/CRefreshScheduler.h>
#include <carbon/CRegionPattern.h>
#include <carbon/CRegionPatternStore.h>
#include <carbon/CTrendReporter.h>
#include <carbon/CWindowPredictor.h>
#include <carbon/CarbonTypes.h>
#include <carbon/ImportExport.h>

#include <string>

namespace greenweb {
namespace carbon {
class CIntensityDataSource;

//! \brief
//! Carbon intelligence for web workloads.
//!
//! DESCRIPTION:\n
//! The entry point for everything the engine offers: a current reading
//! placed in its region's own history, green hours re-ranked against that
//! history, trend reports, regional strategies and management of the
//! learned patterns.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Each method takes an optional deadline which bounds the time spent
//! waiting for a pattern.  Missing analytics never fail a relative
//! intensity request: the current reading is returned with a neutral
//! confidence of 0.5 and hasRelativeMetrics set to false.
//!
//! The background refresh isn't started by the constructor.  Call
//! startRefresh() to run it.
//!
class CARBON_EXPORT CIntelligenceService : private core::CNonCopyable {
public:
    using TClock = CRegionPatternStore::TClock;

    //! The confidence reported when there is no pattern.
    static const double DEGRADED_CONFIDENCE;

public:
    CIntelligenceService(CIntensityDataSource& source,
                         const CIntelligenceConfig& config,
                         TClock clock = &core::CTimeUtils::now);
    ~CIntelligenceService();

    //! Get the current reading for \p region with its relative metrics.
    //!
    //! \throws CCollaboratorFetchError if the current reading can't be
    //! fetched.
    SRelativeCarbonIntensity
    relativeCarbonIntensity(const std::string& region,
                            const core::CDeadline& deadline = core::CDeadline::never());

    //! Get the forecast green hours for \p region over the next \p hours
    //! keeping only those which are green for the region.
    //!
    //! \throws CCollaboratorFetchError if the forecast can't be fetched.
    SGreenHoursForecast dynamicGreenHours(const std::string& region,
                                          int hours,
                                          const core::CDeadline& deadline = core::CDeadline::never());

    //! Report on the last \p days of \p region's history.
    //!
    //! \throws CCollaboratorFetchError if the history can't be fetched or
    //! CInsufficientDataError if there is too little of it.
    SCarbonTrend carbonTrends(const std::string& region,
                              const std::string& period,
                              int days,
                              const core::CDeadline& deadline = core::CDeadline::never());

    //! \name Pattern Management
    //@{
    //! Get the cached pattern for \p region without computing it.
    //!
    //! \throws CNoPatternAvailable if there isn't one.
    TRegionPatternCPtr regionalPattern(const std::string& region) const;

    //! Recompute the pattern for \p region.  Errors are not masked by a
    //! cached pattern.
    TRegionPatternCPtr updatePattern(const std::string& region,
                                     const core::CDeadline& deadline = core::CDeadline::never());

    bool clearPattern(const std::string& region);
    void clearAllPatterns();

    //! The regions with a cached pattern, sorted.
    TStrVec supportedRegions() const;
    //@}

    bool isHighVariationRegion(const std::string& region) const;

    SRegionalStrategy regionalStrategy(const std::string& region) const;

    //! Start and stop the background refresh of cached patterns.
    bool startRefresh();
    bool stopRefresh();

    const CIntelligenceConfig& config() const;

private:
    CIntensityDataSource& m_Source;
    CIntelligenceConfig m_Config;
    CConfidenceScorer m_Scorer;
    CWindowPredictor m_WindowPredictor;
    CTrendReporter m_TrendReporter;
    CRegionPatternStore m_Store;
    //! Declared after the store so it's stopped before the store goes.
    CRefreshScheduler m_Scheduler;
};
}
}

#endif // INCLUDED_greenweb_carbon_CIntelligenceService_h
