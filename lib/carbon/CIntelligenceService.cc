/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CIntelligenceService.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>

#include <carbon/CGreenHourFilter.h>
#include <carbon/CIntelligenceErrors.h>
#include <carbon/CIntensityDataSource.h>
#include <carbon/CRegionalStrategies.h>
#include <carbon/CRelativeMetricsEngine.h>

#include <chrono>
#include <exception>

namespace greenweb {
namespace carbon {

const double CIntelligenceService::DEGRADED_CONFIDENCE(0.5);

CIntelligenceService::CIntelligenceService(CIntensityDataSource& source,
                                           const CIntelligenceConfig& config,
                                           TClock clock)
    : m_Source(source), m_Config{config}, m_Scorer{config.historyRetentionDays()},
      m_WindowPredictor{m_Scorer}, m_TrendReporter{config.minDataPointsForAnalysis()},
      m_Store{source, config, std::move(clock)},
      m_Scheduler{m_Store, std::chrono::seconds{config.updateInterval()},
                  std::chrono::seconds{config.refreshTimeout()}} {
}

CIntelligenceService::~CIntelligenceService() = default;

SRelativeCarbonIntensity
CIntelligenceService::relativeCarbonIntensity(const std::string& region,
                                              const core::CDeadline& deadline) {
    ++core::CProgramCounters::counter(counter_t::E_CINumberRelativeRequests);

    SRelativeCarbonIntensity result;
    try {
        result.s_Current = m_Source.currentIntensity(region, deadline);
    } catch (const CCollaboratorFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw CCollaboratorFetchError{region, e.what()};
    }

    TRegionPatternCPtr pattern;
    try {
        pattern = m_Store.pattern(region, deadline);
    } catch (const CNoPatternAvailable& e) {
        LOG_WARN(<< "Using absolute values only: " << e.what());
        ++core::CProgramCounters::counter(counter_t::E_CINumberDegradedResponses);
        result.s_ConfidenceScore = DEGRADED_CONFIDENCE;
        return result;
    }

    core_t::TTime now{m_Store.now()};
    double intensity{result.s_Current.s_CarbonIntensity};
    auto classification = CRelativeMetricsEngine::classify(intensity, *pattern);

    result.s_HasRelativeMetrics = true;
    result.s_LocalPercentile = classification.s_Percentile;
    result.s_DailyRank = classification.s_DailyRank;
    result.s_RelativeMode = classification.s_Mode;
    result.s_TrendDirection = pattern->trendDirection();
    result.s_TrendMagnitude = classification.s_TrendMagnitude;
    result.s_NextOptimalWindow = m_WindowPredictor.predictNextWindow(*pattern, now);
    result.s_ConfidenceScore = m_Scorer.confidence(*pattern, now);
    result.s_RegionalBaseline = pattern->mean();
    result.s_IsHighVariation = m_Config.isHighVariationRegion(region);

    LOG_TRACE(<< region << " at " << intensity << " is " << result.s_RelativeMode
              << " (P" << result.s_LocalPercentile << ")");
    return result;
}

SGreenHoursForecast CIntelligenceService::dynamicGreenHours(const std::string& region,
                                                            int hours,
                                                            const core::CDeadline& deadline) {
    ++core::CProgramCounters::counter(counter_t::E_CINumberGreenHourRequests);

    TRegionPatternCPtr pattern;
    try {
        pattern = m_Store.pattern(region, deadline);
    } catch (const CNoPatternAvailable& e) {
        LOG_WARN(<< "Returning unfiltered forecast: " << e.what());
    }

    SGreenHoursForecast forecast;
    try {
        forecast = m_Source.greenHoursForecast(region, hours, deadline);
    } catch (const CCollaboratorFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw CCollaboratorFetchError{region, e.what()};
    }

    if (pattern == nullptr) {
        return forecast;
    }

    forecast.s_GreenHours = CGreenHourFilter::filter(forecast.s_GreenHours, *pattern);
    if (forecast.s_GreenHours.empty() == false) {
        forecast.s_BestWindow = CGreenHourFilter::bestWindow(forecast.s_GreenHours);
    }
    return forecast;
}

SCarbonTrend CIntelligenceService::carbonTrends(const std::string& region,
                                                const std::string& period,
                                                int days,
                                                const core::CDeadline& deadline) {
    core_t::TTime end{m_Store.now()};
    core_t::TTime start{end - static_cast<core_t::TTime>(days) * core::CTimeUtils::SECONDS_IN_DAY};

    TSampleVec samples;
    try {
        samples = m_Source.historicalSamples(region, start, end, deadline);
    } catch (const CCollaboratorFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw CCollaboratorFetchError{region, e.what()};
    }

    SCarbonTrend result{m_TrendReporter.report(region, period, samples, start, end)};
    ++core::CProgramCounters::counter(counter_t::E_CINumberTrendReports);
    return result;
}

TRegionPatternCPtr CIntelligenceService::regionalPattern(const std::string& region) const {
    TRegionPatternCPtr result{m_Store.cached(region)};
    if (result == nullptr) {
        throw CNoPatternAvailable{region, "no pattern has been computed"};
    }
    return result;
}

TRegionPatternCPtr CIntelligenceService::updatePattern(const std::string& region,
                                                       const core::CDeadline& deadline) {
    return m_Store.refresh(region, deadline);
}

bool CIntelligenceService::clearPattern(const std::string& region) {
    return m_Store.clear(region);
}

void CIntelligenceService::clearAllPatterns() {
    m_Store.clearAll();
}

TStrVec CIntelligenceService::supportedRegions() const {
    return m_Store.regions();
}

bool CIntelligenceService::isHighVariationRegion(const std::string& region) const {
    return m_Config.isHighVariationRegion(region);
}

SRegionalStrategy CIntelligenceService::regionalStrategy(const std::string& region) const {
    return CRegionalStrategies::strategy(region);
}

bool CIntelligenceService::startRefresh() {
    return m_Scheduler.start();
}

bool CIntelligenceService::stopRefresh() {
    return m_Scheduler.stop();
}

const CIntelligenceConfig& CIntelligenceService::config() const {
    return m_Config;
}
}
}
