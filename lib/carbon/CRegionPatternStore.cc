/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CRegionPatternStore.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CTimeUtils.h>

#include <carbon/CIntelligenceErrors.h>
#include <carbon/CIntensityDataSource.h>

#include <chrono>

namespace greenweb {
namespace carbon {

CRegionPatternStore::CRegionPatternStore(CIntensityDataSource& source,
                                         const CIntelligenceConfig& config,
                                         TClock clock)
    : m_Source(source), m_Config{config}, m_Clock{std::move(clock)},
      m_Calculator{config.minDataPointsForAnalysis()}, m_Pool{config.workerThreads()} {
}

CRegionPatternStore::~CRegionPatternStore() = default;

TRegionPatternCPtr CRegionPatternStore::pattern(const std::string& region,
                                                const core::CDeadline& deadline) {
    TRegionPatternCPtr previous{this->cached(region)};
    if (previous != nullptr && this->isStale(*previous, this->now()) == false) {
        return previous;
    }

    TPatternFuture future{this->computation(region, true)};

    if (waitUntil(future, deadline) == false) {
        if (previous != nullptr) {
            LOG_WARN(<< "Timed out refreshing pattern for " << region
                     << ", serving pattern from "
                     << core::CTimeUtils::toIso8601(previous->lastUpdated()));
            ++core::CProgramCounters::counter(counter_t::E_CINumberStalePatternsServed);
            return previous;
        }
        throw CNoPatternAvailable{region, "timed out waiting for the first computation"};
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        if (previous != nullptr) {
            LOG_WARN(<< "Failed to refresh pattern for " << region << ", serving pattern from "
                     << core::CTimeUtils::toIso8601(previous->lastUpdated())
                     << ": " << e.what());
            ++core::CProgramCounters::counter(counter_t::E_CINumberStalePatternsServed);
            return previous;
        }
        throw CNoPatternAvailable{region, e.what()};
    }
}

TRegionPatternCPtr CRegionPatternStore::refresh(const std::string& region,
                                                const core::CDeadline& deadline) {
    TPatternFuture future{this->computation(region, false)};
    if (waitUntil(future, deadline) == false) {
        throw CNoPatternAvailable{region, "timed out waiting for the computation"};
    }
    return future.get();
}

TRegionPatternCPtr CRegionPatternStore::cached(const std::string& region) const {
    std::shared_lock<std::shared_mutex> lock{m_PatternsMutex};
    auto i = m_Patterns.find(region);
    return i == m_Patterns.end() ? nullptr : i->second;
}

bool CRegionPatternStore::clear(const std::string& region) {
    std::unique_lock<std::shared_mutex> lock{m_PatternsMutex};
    ++m_RegionGenerations[region];
    return m_Patterns.erase(region) > 0;
}

void CRegionPatternStore::clearAll() {
    std::unique_lock<std::shared_mutex> lock{m_PatternsMutex};
    ++m_Generation;
    m_Patterns.clear();
}

TStrVec CRegionPatternStore::regions() const {
    TStrVec result;
    std::shared_lock<std::shared_mutex> lock{m_PatternsMutex};
    result.reserve(m_Patterns.size());
    for (const auto& entry : m_Patterns) {
        result.push_back(entry.first);
    }
    return result;
}

bool CRegionPatternStore::isStale(const CRegionPattern& pattern, core_t::TTime now) const {
    return now - pattern.lastUpdated() > m_Config.updateInterval();
}

core_t::TTime CRegionPatternStore::now() const {
    return m_Clock();
}

const CIntelligenceConfig& CRegionPatternStore::config() const {
    return m_Config;
}

CRegionPatternStore::TPatternFuture
CRegionPatternStore::computation(const std::string& region, bool reuseFresh) {
    TGeneration generation;
    TPatternPromisePtr promise;
    TPatternFuture future;
    {
        std::lock_guard<std::mutex> lock{m_InFlightMutex};
        auto i = m_InFlight.find(region);
        if (i != m_InFlight.end()) {
            LOG_TRACE(<< "Joining computation in flight for " << region);
            ++core::CProgramCounters::counter(counter_t::E_CINumberCoalescedRefreshes);
            return i->second;
        }

        // A computation may have finished between the caller reading the
        // cache and getting here.
        if (reuseFresh) {
            TRegionPatternCPtr current{this->cached(region)};
            if (current != nullptr && this->isStale(*current, this->now()) == false) {
                LOG_TRACE(<< "Using pattern for " << region << " which has just been computed");
                TPatternPromise ready;
                ready.set_value(current);
                return ready.get_future().share();
            }
        }

        {
            std::shared_lock<std::shared_mutex> patternsLock{m_PatternsMutex};
            generation = this->generation(region);
        }
        promise = std::make_shared<TPatternPromise>();
        future = promise->get_future().share();
        m_InFlight.emplace(region, future);
    }

    LOG_DEBUG(<< "Scheduling pattern computation for " << region);
    m_Pool.schedule([this, region, generation, promise]() {
        this->run(region, generation, promise);
    });
    return future;
}

CRegionPatternStore::TGeneration
CRegionPatternStore::generation(const std::string& region) const {
    auto i = m_RegionGenerations.find(region);
    return {m_Generation, i == m_RegionGenerations.end() ? 0 : i->second};
}

TRegionPatternCPtr CRegionPatternStore::compute(const std::string& region) const {
    core_t::TTime end{this->now()};
    core_t::TTime start{end - static_cast<core_t::TTime>(m_Config.historyRetentionDays()) *
                                  core::CTimeUtils::SECONDS_IN_DAY};
    auto fetchDeadline = core::CDeadline::fromNow(std::chrono::seconds{m_Config.refreshTimeout()});

    TSampleVec samples{m_Source.historicalSamples(region, start, end, fetchDeadline)};
    LOG_DEBUG(<< "Fetched " << samples.size() << " samples for " << region);
    return m_Calculator.compute(region, std::move(samples), end);
}

void CRegionPatternStore::run(const std::string& region,
                              const TGeneration& generation,
                              const TPatternPromisePtr& promise) {
    TRegionPatternCPtr result;
    try {
        result = this->compute(region);
    } catch (const CInsufficientDataError& e) {
        this->failed(region, promise, std::current_exception(), e.what());
        return;
    } catch (const CCollaboratorFetchError& e) {
        this->failed(region, promise, std::current_exception(), e.what());
        return;
    } catch (const std::exception& e) {
        this->failed(region, promise,
                     std::make_exception_ptr(CCollaboratorFetchError{region, e.what()}),
                     e.what());
        return;
    } catch (...) {
        this->failed(region, promise, std::current_exception(), "unknown error");
        return;
    }

    {
        std::unique_lock<std::shared_mutex> lock{m_PatternsMutex};
        if (generation == this->generation(region)) {
            m_Patterns[region] = result;
        } else {
            LOG_DEBUG(<< "Not caching pattern for " << region << " which was cleared");
        }
    }
    {
        std::lock_guard<std::mutex> lock{m_InFlightMutex};
        m_InFlight.erase(region);
    }
    ++core::CProgramCounters::counter(counter_t::E_CINumberPatternRefreshes);
    promise->set_value(result);
}

void CRegionPatternStore::failed(const std::string& region,
                                 const TPatternPromisePtr& promise,
                                 std::exception_ptr error,
                                 const std::string& reason) {
    LOG_ERROR(<< "Failed to compute pattern for " << region << ": " << reason);
    {
        std::lock_guard<std::mutex> lock{m_InFlightMutex};
        m_InFlight.erase(region);
    }
    ++core::CProgramCounters::counter(counter_t::E_CINumberPatternRefreshFailures);
    promise->set_exception(std::move(error));
}

bool CRegionPatternStore::waitUntil(const TPatternFuture& future, const core::CDeadline& deadline) {
    if (deadline.isNever()) {
        future.wait();
        return true;
    }
    return future.wait_until(deadline.when()) == std::future_status::ready;
}
}
}
