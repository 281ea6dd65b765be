/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CRefreshScheduler.h>

#include <core/CDeadline.h>
#include <core/CLogger.h>
#include <core/CProgramCounters.h>

#include <carbon/CRegionPatternStore.h>

#include <exception>

namespace greenweb {
namespace carbon {

CRefreshScheduler::CRefreshScheduler(CRegionPatternStore& store, TDuration interval, TDuration timeout)
    : m_Store(store), m_Interval{interval}, m_Timeout{timeout} {
}

CRefreshScheduler::~CRefreshScheduler() {
    this->stop();
}

bool CRefreshScheduler::start() {
    std::lock_guard<std::mutex> lock{m_Mutex};
    if (m_Running) {
        LOG_WARN(<< "Pattern refresh scheduler is already running");
        return false;
    }
    m_StopRequested = false;
    m_Running = true;
    m_Thread = std::thread([this] { this->loop(); });
    LOG_INFO(<< "Started pattern refresh every " << m_Interval.count() << "ms");
    return true;
}

bool CRefreshScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        if (m_Running == false) {
            return false;
        }
        m_StopRequested = true;
    }
    m_Condition.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        m_Running = false;
    }
    LOG_INFO(<< "Stopped pattern refresh");
    return true;
}

std::size_t CRefreshScheduler::refreshAll() {
    ++core::CProgramCounters::counter(counter_t::E_CINumberRefreshCycles);

    TStrVec regions{m_Store.regions()};
    LOG_DEBUG(<< "Refreshing " << regions.size() << " regional patterns");

    std::size_t refreshed{0};
    for (const auto& region : regions) {
        try {
            m_Store.refresh(region, core::CDeadline::fromNow(m_Timeout));
            ++refreshed;
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to refresh pattern for " << region << ": " << e.what());
        }
    }
    return refreshed;
}

void CRefreshScheduler::loop() {
    std::unique_lock<std::mutex> lock{m_Mutex};
    for (;;) {
        if (m_Condition.wait_for(lock, m_Interval, [this] { return m_StopRequested; })) {
            break;
        }
        lock.unlock();
        this->refreshAll();
        lock.lock();
    }
}
}
}
