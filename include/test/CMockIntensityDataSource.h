/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_test_CMockIntensityDataSource_h
#define INCLUDED_greenweb_test_CMockIntensityDataSource_h

#include <carbon/CIntensityDataSource.h>
#include <carbon/CarbonTypes.h>

#include <test/ImportExport.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

namespace greenweb {
namespace test {

//! \brief
//! An in-memory data source for testing the carbon engine.
//!
//! DESCRIPTION:\n
//! Serves whatever samples, readings and forecasts it has been given for
//! each region.  The history is returned whole, whatever the requested
//! time range.  Any of the three kinds of request can be made to fail and
//! history requests can be held at a gate until it is opened, which lets
//! tests control how long a computation takes.
//!
//! Safe to call from several threads at once.
//!
class TEST_EXPORT CMockIntensityDataSource : public carbon::CIntensityDataSource {
public:
    CMockIntensityDataSource() = default;

    //! \name Data
    //@{
    void samples(const std::string& region, const carbon::TSampleVec& samples);
    void current(const std::string& region, const carbon::SCurrentIntensity& current);
    void forecast(const std::string& region, const carbon::SGreenHoursForecast& forecast);
    //@}

    //! \name Failures
    //@{
    void failHistory(bool fail);
    void failCurrent(bool fail);
    void failForecast(bool fail);
    //@}

    //! Hold history requests until openGate() is called or their deadline
    //! passes, in which case they fail.
    void closeGate();
    void openGate();
    //! The number of history requests waiting at the gate.
    std::size_t numberWaiting() const;

    //! \name Call Counts
    //@{
    std::size_t historyCalls() const;
    std::size_t currentCalls() const;
    std::size_t forecastCalls() const;
    //@}

    //! \name CIntensityDataSource Interface
    //@{
    carbon::TSampleVec historicalSamples(const std::string& region,
                                         core_t::TTime start,
                                         core_t::TTime end,
                                         const core::CDeadline& deadline) override;

    carbon::SCurrentIntensity currentIntensity(const std::string& region,
                                               const core::CDeadline& deadline) override;

    carbon::SGreenHoursForecast greenHoursForecast(const std::string& region,
                                                   int hours,
                                                   const core::CDeadline& deadline) override;
    //@}

private:
    using TStrSampleVecMap = std::map<std::string, carbon::TSampleVec>;
    using TStrCurrentIntensityMap = std::map<std::string, carbon::SCurrentIntensity>;
    using TStrGreenHoursForecastMap = std::map<std::string, carbon::SGreenHoursForecast>;

private:
    void waitAtGate(const std::string& region, const core::CDeadline& deadline);

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_GateCondition;
    bool m_GateOpen{true};
    std::size_t m_NumberWaiting{0};

    TStrSampleVecMap m_Samples;
    TStrCurrentIntensityMap m_Current;
    TStrGreenHoursForecastMap m_Forecasts;

    std::atomic<bool> m_FailHistory{false};
    std::atomic<bool> m_FailCurrent{false};
    std::atomic<bool> m_FailForecast{false};

    std::atomic<std::size_t> m_HistoryCalls{0};
    std::atomic<std::size_t> m_CurrentCalls{0};
    std::atomic<std::size_t> m_ForecastCalls{0};
};
}
}

#endif // INCLUDED_greenweb_test_CMockIntensityDataSource_h
