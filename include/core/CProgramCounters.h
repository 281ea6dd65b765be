/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CProgramCounters_h
#define INCLUDED_greenweb_core_CProgramCounters_h

#include <core/ImportExport.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace greenweb {
namespace counter_t {

//! The enum values must be explicitly assigned and the E_LastEnumCounter
//! value must be bumped for every new counter.  Don't forget to also add a
//! description of the new value to m_CounterDefinitions.
enum ECounterTypes {
    //! The number of successful pattern recomputations
    E_CINumberPatternRefreshes = 0,

    //! The number of pattern recomputations which failed
    E_CINumberPatternRefreshFailures = 1,

    //! The number of callers which joined a computation already in flight
    E_CINumberCoalescedRefreshes = 2,

    //! The number of times a stale pattern was served because a refresh
    //! failed or ran out of time
    E_CINumberStalePatternsServed = 3,

    //! The number of relative intensity requests handled
    E_CINumberRelativeRequests = 4,

    //! The number of relative intensity responses with no pattern behind them
    E_CINumberDegradedResponses = 5,

    //! The number of dynamic green hours requests handled
    E_CINumberGreenHourRequests = 6,

    //! The number of trend reports produced
    E_CINumberTrendReports = 7,

    //! The number of background refresh cycles run
    E_CINumberRefreshCycles = 8,

    // Add any new values here

    //! This MUST be last, increment the value for every new enum added
    E_LastEnumCounter = 9
};

static constexpr std::size_t NUM_COUNTERS = static_cast<std::size_t>(E_LastEnumCounter);
}

namespace core {

struct SCounterDefinition {
    counter_t::ECounterTypes s_Type;
    std::string s_Name;
    std::string s_Description;
};

//! \brief
//! Process wide counters.
//!
//! DESCRIPTION:\n
//! A singleton holding a fixed array of atomic counters which the service
//! bumps as it works.  Their values can be written to a stream, which the
//! command line program does at exit.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The counters are only ever incremented, so tests work with the change
//! in a value rather than its absolute value.
//!
class CORE_EXPORT CProgramCounters {
private:
    class CORE_EXPORT CCounter {
    public:
        CCounter() : m_Counter(0) {}

        CCounter& operator++() {
            ++m_Counter;
            return *this;
        }
        CCounter& operator+=(std::uint64_t counter) {
            m_Counter += counter;
            return *this;
        }
        operator std::uint64_t() const { return m_Counter; }

    private:
        std::atomic_uint_fast64_t m_Counter;
    };

    using TCounter = CCounter;
    using TCounterArray = std::array<TCounter, counter_t::NUM_COUNTERS>;
    using TCounterDefinitionArray = std::array<SCounterDefinition, counter_t::NUM_COUNTERS>;

public:
    //! \return the singleton's reference
    static CProgramCounters& instance();

    //! Provide access to the relevant counter
    static TCounter& counter(counter_t::ECounterTypes counterType);

    //! Get the definition of a counter
    static const SCounterDefinition& definition(counter_t::ECounterTypes counterType);

private:
    CProgramCounters() = default;
    CProgramCounters(CProgramCounters&) = delete;
    CProgramCounters& operator=(CProgramCounters&) = delete;

private:
    TCounterArray m_Counters;

    TCounterDefinitionArray m_CounterDefinitions{
        {{counter_t::E_CINumberPatternRefreshes, "E_CINumberPatternRefreshes",
          "Number of regional patterns successfully recomputed"},
         {counter_t::E_CINumberPatternRefreshFailures, "E_CINumberPatternRefreshFailures",
          "Number of regional pattern recomputations that failed"},
         {counter_t::E_CINumberCoalescedRefreshes, "E_CINumberCoalescedRefreshes",
          "Number of callers that waited on a recomputation already in progress"},
         {counter_t::E_CINumberStalePatternsServed, "E_CINumberStalePatternsServed",
          "Number of stale patterns served after a failed or slow recomputation"},
         {counter_t::E_CINumberRelativeRequests, "E_CINumberRelativeRequests",
          "Number of relative carbon intensity requests"},
         {counter_t::E_CINumberDegradedResponses, "E_CINumberDegradedResponses",
          "Number of relative intensity responses without a regional pattern"},
         {counter_t::E_CINumberGreenHourRequests, "E_CINumberGreenHourRequests",
          "Number of dynamic green hours requests"},
         {counter_t::E_CINumberTrendReports, "E_CINumberTrendReports",
          "Number of carbon trend reports produced"},
         {counter_t::E_CINumberRefreshCycles, "E_CINumberRefreshCycles",
          "Number of background refresh cycles run"}}};

    friend CORE_EXPORT std::ostream& operator<<(std::ostream& o,
                                                const CProgramCounters& counters);
};

//! Write one "name: value" line per counter.
CORE_EXPORT std::ostream& operator<<(std::ostream& o, const CProgramCounters& counters);
}
}

#endif // INCLUDED_greenweb_core_CProgramCounters_h
