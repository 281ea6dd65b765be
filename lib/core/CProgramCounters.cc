/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CProgramCounters.h>

#include <core/CoreTypes.h>

#include <ostream>

namespace greenweb {
namespace core {

CProgramCounters& CProgramCounters::instance() {
    static CProgramCounters instance;
    return instance;
}

CProgramCounters::TCounter& CProgramCounters::counter(counter_t::ECounterTypes counterType) {
    return instance().m_Counters[static_cast<std::size_t>(counterType)];
}

const SCounterDefinition& CProgramCounters::definition(counter_t::ECounterTypes counterType) {
    return instance().m_CounterDefinitions[static_cast<std::size_t>(counterType)];
}

std::ostream& operator<<(std::ostream& o, const CProgramCounters& counters) {
    for (const auto& definition : counters.m_CounterDefinitions) {
        o << definition.s_Name << ": "
          << static_cast<std::uint64_t>(
                 counters.m_Counters[static_cast<std::size_t>(definition.s_Type)])
          << core_t::LINE_ENDING;
    }
    return o;
}
}
}
