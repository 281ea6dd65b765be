/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CTimeUtils.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <string.h>
#include <time.h>

namespace greenweb {
namespace core {

const core_t::TTime CTimeUtils::SECONDS_IN_HOUR{60 * 60};
const core_t::TTime CTimeUtils::SECONDS_IN_DAY{24 * 60 * 60};

namespace {
//! Floor division so times before the epoch land in the right day.
core_t::TTime floorDiv(core_t::TTime t, core_t::TTime d) {
    core_t::TTime q{t / d};
    return (t % d != 0 && t < 0) ? q - 1 : q;
}
}

core_t::TTime CTimeUtils::now() {
    return ::time(nullptr);
}

std::string CTimeUtils::toIso8601(core_t::TTime t) {
    struct tm parts;
    ::memset(&parts, 0, sizeof(parts));
    if (::gmtime_r(&t, &parts) == nullptr) {
        LOG_ERROR(<< "Unable to convert " << t << " to a UTC date");
        return std::string{};
    }
    char buf[32];
    std::size_t length{::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts)};
    return std::string(buf, length);
}

bool CTimeUtils::fromIso8601(const std::string& str, core_t::TTime& t) {
    std::string trimmed{str};
    CStringUtils::trimWhitespace(trimmed);

    long long epoch{0};
    if (CStringUtils::stringToTypeSilent(trimmed, epoch)) {
        t = static_cast<core_t::TTime>(epoch);
        return true;
    }

    struct tm parts;
    ::memset(&parts, 0, sizeof(parts));
    const char* end{::strptime(trimmed.c_str(), "%Y-%m-%dT%H:%M:%S", &parts)};
    if (end == nullptr || (*end != '\0' && ::strcmp(end, "Z") != 0)) {
        LOG_ERROR(<< "Unable to parse '" << str << "' as a UTC time");
        return false;
    }
    t = ::timegm(&parts);
    return true;
}

int CTimeUtils::hourOfDay(core_t::TTime t) {
    return static_cast<int>(floorDiv(t - startOfDay(t), SECONDS_IN_HOUR));
}

int CTimeUtils::dayOfWeek(core_t::TTime t) {
    // 1970-01-01 was a Thursday
    core_t::TTime days{floorDiv(t, SECONDS_IN_DAY)};
    return static_cast<int>(((days + 4) % 7 + 7) % 7);
}

bool CTimeUtils::isWeekend(core_t::TTime t) {
    int day{dayOfWeek(t)};
    return day == 0 || day == 6;
}

core_t::TTime CTimeUtils::startOfDay(core_t::TTime t) {
    return floorDiv(t, SECONDS_IN_DAY) * SECONDS_IN_DAY;
}

}
}
