/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CTimeUtils.h>

#include <carbon/CIntelligenceErrors.h>
#include <carbon/CTrendReporter.h>

#include <test/CIntensityTestData.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CTrendReporterTest)

using namespace greenweb;

namespace {
// Wednesday
const core_t::TTime MAY_DAY{1714521600};
const core_t::TTime HOUR{3600};
const core_t::TTime DAY{86400};
}

BOOST_AUTO_TEST_CASE(testInsufficientData) {
    carbon::CTrendReporter reporter{24};
    BOOST_REQUIRE_THROW(reporter.report("PL", "weekly",
                                        test::CIntensityTestData::hourly(
                                            MAY_DAY, 23, [](core_t::TTime) { return 1.0; }),
                                        MAY_DAY, MAY_DAY + DAY),
                        carbon::CInsufficientDataError);
}

BOOST_AUTO_TEST_CASE(testSummaryStatistics) {
    carbon::CTrendReporter reporter{1};

    auto trend = reporter.report(
        "DE", "weekly", test::CIntensityTestData::hourly(MAY_DAY, {100.0, 300.0, 100.0, 300.0}),
        MAY_DAY - DAY, MAY_DAY + DAY);

    BOOST_REQUIRE_EQUAL("DE", trend.s_Location);
    BOOST_REQUIRE_EQUAL("weekly", trend.s_Period);
    BOOST_REQUIRE_EQUAL(MAY_DAY - DAY, trend.s_Start);
    BOOST_REQUIRE_EQUAL(MAY_DAY + DAY, trend.s_End);
    BOOST_REQUIRE_CLOSE_FRACTION(200.0, trend.s_AverageIntensity, 1e-12);
    BOOST_REQUIRE_EQUAL(100.0, trend.s_MinIntensity);
    BOOST_REQUIRE_EQUAL(300.0, trend.s_MaxIntensity);
    // Population standard deviation
    BOOST_REQUIRE_CLOSE_FRACTION(100.0, trend.s_StdDeviation, 1e-12);
    BOOST_REQUIRE_EQUAL(std::size_t{3}, trend.s_CleanestHours.size());
    BOOST_TEST_REQUIRE(trend.s_Samples.empty());
}

BOOST_AUTO_TEST_CASE(testRankedHours) {
    carbon::CTrendReporter reporter{24};

    test::CIntensityTestData::TDoubleVec profile(24);
    for (std::size_t hour = 0; hour < 24; ++hour) {
        profile[hour] = 100.0 + 10.0 * static_cast<double>(hour);
    }
    auto trend = reporter.report(
        "PL", "weekly", test::CIntensityTestData::dailyProfile(MAY_DAY, 7, profile),
        MAY_DAY, MAY_DAY + 7 * DAY);

    BOOST_TEST_REQUIRE((trend.s_CleanestHours == carbon::TIntVec{0, 1, 2}));
    BOOST_REQUIRE_EQUAL(23, trend.s_DirtiestHours[0]);
    BOOST_REQUIRE_EQUAL(22, trend.s_DirtiestHours[1]);
    BOOST_REQUIRE_EQUAL(21, trend.s_DirtiestHours[2]);
}

BOOST_AUTO_TEST_CASE(testRankedHourTiesGoToLowerHour) {
    carbon::CTrendReporter reporter{1};

    test::CIntensityTestData::TDoubleVec profile(24, 200.0);
    profile[5] = 100.0;
    auto trend = reporter.report(
        "PL", "weekly", test::CIntensityTestData::dailyProfile(MAY_DAY, 2, profile),
        MAY_DAY, MAY_DAY + 2 * DAY);

    BOOST_TEST_REQUIRE((trend.s_CleanestHours == carbon::TIntVec{5, 0, 1}));
    BOOST_TEST_REQUIRE((trend.s_DirtiestHours == carbon::TIntVec{0, 1, 2}));
}

BOOST_AUTO_TEST_CASE(testTooFewHoursToRank) {
    carbon::CTrendReporter reporter{1};

    carbon::TSampleVec samples{{MAY_DAY, 100.0, 0.0},
                               {MAY_DAY + DAY, 200.0, 0.0},
                               {MAY_DAY + HOUR, 300.0, 0.0}};
    auto trend = reporter.report("PL", "weekly", samples, MAY_DAY, MAY_DAY + 2 * DAY);

    BOOST_TEST_REQUIRE(trend.s_CleanestHours.empty());
    BOOST_TEST_REQUIRE(trend.s_DirtiestHours.empty());
}

BOOST_AUTO_TEST_CASE(testWeekdayAndWeekend) {
    carbon::CTrendReporter reporter{1};

    // Wednesday to Tuesday
    auto samples = test::CIntensityTestData::hourly(MAY_DAY, 168, [](core_t::TTime time) {
        return core::CTimeUtils::isWeekend(time) ? 100.0 : 300.0;
    });
    auto trend = reporter.report("FR", "weekly", samples, MAY_DAY, MAY_DAY + 7 * DAY);

    BOOST_TEST_REQUIRE(trend.s_WeekdayAverage.has_value());
    BOOST_TEST_REQUIRE(trend.s_WeekendAverage.has_value());
    BOOST_REQUIRE_CLOSE_FRACTION(300.0, *trend.s_WeekdayAverage, 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(100.0, *trend.s_WeekendAverage, 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(40800.0 / 168.0, trend.s_AverageIntensity, 1e-12);

    // A Wednesday only has weekdays
    trend = reporter.report("FR", "daily",
                            test::CIntensityTestData::hourly(MAY_DAY, 24, [](core_t::TTime) {
                                return 250.0;
                            }),
                            MAY_DAY, MAY_DAY + DAY);
    BOOST_TEST_REQUIRE(trend.s_WeekdayAverage.has_value());
    BOOST_REQUIRE_EQUAL(false, trend.s_WeekendAverage.has_value());
}

BOOST_AUTO_TEST_CASE(testSamplesForShortDailyReports) {
    carbon::CTrendReporter reporter{1};
    auto constant = [](core_t::TTime) { return 180.0; };

    auto trend = reporter.report("IN", "daily",
                                 test::CIntensityTestData::hourly(MAY_DAY, 24, constant),
                                 MAY_DAY, MAY_DAY + DAY);
    BOOST_REQUIRE_EQUAL(std::size_t{24}, trend.s_Samples.size());
    BOOST_REQUIRE_EQUAL(MAY_DAY, trend.s_Samples[0].s_Time);

    trend = reporter.report("IN", "daily", test::CIntensityTestData::hourly(MAY_DAY, 25, constant),
                            MAY_DAY, MAY_DAY + DAY);
    BOOST_TEST_REQUIRE(trend.s_Samples.empty());

    trend = reporter.report("IN", "weekly", test::CIntensityTestData::hourly(MAY_DAY, 24, constant),
                            MAY_DAY, MAY_DAY + DAY);
    BOOST_TEST_REQUIRE(trend.s_Samples.empty());
}

BOOST_AUTO_TEST_SUITE_END()
