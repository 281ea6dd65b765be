/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CTimeUtils.h>

#include <carbon/CIntelligenceErrors.h>
#include <carbon/CPatternCalculator.h>

#include <test/CIntensityTestData.h>

#include <boost/test/unit_test.hpp>

#include <cmath>

BOOST_AUTO_TEST_SUITE(CPatternCalculatorTest)

using namespace greenweb;

namespace {
const core_t::TTime MAY_DAY{1714521600};
const core_t::TTime HOUR{3600};

//! Clean nights, a dirty evening peak and average otherwise.
test::CIntensityTestData::TDoubleVec nightEveningProfile() {
    test::CIntensityTestData::TDoubleVec profile(24, 250.0);
    for (std::size_t hour = 0; hour <= 6; ++hour) {
        profile[hour] = 100.0;
    }
    for (std::size_t hour = 17; hour <= 21; ++hour) {
        profile[hour] = 400.0;
    }
    return profile;
}
}

BOOST_AUTO_TEST_CASE(testInsufficientData) {
    carbon::CPatternCalculator calculator{168};
    carbon::TSampleVec samples{test::CIntensityTestData::hourly(
        MAY_DAY, 167, [](core_t::TTime) { return 200.0; })};

    try {
        calculator.compute("PL", samples, MAY_DAY + 168 * HOUR);
        BOOST_FAIL("Expected insufficient data");
    } catch (const carbon::CInsufficientDataError& e) {
        BOOST_REQUIRE_EQUAL(std::size_t{167}, e.actual());
        BOOST_REQUIRE_EQUAL(std::size_t{168}, e.required());
        BOOST_REQUIRE_EQUAL("PL", e.region());
    }

    samples.push_back({MAY_DAY + 167 * HOUR, 200.0, 50.0});
    BOOST_TEST_REQUIRE(calculator.compute("PL", samples, MAY_DAY + 168 * HOUR) != nullptr);
}

BOOST_AUTO_TEST_CASE(testMomentsAndPercentiles) {
    carbon::CPatternCalculator calculator{1};
    carbon::TSampleVec samples{test::CIntensityTestData::hourly(
        MAY_DAY, {7.0, 3.0, 10.0, 1.0, 5.0, 9.0, 2.0, 8.0, 4.0, 6.0})};

    auto pattern = calculator.compute("DE", samples, MAY_DAY + 10 * HOUR);

    BOOST_REQUIRE_EQUAL("DE", pattern->region());
    BOOST_REQUIRE_EQUAL(MAY_DAY + 10 * HOUR, pattern->lastUpdated());
    BOOST_REQUIRE_EQUAL(std::size_t{10}, pattern->numberSamples());
    BOOST_REQUIRE_CLOSE_FRACTION(5.5, pattern->mean(), 1e-12);
    // Population, not sample, standard deviation
    BOOST_REQUIRE_CLOSE_FRACTION(std::sqrt(8.25), pattern->stdDeviation(), 1e-12);
    // sorted[floor(10 * 20 / 100)] and sorted[floor(10 * 80 / 100)]
    BOOST_REQUIRE_EQUAL(3.0, pattern->percentile20());
    BOOST_REQUIRE_EQUAL(9.0, pattern->percentile80());

    // The samples keep their order
    BOOST_REQUIRE_EQUAL(7.0, pattern->samples()[0].s_CarbonIntensity);
    BOOST_REQUIRE_EQUAL(1.0, pattern->sortedIntensities()[0]);
    BOOST_REQUIRE_EQUAL(10.0, pattern->sortedIntensities()[9]);
}

BOOST_AUTO_TEST_CASE(testPercentilesDoNotInterpolate) {
    carbon::CPatternCalculator calculator{1};

    // Index floor(5 * 80 / 100) = 4 picks the single outlier
    auto pattern = calculator.compute(
        "CN", test::CIntensityTestData::hourly(MAY_DAY, {100.0, 100.0, 100.0, 100.0, 500.0}),
        MAY_DAY);
    BOOST_REQUIRE_EQUAL(100.0, pattern->percentile20());
    BOOST_REQUIRE_EQUAL(500.0, pattern->percentile80());

    // Index floor(3 * 20 / 100) = 0 and floor(3 * 80 / 100) = 2
    pattern = calculator.compute(
        "CN", test::CIntensityTestData::hourly(MAY_DAY, {300.0, 100.0, 200.0}), MAY_DAY);
    BOOST_REQUIRE_EQUAL(100.0, pattern->percentile20());
    BOOST_REQUIRE_EQUAL(300.0, pattern->percentile80());

    // A single sample is every percentile
    pattern = calculator.compute("CN", test::CIntensityTestData::hourly(MAY_DAY, {42.0}), MAY_DAY);
    BOOST_REQUIRE_EQUAL(42.0, pattern->percentile20());
    BOOST_REQUIRE_EQUAL(42.0, pattern->percentile80());
}

BOOST_AUTO_TEST_CASE(testHourlyAverages) {
    carbon::CPatternCalculator calculator{1};

    // Six samples in hours 0 to 5, the rest of the day defaults to the mean
    auto pattern = calculator.compute(
        "FR",
        test::CIntensityTestData::hourly(MAY_DAY, {100.0, 200.0, 300.0, 400.0, 500.0, 600.0}),
        MAY_DAY);
    BOOST_REQUIRE_EQUAL(std::size_t{24}, pattern->hourlyAverages().size());
    for (std::size_t hour = 0; hour < 6; ++hour) {
        BOOST_REQUIRE_EQUAL(100.0 * static_cast<double>(hour + 1), pattern->hourlyAverage(hour));
    }
    for (std::size_t hour = 6; hour < 24; ++hour) {
        BOOST_REQUIRE_EQUAL(350.0, pattern->hourlyAverage(hour));
    }

    // Samples from several days are averaged by UTC hour
    carbon::TSampleVec samples;
    for (core_t::TTime day = 0; day < 3; ++day) {
        samples.push_back({MAY_DAY + day * 86400 + 13 * HOUR,
                           100.0 + 100.0 * static_cast<double>(day), 50.0});
    }
    pattern = calculator.compute("FR", samples, MAY_DAY + 3 * 86400);
    BOOST_REQUIRE_EQUAL(200.0, pattern->hourlyAverage(13));
    BOOST_REQUIRE_EQUAL(200.0, pattern->hourlyAverage(0));
    BOOST_TEST_REQUIRE(pattern->hasHourlyData());
}

BOOST_AUTO_TEST_CASE(testNoSamples) {
    carbon::CPatternCalculator calculator{0};

    auto pattern = calculator.compute("XX", {}, MAY_DAY);
    BOOST_REQUIRE_EQUAL(std::size_t{0}, pattern->numberSamples());
    BOOST_REQUIRE_EQUAL(false, pattern->hasHourlyData());
    BOOST_REQUIRE_EQUAL(0.0, pattern->mean());
    BOOST_REQUIRE_EQUAL(carbon::E_Stable, pattern->trendDirection());
}

BOOST_AUTO_TEST_CASE(testDailyCycle) {
    carbon::CPatternCalculator calculator{168};

    // A week of a repeating daily cycle starting at 18:00
    carbon::TSampleVec samples{test::CIntensityTestData::dailyProfile(
        MAY_DAY + 18 * HOUR, 7, nightEveningProfile())};
    BOOST_REQUIRE_EQUAL(std::size_t{168}, samples.size());

    auto pattern = calculator.compute("PL", samples, MAY_DAY + 8 * 86400);

    BOOST_REQUIRE_EQUAL(100.0, pattern->percentile20());
    BOOST_REQUIRE_EQUAL(400.0, pattern->percentile80());
    BOOST_REQUIRE_CLOSE_FRACTION(237.5, pattern->mean(), 1e-12);
    BOOST_REQUIRE_EQUAL(carbon::E_Stable, pattern->trendDirection());
    BOOST_REQUIRE_CLOSE_FRACTION(0.2, pattern->trendConfidence(), 1e-12);
    for (std::size_t hour = 0; hour <= 6; ++hour) {
        BOOST_REQUIRE_EQUAL(100.0, pattern->hourlyAverage(hour));
    }
    BOOST_REQUIRE_CLOSE_FRACTION(400.0, pattern->hourlyAverage(19), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(250.0, pattern->hourlyAverage(12), 1e-12);
}

BOOST_AUTO_TEST_CASE(testDeterminism) {
    carbon::CPatternCalculator calculator{24};
    carbon::TSampleVec samples{test::CIntensityTestData::hourly(
        MAY_DAY, 100, [](core_t::TTime time) {
            return 200.0 + 80.0 * std::sin(static_cast<double>(time) / 7000.0);
        })};

    auto first = calculator.compute("IN", samples, MAY_DAY + 100 * HOUR);
    auto second = calculator.compute("IN", samples, MAY_DAY + 200 * HOUR);

    BOOST_TEST_REQUIRE(first != second);
    BOOST_REQUIRE_EQUAL(first->mean(), second->mean());
    BOOST_REQUIRE_EQUAL(first->stdDeviation(), second->stdDeviation());
    BOOST_REQUIRE_EQUAL(first->percentile20(), second->percentile20());
    BOOST_REQUIRE_EQUAL(first->percentile80(), second->percentile80());
    BOOST_TEST_REQUIRE((first->hourlyAverages() == second->hourlyAverages()));
    BOOST_REQUIRE_EQUAL(first->trendDirection(), second->trendDirection());
    BOOST_REQUIRE_EQUAL(first->trendConfidence(), second->trendConfidence());
    BOOST_TEST_REQUIRE((first->sortedIntensities() == second->sortedIntensities()));
    BOOST_TEST_REQUIRE(first->lastUpdated() != second->lastUpdated());
}

BOOST_AUTO_TEST_SUITE_END()
