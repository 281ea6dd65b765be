/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <carbon/CTrendAnalyzer.h>

#include <test/CIntensityTestData.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CTrendAnalyzerTest)

using namespace greenweb;

namespace {
const core_t::TTime MAY_DAY{1714521600};
}

BOOST_AUTO_TEST_CASE(testFallingIntensityIsImproving) {
    carbon::CTrendAnalyzer analyzer{10};

    carbon::TSampleVec samples{test::CIntensityTestData::hourly(
        MAY_DAY, 200, [](core_t::TTime time) {
            return 500.0 - static_cast<double>(time - MAY_DAY) / 3600.0;
        })};

    BOOST_REQUIRE_CLOSE_FRACTION(-1.0, carbon::CTrendAnalyzer::slope(samples), 1e-9);
    BOOST_REQUIRE_EQUAL(carbon::E_Improving, analyzer.direction(samples));
}

BOOST_AUTO_TEST_CASE(testRisingIntensityIsWorsening) {
    carbon::CTrendAnalyzer analyzer{10};

    carbon::TSampleVec samples{
        test::CIntensityTestData::hourly(MAY_DAY, {100.0, 120.0, 140.0, 160.0})};

    BOOST_REQUIRE_CLOSE_FRACTION(20.0, carbon::CTrendAnalyzer::slope(samples), 1e-9);
    BOOST_REQUIRE_EQUAL(carbon::E_Worsening, analyzer.direction(samples));
}

BOOST_AUTO_TEST_CASE(testStable) {
    carbon::CTrendAnalyzer analyzer{10};

    BOOST_REQUIRE_EQUAL(carbon::E_Stable, analyzer.direction({}));
    BOOST_REQUIRE_EQUAL(carbon::E_Stable,
                        analyzer.direction(test::CIntensityTestData::hourly(MAY_DAY, {900.0})));
    BOOST_REQUIRE_EQUAL(carbon::E_Stable,
                        analyzer.direction(test::CIntensityTestData::hourly(
                            MAY_DAY, {250.0, 250.0, 250.0})));

    // A slope of 0.05 per sample is inside the threshold
    carbon::TSampleVec samples{test::CIntensityTestData::hourly(
        MAY_DAY, 50, [](core_t::TTime time) {
            return 200.0 + 0.05 * static_cast<double>(time - MAY_DAY) / 3600.0;
        })};
    BOOST_REQUIRE_EQUAL(carbon::E_Stable, analyzer.direction(samples));
}

BOOST_AUTO_TEST_CASE(testSlopeIgnoresTimestamps) {
    carbon::CTrendAnalyzer analyzer{2};

    // Irregular spacing, the slope is still per sample
    carbon::TSampleVec samples{{MAY_DAY, 100.0, 0.0},
                               {MAY_DAY + 60, 110.0, 0.0},
                               {MAY_DAY + 86400, 120.0, 0.0}};
    BOOST_REQUIRE_CLOSE_FRACTION(10.0, carbon::CTrendAnalyzer::slope(samples), 1e-9);
}

BOOST_AUTO_TEST_CASE(testConfidence) {
    carbon::CTrendAnalyzer analyzer{10};

    auto samples = [](std::size_t n) {
        return test::CIntensityTestData::hourly(MAY_DAY, n, [](core_t::TTime) {
            return 100.0;
        });
    };

    BOOST_REQUIRE_EQUAL(0.0, analyzer.confidence(samples(9)));
    BOOST_REQUIRE_CLOSE_FRACTION(0.2, analyzer.confidence(samples(10)), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(0.4, analyzer.confidence(samples(20)), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(0.8, analyzer.confidence(samples(40)), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(0.8, analyzer.confidence(samples(400)), 1e-12);

    carbon::CTrendAnalyzer noMinimum{0};
    BOOST_REQUIRE_CLOSE_FRACTION(0.8, noMinimum.confidence(samples(1)), 1e-12);
}

BOOST_AUTO_TEST_SUITE_END()
