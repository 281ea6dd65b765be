/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <carbon/CGreenHourFilter.h>

#include <test/CIntensityTestData.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_AUTO_TEST_SUITE(CGreenHourFilterTest)

using namespace greenweb;

namespace {
const core_t::TTime MAY_DAY{1714521600};
const core_t::TTime HOUR{3600};

carbon::CRegionPattern makePattern(double mean, double sd, double p20) {
    carbon::CRegionPattern::THourlyArray hourly;
    hourly.fill(mean);
    return carbon::CRegionPattern{
        "US-TEX",
        MAY_DAY,
        test::CIntensityTestData::hourly(MAY_DAY, 24, [mean](core_t::TTime) { return mean; }),
        mean,
        sd,
        p20,
        mean + sd,
        hourly,
        carbon::E_Stable,
        0.0};
}

carbon::TGreenHourVec forecast() {
    return {test::CIntensityTestData::greenHour(MAY_DAY, 150.0, 90.0),
            test::CIntensityTestData::greenHour(MAY_DAY + HOUR, 200.0, 85.0),
            test::CIntensityTestData::greenHour(MAY_DAY + 2 * HOUR, 250.0, 90.0),
            test::CIntensityTestData::greenHour(MAY_DAY + 3 * HOUR, 320.0, 95.0)};
}
}

BOOST_AUTO_TEST_CASE(testSteadyRegionKeepsOnlyCleanestHours) {
    auto pattern = makePattern(300.0, 40.0, 200.0);

    auto green = carbon::CGreenHourFilter::filter(forecast(), pattern);
    BOOST_REQUIRE_EQUAL(std::size_t{2}, green.size());
    BOOST_REQUIRE_EQUAL(150.0, green[0].s_CarbonIntensity);
    BOOST_REQUIRE_EQUAL(90.0, green[0].s_Confidence);
    // At P20 counts as green
    BOOST_REQUIRE_EQUAL(200.0, green[1].s_CarbonIntensity);
    BOOST_REQUIRE_EQUAL(85.0, green[1].s_Confidence);
}

BOOST_AUTO_TEST_CASE(testVariableRegionKeepsBelowMeanWithLessConfidence) {
    auto pattern = makePattern(300.0, 80.0, 200.0);

    auto green = carbon::CGreenHourFilter::filter(forecast(), pattern);
    BOOST_REQUIRE_EQUAL(std::size_t{3}, green.size());
    BOOST_REQUIRE_EQUAL(90.0, green[0].s_Confidence);
    BOOST_REQUIRE_EQUAL(85.0, green[1].s_Confidence);
    BOOST_REQUIRE_EQUAL(250.0, green[2].s_CarbonIntensity);
    BOOST_REQUIRE_CLOSE_FRACTION(72.0, green[2].s_Confidence, 1e-12);
    BOOST_REQUIRE_EQUAL(MAY_DAY + 2 * HOUR, green[2].s_Start);

    // Exactly the threshold isn't high variation
    BOOST_REQUIRE_EQUAL(std::size_t{2},
                        carbon::CGreenHourFilter::filter(forecast(), makePattern(300.0, 50.0, 200.0))
                            .size());
}

BOOST_AUTO_TEST_CASE(testNothingGreen) {
    auto pattern = makePattern(300.0, 10.0, 100.0);
    BOOST_TEST_REQUIRE(carbon::CGreenHourFilter::filter(forecast(), pattern).empty());
    BOOST_TEST_REQUIRE(carbon::CGreenHourFilter::filter({}, pattern).empty());
}

BOOST_AUTO_TEST_CASE(testBestWindow) {
    carbon::TGreenHourVec hours{test::CIntensityTestData::greenHour(MAY_DAY, 180.0, 90.0),
                                test::CIntensityTestData::greenHour(MAY_DAY + HOUR, 150.0, 80.0),
                                test::CIntensityTestData::greenHour(MAY_DAY + 2 * HOUR, 150.0, 70.0)};

    const auto& best = carbon::CGreenHourFilter::bestWindow(hours);
    BOOST_REQUIRE_EQUAL(MAY_DAY + HOUR, best.s_Start);
    BOOST_REQUIRE_EQUAL(80.0, best.s_Confidence);

    BOOST_REQUIRE_THROW(carbon::CGreenHourFilter::bestWindow({}), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
