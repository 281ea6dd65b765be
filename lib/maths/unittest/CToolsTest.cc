/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <maths/CTools.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CToolsTest)

using namespace greenweb;

BOOST_AUTO_TEST_CASE(testTruncate) {
    BOOST_REQUIRE_EQUAL(0.0, maths::CTools::truncate(-0.3, 0.0, 1.0));
    BOOST_REQUIRE_EQUAL(1.0, maths::CTools::truncate(1.7, 0.0, 1.0));
    BOOST_REQUIRE_EQUAL(0.25, maths::CTools::truncate(0.25, 0.0, 1.0));
    BOOST_REQUIRE_EQUAL(5, maths::CTools::truncate(9, 1, 5));
}

BOOST_AUTO_TEST_CASE(testRound) {
    BOOST_REQUIRE_EQUAL(37.5, maths::CTools::roundToDecimalPlaces(37.5, 1));
    BOOST_REQUIRE_EQUAL(33.3, maths::CTools::roundToDecimalPlaces(100.0 / 3.0, 1));
    BOOST_REQUIRE_EQUAL(0.67, maths::CTools::roundToDecimalPlaces(2.0 / 3.0, 2));
    BOOST_REQUIRE_EQUAL(0.5, maths::CTools::roundToDecimalPlaces(0.499999, 2));
    // Half away from zero
    BOOST_REQUIRE_EQUAL(0.13, maths::CTools::roundToDecimalPlaces(0.125, 2));
    BOOST_REQUIRE_EQUAL(-2.0, maths::CTools::roundToDecimalPlaces(-1.5, 0));
    BOOST_REQUIRE_EQUAL(412.0, maths::CTools::roundToDecimalPlaces(412.4, 0));
}

BOOST_AUTO_TEST_SUITE_END()
