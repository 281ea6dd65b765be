/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CDeadline.h>

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <thread>

BOOST_TEST_DONT_PRINT_LOG_VALUE(std::chrono::steady_clock::time_point)

BOOST_AUTO_TEST_SUITE(CDeadlineTest)

using namespace greenweb;

BOOST_AUTO_TEST_CASE(testNever) {
    core::CDeadline never{core::CDeadline::never()};
    BOOST_TEST_REQUIRE(never.isNever());
    BOOST_TEST_REQUIRE(never.expired() == false);
}

BOOST_AUTO_TEST_CASE(testFromNow) {
    core::CDeadline soon{core::CDeadline::fromNow(std::chrono::milliseconds(20))};
    BOOST_TEST_REQUIRE(soon.isNever() == false);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    BOOST_TEST_REQUIRE(soon.expired());

    core::CDeadline later{core::CDeadline::fromNow(std::chrono::hours(1))};
    BOOST_TEST_REQUIRE(later.expired() == false);
    BOOST_TEST_REQUIRE(later.when() > std::chrono::steady_clock::now() + std::chrono::minutes(59));
}

BOOST_AUTO_TEST_SUITE_END()
