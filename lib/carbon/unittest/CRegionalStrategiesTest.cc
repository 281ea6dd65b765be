/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <carbon/CRegionalStrategies.h>

#include <boost/test/unit_test.hpp>

#include <set>

BOOST_AUTO_TEST_SUITE(CRegionalStrategiesTest)

using namespace greenweb;

BOOST_AUTO_TEST_CASE(testKnownRegions) {
    for (const auto& region : {"PL", "US-TEX", "CN", "IN", "AU-NSW", "ZA"}) {
        auto strategy = carbon::CRegionalStrategies::strategy(region);
        BOOST_REQUIRE_EQUAL(region, strategy.s_Region);
        BOOST_REQUIRE_EQUAL("high", strategy.s_VariationLevel);
        BOOST_REQUIRE_EQUAL(std::size_t{5}, strategy.s_Recommendations.size());

        // An hour is never both optimal and to be avoided
        std::set<int> optimal{strategy.s_OptimalHours.begin(), strategy.s_OptimalHours.end()};
        BOOST_REQUIRE_EQUAL(strategy.s_OptimalHours.size(), optimal.size());
        for (auto hour : strategy.s_AvoidanceHours) {
            BOOST_REQUIRE_EQUAL(std::size_t{0}, optimal.count(hour));
            BOOST_TEST_REQUIRE(hour >= 0);
            BOOST_TEST_REQUIRE(hour < 24);
        }
    }
}

BOOST_AUTO_TEST_CASE(testPoland) {
    auto strategy = carbon::CRegionalStrategies::strategy("PL");

    BOOST_REQUIRE_EQUAL("coal", strategy.s_PrimaryEnergySource);
    BOOST_TEST_REQUIRE((strategy.s_OptimalHours ==
                        carbon::TIntVec{22, 23, 0, 1, 2, 3, 4, 5, 11, 12, 13, 14}));
    BOOST_TEST_REQUIRE((strategy.s_AvoidanceHours ==
                        carbon::TIntVec{17, 18, 19, 20, 21, 7, 8, 9}));
    BOOST_REQUIRE_EQUAL("Schedule energy-intensive tasks during night hours (22:00-05:00)",
                        strategy.s_Recommendations[0]);
}

BOOST_AUTO_TEST_CASE(testDefault) {
    auto strategy = carbon::CRegionalStrategies::strategy("DE");
    BOOST_REQUIRE_EQUAL("DE", strategy.s_Region);
    BOOST_REQUIRE_EQUAL("mixed", strategy.s_PrimaryEnergySource);
    BOOST_REQUIRE_EQUAL("medium", strategy.s_VariationLevel);
    BOOST_TEST_REQUIRE((strategy.s_OptimalHours ==
                        carbon::TIntVec{22, 23, 0, 1, 2, 3, 11, 12, 13, 14}));
    BOOST_TEST_REQUIRE((strategy.s_AvoidanceHours == carbon::TIntVec{17, 18, 19, 20}));
    BOOST_REQUIRE_EQUAL(std::size_t{4}, strategy.s_Recommendations.size());

    // Only region codes have strategies of their own
    BOOST_REQUIRE_EQUAL("mixed", carbon::CRegionalStrategies::strategy("Poland").s_PrimaryEnergySource);

    // Unknown regions keep their own name
    BOOST_REQUIRE_EQUAL("Mars", carbon::CRegionalStrategies::strategy("Mars").s_Region);
}

BOOST_AUTO_TEST_SUITE_END()
