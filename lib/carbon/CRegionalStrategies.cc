/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CRegionalStrategies.h>

#include <map>

namespace greenweb {
namespace carbon {
namespace {
using TStrStrategyMap = std::map<std::string, SRegionalStrategy>;

const std::string HIGH_VARIATION{"high"};

const TStrStrategyMap& strategies() {
    static const TStrStrategyMap STRATEGIES{
        {"PL",
         {"PL",
          "coal",
          {22, 23, 0, 1, 2, 3, 4, 5, 11, 12, 13, 14},
          {17, 18, 19, 20, 21, 7, 8, 9},
          HIGH_VARIATION,
          {"Schedule energy-intensive tasks during night hours (22:00-05:00)",
           "Avoid peak evening hours (17:00-21:00) when coal plants ramp up",
           "Take advantage of midday solar generation (11:00-14:00)",
           "Weekend scheduling provides 15-20% better carbon efficiency",
           "Consider seasonal patterns - summer has more renewable generation"}}},
        {"US-TEX",
         {"US-TEX",
          "mixed",
          {10, 11, 12, 13, 14, 15, 23, 0, 1, 2, 3, 4},
          {16, 17, 18, 19, 20, 21, 6, 7, 8, 9},
          HIGH_VARIATION,
          {"Maximize solar window utilization (10:00-15:00)",
           "Avoid extreme peak hours (16:00-21:00) when gas peakers activate",
           "Night hours (23:00-04:00) often have good wind generation",
           "Summer cooling loads create high variation - plan accordingly",
           "West Texas wind patterns favor overnight scheduling"}}},
        {"CN",
         {"CN",
          "coal",
          {1, 2, 3, 4, 5, 11, 12, 13, 14, 15},
          {18, 19, 20, 21, 22, 7, 8, 9, 10},
          HIGH_VARIATION,
          {"Schedule during early morning hours (01:00-05:00) for lowest grid load",
           "Midday solar generation window (11:00-15:00) increasingly reliable",
           "Avoid industrial peak hours (18:00-22:00)",
           "Regional differences significant - eastern coastal areas cleaner",
           "Seasonal coal heating creates winter optimization challenges"}}},
        {"IN",
         {"IN",
          "coal",
          {2, 3, 4, 5, 11, 12, 13, 14, 15, 16},
          {18, 19, 20, 21, 22, 23, 6, 7, 8, 9},
          HIGH_VARIATION,
          {"Early morning hours (02:00-05:00) have lowest coal dependency",
           "Solar generation peak (11:00-16:00) offers best carbon efficiency",
           "Avoid evening industrial peak (18:00-23:00)",
           "Monsoon season affects renewable generation patterns",
           "Southern states typically have better renewable mix"}}},
        {"AU-NSW",
         {"AU-NSW",
          "mixed",
          {10, 11, 12, 13, 14, 15, 23, 0, 1, 2, 3},
          {17, 18, 19, 20, 21, 7, 8, 9},
          HIGH_VARIATION,
          {"Solar generation window (10:00-15:00) provides cleanest energy",
           "Night hours (23:00-03:00) benefit from lower demand",
           "Avoid evening air conditioning peak (17:00-21:00)",
           "Seasonal patterns significant - summer has high variation",
           "Coal retirement schedule improving long-term trends"}}},
        {"ZA",
         {"ZA",
          "coal",
          {11, 12, 13, 14, 15, 1, 2, 3, 4, 5},
          {17, 18, 19, 20, 21, 22, 6, 7, 8},
          HIGH_VARIATION,
          {"Midday solar generation (11:00-15:00) offers best opportunities",
           "Early morning hours (01:00-05:00) have reduced coal load",
           "Avoid evening peak (17:00-22:00) when load shedding risk highest",
           "Grid stability affects optimization - flexible scheduling essential",
           "Industrial demand patterns create predictable carbon peaks"}}}};
    return STRATEGIES;
}
}

SRegionalStrategy CRegionalStrategies::strategy(const std::string& region) {
    auto i = strategies().find(region);
    if (i != strategies().end()) {
        return i->second;
    }
    return {region,
            "mixed",
            {22, 23, 0, 1, 2, 3, 11, 12, 13, 14},
            {17, 18, 19, 20},
            "medium",
            {"Schedule during typical low-demand hours (22:00-03:00)",
             "Take advantage of midday renewable generation when available",
             "Avoid evening peak hours (17:00-20:00)",
             "Monitor local grid patterns for region-specific optimization"}};
}
}
}
