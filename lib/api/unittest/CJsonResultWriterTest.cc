/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <carbon/CRegionalStrategies.h>

#include <api/CJsonResultWriter.h>

#include <test/CIntensityTestData.h>

#include <boost/json.hpp>
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

namespace json = boost::json;

BOOST_AUTO_TEST_SUITE(CJsonResultWriterTest)

using namespace greenweb;

namespace {
const core_t::TTime MAY_DAY{1714521600};
const core_t::TTime HOUR{3600};

json::object parseLine(const std::string& line) {
    json::error_code ec;
    json::value jv = json::parse(line, ec);
    BOOST_TEST_REQUIRE(ec.failed() == false);
    BOOST_TEST_REQUIRE(jv.is_object());
    return jv.as_object();
}
}

BOOST_AUTO_TEST_CASE(testRelative) {
    carbon::SRelativeCarbonIntensity result;
    result.s_Current = test::CIntensityTestData::current("PL", 400.0, MAY_DAY);
    result.s_HasRelativeMetrics = true;
    result.s_LocalPercentile = 79.2;
    result.s_DailyRank = "average for this region";
    result.s_RelativeMode = carbon::E_Dirty;
    result.s_TrendDirection = carbon::E_Stable;
    result.s_TrendMagnitude = 68.4;
    result.s_NextOptimalWindow = carbon::SOptimalWindow{MAY_DAY + HOUR, MAY_DAY + 2 * HOUR,
                                                        100.0, 0.78, "Night wind patterns"};
    result.s_ConfidenceScore = 0.78;
    result.s_RegionalBaseline = 237.5;
    result.s_IsHighVariation = true;

    std::ostringstream strm;
    api::CJsonResultWriter writer{strm};
    writer.writeRelative("PL", result);
    BOOST_REQUIRE_EQUAL(std::size_t{1}, writer.numberWritten());

    LOG_DEBUG(<< "relative: " << strm.str());
    BOOST_REQUIRE_EQUAL('\n', strm.str().back());

    json::object doc{parseLine(strm.str())};
    BOOST_REQUIRE_EQUAL(std::string{"PL"}, doc.at("region").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"relative"}, doc.at("operation").as_string());

    const json::object& relative = doc.at("result").as_object();
    BOOST_REQUIRE_EQUAL(true, relative.at("has_relative_metrics").as_bool());
    BOOST_REQUIRE_EQUAL(79.2, relative.at("local_percentile").as_double());
    BOOST_REQUIRE_EQUAL(std::string{"dirty"}, relative.at("relative_mode").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"stable"}, relative.at("trend_direction").as_string());
    BOOST_REQUIRE_EQUAL(237.5, relative.at("regional_baseline").as_double());
    BOOST_REQUIRE_EQUAL(true, relative.at("is_high_variation").as_bool());

    const json::object& current = relative.at("current").as_object();
    BOOST_REQUIRE_EQUAL(400.0, current.at("carbon_intensity").as_double());
    BOOST_REQUIRE_EQUAL(std::string{"2024-05-01T00:00:00Z"}, current.at("timestamp").as_string());

    const json::object& window = relative.at("next_optimal_window").as_object();
    BOOST_REQUIRE_EQUAL(std::string{"2024-05-01T01:00:00Z"}, window.at("start").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"2024-05-01T02:00:00Z"}, window.at("end").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"Night wind patterns"}, window.at("reason").as_string());
}

BOOST_AUTO_TEST_CASE(testDegradedRelative) {
    carbon::SRelativeCarbonIntensity result;
    result.s_Current = test::CIntensityTestData::current("PL", 120.0, MAY_DAY);

    json::object doc{api::CJsonResultWriter::toJson(result)};

    // Only absolute values are reported
    BOOST_REQUIRE_EQUAL(false, doc.at("has_relative_metrics").as_bool());
    BOOST_REQUIRE_EQUAL(false, doc.contains("local_percentile"));
    BOOST_REQUIRE_EQUAL(false, doc.contains("next_optimal_window"));
    BOOST_REQUIRE_EQUAL(0.5, doc.at("confidence_score").as_double());
}

BOOST_AUTO_TEST_CASE(testGreenHoursAndTrend) {
    carbon::SGreenHoursForecast forecast;
    forecast.s_Location = "CN";
    forecast.s_GreenHours = {test::CIntensityTestData::greenHour(MAY_DAY, 90.0, 80.0)};
    forecast.s_BestWindow = forecast.s_GreenHours[0];

    carbon::SCarbonTrend trend;
    trend.s_Location = "CN";
    trend.s_Period = "daily";
    trend.s_CleanestHours = {1, 2, 3};
    trend.s_DirtiestHours = {19, 18, 20};
    trend.s_WeekdayAverage = 420.0;
    trend.s_Samples = test::CIntensityTestData::hourly(MAY_DAY, {400.0, 440.0});

    std::ostringstream strm;
    api::CJsonResultWriter writer{strm};
    writer.writeGreenHours("CN", forecast);
    writer.writeTrend("CN", trend);
    writer.writeError("XX", api::CJsonResultWriter::TRENDS, "no data");
    BOOST_REQUIRE_EQUAL(std::size_t{3}, writer.numberWritten());

    std::istringstream lines{strm.str()};
    std::string line;

    BOOST_TEST_REQUIRE(std::getline(lines, line).good());
    json::object doc{parseLine(line)};
    const json::object& green = doc.at("result").as_object();
    BOOST_REQUIRE_EQUAL(std::size_t{1}, green.at("green_hours").as_array().size());
    BOOST_REQUIRE_EQUAL(90.0, green.at("best_window").as_object().at("carbon_intensity").as_double());

    BOOST_TEST_REQUIRE(std::getline(lines, line).good());
    doc = parseLine(line);
    BOOST_REQUIRE_EQUAL(std::string{"trends"}, doc.at("operation").as_string());
    const json::object& report = doc.at("result").as_object();
    BOOST_REQUIRE_EQUAL(19, report.at("dirtiest_hours").as_array()[0].as_int64());
    BOOST_REQUIRE_EQUAL(420.0, report.at("weekday_average").as_double());
    BOOST_TEST_REQUIRE(report.at("weekend_average").is_null());
    BOOST_REQUIRE_EQUAL(std::size_t{2}, report.at("samples").as_array().size());

    BOOST_TEST_REQUIRE(std::getline(lines, line).good());
    doc = parseLine(line);
    BOOST_REQUIRE_EQUAL(std::string{"XX"}, doc.at("region").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"no data"}, doc.at("error").as_string());
    BOOST_REQUIRE_EQUAL(false, doc.contains("result"));
}

BOOST_AUTO_TEST_CASE(testStrategy) {
    json::object doc{api::CJsonResultWriter::toJson(carbon::CRegionalStrategies::strategy("ZA"))};

    BOOST_REQUIRE_EQUAL(std::string{"ZA"}, doc.at("region").as_string());
    BOOST_REQUIRE_EQUAL(std::string{"coal"}, doc.at("primary_energy_source").as_string());
    BOOST_REQUIRE_EQUAL(std::size_t{10}, doc.at("optimal_hours").as_array().size());
    BOOST_REQUIRE_EQUAL(std::size_t{5}, doc.at("recommendations").as_array().size());
}

BOOST_AUTO_TEST_SUITE_END()
