/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CJsonResultWriter.h>

#include <core/CLogger.h>
#include <core/CTimeUtils.h>

#include <ostream>
#include <utility>

namespace json = boost::json;

namespace greenweb {
namespace api {
namespace {
json::string isoTime(core_t::TTime t) {
    return json::string{core::CTimeUtils::toIso8601(t)};
}

template<typename CONTAINER>
json::array toArray(const CONTAINER& values) {
    json::array result;
    result.reserve(values.size());
    for (const auto& value : values) {
        result.emplace_back(value);
    }
    return result;
}

json::value optional(const std::optional<double>& value) {
    return value ? json::value(*value) : json::value(nullptr);
}
}

const std::string CJsonResultWriter::REGION{"region"};
const std::string CJsonResultWriter::OPERATION{"operation"};
const std::string CJsonResultWriter::RESULT{"result"};
const std::string CJsonResultWriter::ERROR_MEMBER{"error"};

const std::string CJsonResultWriter::RELATIVE{"relative"};
const std::string CJsonResultWriter::GREEN_HOURS{"greenhours"};
const std::string CJsonResultWriter::TRENDS{"trends"};
const std::string CJsonResultWriter::STRATEGY{"strategy"};
const std::string CJsonResultWriter::PATTERN{"pattern"};

CJsonResultWriter::CJsonResultWriter(std::ostream& strm) : m_Strm{strm} {
}

void CJsonResultWriter::writeRelative(const std::string& region,
                                      const carbon::SRelativeCarbonIntensity& result) {
    this->write(region, RELATIVE, RESULT, toJson(result));
}

void CJsonResultWriter::writeGreenHours(const std::string& region,
                                        const carbon::SGreenHoursForecast& result) {
    this->write(region, GREEN_HOURS, RESULT, toJson(result));
}

void CJsonResultWriter::writeTrend(const std::string& region, const carbon::SCarbonTrend& result) {
    this->write(region, TRENDS, RESULT, toJson(result));
}

void CJsonResultWriter::writeStrategy(const std::string& region,
                                      const carbon::SRegionalStrategy& result) {
    this->write(region, STRATEGY, RESULT, toJson(result));
}

void CJsonResultWriter::writePattern(const std::string& region,
                                     const carbon::CRegionPattern& result) {
    this->write(region, PATTERN, RESULT, toJson(result));
}

void CJsonResultWriter::writeError(const std::string& region,
                                   const std::string& operation,
                                   const std::string& error) {
    this->write(region, operation, ERROR_MEMBER, json::string{error});
}

std::size_t CJsonResultWriter::numberWritten() const {
    std::lock_guard<std::mutex> lock{m_Mutex};
    return m_NumberWritten;
}

json::object CJsonResultWriter::toJson(const carbon::SCurrentIntensity& current) {
    json::object result;
    result["location"] = current.s_Location;
    result["carbon_intensity"] = current.s_CarbonIntensity;
    result["renewable_percentage"] = current.s_RenewablePercent;
    result["mode"] = current.s_Mode;
    result["recommendation"] = current.s_Recommendation;
    result["timestamp"] = isoTime(current.s_Time);
    result["source"] = current.s_Source;
    return result;
}

json::object CJsonResultWriter::toJson(const carbon::SRelativeCarbonIntensity& result) {
    json::object doc;
    doc["current"] = toJson(result.s_Current);
    doc["has_relative_metrics"] = result.s_HasRelativeMetrics;
    if (result.s_HasRelativeMetrics) {
        doc["local_percentile"] = result.s_LocalPercentile;
        doc["daily_rank"] = result.s_DailyRank;
        doc["relative_mode"] = carbon::print(result.s_RelativeMode);
        doc["trend_direction"] = carbon::print(result.s_TrendDirection);
        doc["trend_magnitude"] = result.s_TrendMagnitude;
        doc["regional_baseline"] = result.s_RegionalBaseline;
        if (result.s_NextOptimalWindow) {
            const auto& window = *result.s_NextOptimalWindow;
            json::object next;
            next["start"] = isoTime(window.s_Start);
            next["end"] = isoTime(window.s_End);
            next["expected_intensity"] = window.s_ExpectedIntensity;
            next["confidence"] = window.s_Confidence;
            next["reason"] = window.s_Reason;
            doc["next_optimal_window"] = std::move(next);
        } else {
            doc["next_optimal_window"] = nullptr;
        }
    }
    doc["confidence_score"] = result.s_ConfidenceScore;
    doc["is_high_variation"] = result.s_IsHighVariation;
    return doc;
}

json::object CJsonResultWriter::toJson(const carbon::SGreenHour& window) {
    json::object result;
    result["start"] = isoTime(window.s_Start);
    result["end"] = isoTime(window.s_End);
    result["carbon_intensity"] = window.s_CarbonIntensity;
    result["renewable_percentage"] = window.s_RenewablePercent;
    result["confidence"] = window.s_Confidence;
    return result;
}

json::object CJsonResultWriter::toJson(const carbon::SGreenHoursForecast& result) {
    json::array hours;
    hours.reserve(result.s_GreenHours.size());
    for (const auto& window : result.s_GreenHours) {
        hours.emplace_back(toJson(window));
    }

    json::object doc;
    doc["location"] = result.s_Location;
    doc["green_hours"] = std::move(hours);
    if (result.s_GreenHours.empty()) {
        doc["best_window"] = nullptr;
    } else {
        doc["best_window"] = toJson(result.s_BestWindow);
    }
    doc["period_start"] = isoTime(result.s_PeriodStart);
    doc["period_end"] = isoTime(result.s_PeriodEnd);
    doc["generated_at"] = isoTime(result.s_GeneratedAt);
    doc["source"] = result.s_Source;
    doc["confidence"] = result.s_Confidence;
    doc["average_intensity"] = result.s_AverageIntensity;
    return doc;
}

json::object CJsonResultWriter::toJson(const carbon::SCarbonTrend& result) {
    json::array samples;
    samples.reserve(result.s_Samples.size());
    for (const auto& sample : result.s_Samples) {
        samples.emplace_back(json::object{{"timestamp", isoTime(sample.s_Time)},
                                          {"carbon_intensity", sample.s_CarbonIntensity},
                                          {"renewable_percentage", sample.s_RenewablePercent}});
    }

    json::object doc;
    doc["location"] = result.s_Location;
    doc["period"] = result.s_Period;
    doc["start"] = isoTime(result.s_Start);
    doc["end"] = isoTime(result.s_End);
    doc["average_intensity"] = result.s_AverageIntensity;
    doc["min_intensity"] = result.s_MinIntensity;
    doc["max_intensity"] = result.s_MaxIntensity;
    doc["std_deviation"] = result.s_StdDeviation;
    doc["cleanest_hours"] = toArray(result.s_CleanestHours);
    doc["dirtiest_hours"] = toArray(result.s_DirtiestHours);
    doc["weekday_average"] = optional(result.s_WeekdayAverage);
    doc["weekend_average"] = optional(result.s_WeekendAverage);
    doc["samples"] = std::move(samples);
    return doc;
}

json::object CJsonResultWriter::toJson(const carbon::SRegionalStrategy& result) {
    json::object doc;
    doc["region"] = result.s_Region;
    doc["primary_energy_source"] = result.s_PrimaryEnergySource;
    doc["optimal_hours"] = toArray(result.s_OptimalHours);
    doc["avoidance_hours"] = toArray(result.s_AvoidanceHours);
    doc["variation_level"] = result.s_VariationLevel;
    doc["recommendations"] = toArray(result.s_Recommendations);
    return doc;
}

json::object CJsonResultWriter::toJson(const carbon::CRegionPattern& result) {
    json::object doc;
    doc["region"] = result.region();
    doc["last_updated"] = isoTime(result.lastUpdated());
    doc["number_samples"] = result.numberSamples();
    doc["mean"] = result.mean();
    doc["std_deviation"] = result.stdDeviation();
    doc["percentile_20"] = result.percentile20();
    doc["percentile_80"] = result.percentile80();
    doc["hourly_averages"] = toArray(result.hourlyAverages());
    doc["trend_direction"] = carbon::print(result.trendDirection());
    doc["trend_confidence"] = result.trendConfidence();
    return doc;
}

void CJsonResultWriter::write(const std::string& region,
                              const std::string& operation,
                              const std::string& member,
                              json::value value) {
    json::object doc;
    doc[REGION] = region;
    doc[OPERATION] = operation;
    doc[member] = std::move(value);

    std::string line{json::serialize(doc)};
    std::lock_guard<std::mutex> lock{m_Mutex};
    m_Strm << line << '\n';
    m_Strm.flush();
    if (!m_Strm) {
        LOG_ERROR(<< "Failed to write " << operation << " result for " << region);
        return;
    }
    ++m_NumberWritten;
}
}
}
