/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CCsvIntensityDataSource.h>

#include <core/CCsvLineParser.h>
#include <core/CDeadline.h>
#include <core/CLogger.h>
#include <core/CStreamUtils.h>
#include <core/CStringUtils.h>
#include <core/CTimeUtils.h>

#include <maths/CBasicStatistics.h>

#include <carbon/CGreenHourFilter.h>
#include <carbon/CIntelligenceErrors.h>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <fstream>
#include <utility>

namespace greenweb {
namespace api {
namespace {
using TStrVec = core::CCsvLineParser::TStrVec;
using TMeanAccumulator = maths::CBasicStatistics::SSampleMean<double>::TAccumulator;

const std::size_t NUMBER_HISTORY_FIELDS{3};
const std::size_t NUMBER_FORECAST_FIELDS{5};

void checkDeadline(const std::string& region, const core::CDeadline& deadline) {
    if (deadline.expired()) {
        throw carbon::CCollaboratorFetchError{region, "deadline passed before reading data"};
    }
}

//! Call \p processRow with the fields of each non-blank line of \p file.
template<typename FUNC>
void readRows(const std::string& region, const std::string& file, FUNC processRow) {
    std::ifstream strm{file};
    if (!strm.is_open()) {
        throw carbon::CCollaboratorFetchError{region, "failed to open " + file};
    }

    core::CCsvLineParser parser;
    TStrVec fields;
    std::string line;
    std::size_t lineNumber{0};
    core::CStreamUtils::skipUtf8Bom(strm);
    while (core::CStreamUtils::readLine(strm, line)) {
        ++lineNumber;
        std::string trimmed{line};
        core::CStringUtils::trimWhitespace(trimmed);
        if (trimmed.empty()) {
            continue;
        }
        if (parser.parseLine(line, fields) == false) {
            LOG_WARN(<< "Skipping unparseable line " << lineNumber << " of " << file);
            continue;
        }
        for (auto& field : fields) {
            core::CStringUtils::trimWhitespace(field);
        }
        processRow(lineNumber, fields);
    }
    if (strm.bad()) {
        throw carbon::CCollaboratorFetchError{region, "error reading " + file};
    }
}

//! A header is a first line whose first field has no digits.
bool isHeader(std::size_t lineNumber, const TStrVec& fields) {
    return lineNumber == 1 && fields.empty() == false &&
           std::none_of(fields[0].begin(), fields[0].end(),
                        [](char c) { return c >= '0' && c <= '9'; });
}
}

const std::string CCsvIntensityDataSource::HISTORY_SUFFIX{".csv"};
const std::string CCsvIntensityDataSource::FORECAST_SUFFIX{"_forecast.csv"};
const std::string CCsvIntensityDataSource::SOURCE_NAME{"csv"};

CCsvIntensityDataSource::CCsvIntensityDataSource(std::string dataDir)
    : m_DataDir{std::move(dataDir)} {
}

carbon::TSampleVec CCsvIntensityDataSource::historicalSamples(const std::string& region,
                                                              core_t::TTime start,
                                                              core_t::TTime end,
                                                              const core::CDeadline& deadline) {
    carbon::TSampleVec samples{this->readHistory(region, deadline)};
    samples.erase(std::remove_if(samples.begin(), samples.end(),
                                 [start, end](const carbon::SHistoricalSample& sample) {
                                     return sample.s_Time < start || sample.s_Time > end;
                                 }),
                  samples.end());
    LOG_DEBUG(<< "Read " << samples.size() << " samples for " << region << " between "
              << core::CTimeUtils::toIso8601(start) << " and "
              << core::CTimeUtils::toIso8601(end));
    return samples;
}

carbon::SCurrentIntensity
CCsvIntensityDataSource::currentIntensity(const std::string& region,
                                          const core::CDeadline& deadline) {
    carbon::TSampleVec samples{this->readHistory(region, deadline)};
    if (samples.empty()) {
        throw carbon::CCollaboratorFetchError{
            region, "no readings in " + this->fileName(region, HISTORY_SUFFIX)};
    }

    const carbon::SHistoricalSample& latest{samples.back()};
    carbon::SCurrentIntensity result;
    result.s_Location = region;
    result.s_CarbonIntensity = latest.s_CarbonIntensity;
    result.s_RenewablePercent = latest.s_RenewablePercent;
    result.s_Mode = carbon::SCurrentIntensity::absoluteMode(latest.s_CarbonIntensity);
    result.s_Recommendation = carbon::SCurrentIntensity::recommendation(latest.s_CarbonIntensity);
    result.s_Time = latest.s_Time;
    result.s_Source = SOURCE_NAME;
    return result;
}

carbon::SGreenHoursForecast
CCsvIntensityDataSource::greenHoursForecast(const std::string& region,
                                            int hours,
                                            const core::CDeadline& deadline) {
    TGreenHourVec windows{this->readForecast(region, deadline)};

    carbon::SGreenHoursForecast result;
    result.s_Location = region;
    result.s_GeneratedAt = core::CTimeUtils::now();
    result.s_Source = SOURCE_NAME;
    if (windows.empty() || hours <= 0) {
        return result;
    }

    result.s_PeriodStart = windows.front().s_Start;
    result.s_PeriodEnd = result.s_PeriodStart +
                         static_cast<core_t::TTime>(hours) * core::CTimeUtils::SECONDS_IN_HOUR;

    TMeanAccumulator intensity;
    TMeanAccumulator confidence;
    for (const auto& window : windows) {
        if (window.s_Start >= result.s_PeriodEnd) {
            break;
        }
        intensity.add(window.s_CarbonIntensity);
        confidence.add(window.s_Confidence);
        result.s_GreenHours.push_back(window);
    }

    result.s_BestWindow = carbon::CGreenHourFilter::bestWindow(result.s_GreenHours);
    result.s_AverageIntensity = maths::CBasicStatistics::mean(intensity);
    result.s_Confidence = maths::CBasicStatistics::mean(confidence);
    return result;
}

carbon::TSampleVec CCsvIntensityDataSource::readHistory(const std::string& region,
                                                        const core::CDeadline& deadline) const {
    checkDeadline(region, deadline);

    std::string file{this->fileName(region, HISTORY_SUFFIX)};
    carbon::TSampleVec samples;
    readRows(region, file, [&](std::size_t lineNumber, const TStrVec& fields) {
        if (isHeader(lineNumber, fields)) {
            return;
        }
        carbon::SHistoricalSample sample;
        if (fields.size() != NUMBER_HISTORY_FIELDS ||
            core::CTimeUtils::fromIso8601(fields[0], sample.s_Time) == false ||
            core::CStringUtils::stringToTypeSilent(fields[1], sample.s_CarbonIntensity) == false ||
            core::CStringUtils::stringToTypeSilent(fields[2], sample.s_RenewablePercent) == false) {
            LOG_WARN(<< "Skipping malformed line " << lineNumber << " of " << file);
            return;
        }
        samples.push_back(sample);
    });

    std::stable_sort(samples.begin(), samples.end(),
                     [](const carbon::SHistoricalSample& lhs, const carbon::SHistoricalSample& rhs) {
                         return lhs.s_Time < rhs.s_Time;
                     });
    return samples;
}

CCsvIntensityDataSource::TGreenHourVec
CCsvIntensityDataSource::readForecast(const std::string& region,
                                      const core::CDeadline& deadline) const {
    checkDeadline(region, deadline);

    std::string file{this->fileName(region, FORECAST_SUFFIX)};
    TGreenHourVec windows;
    readRows(region, file, [&](std::size_t lineNumber, const TStrVec& fields) {
        if (isHeader(lineNumber, fields)) {
            return;
        }
        carbon::SGreenHour window;
        if (fields.size() != NUMBER_FORECAST_FIELDS ||
            core::CTimeUtils::fromIso8601(fields[0], window.s_Start) == false ||
            core::CTimeUtils::fromIso8601(fields[1], window.s_End) == false ||
            core::CStringUtils::stringToTypeSilent(fields[2], window.s_CarbonIntensity) == false ||
            core::CStringUtils::stringToTypeSilent(fields[3], window.s_RenewablePercent) == false ||
            core::CStringUtils::stringToTypeSilent(fields[4], window.s_Confidence) == false) {
            LOG_WARN(<< "Skipping malformed line " << lineNumber << " of " << file);
            return;
        }
        if (window.s_End <= window.s_Start) {
            LOG_WARN(<< "Skipping empty window on line " << lineNumber << " of " << file);
            return;
        }
        windows.push_back(window);
    });

    std::stable_sort(windows.begin(), windows.end(),
                     [](const carbon::SGreenHour& lhs, const carbon::SGreenHour& rhs) {
                         return lhs.s_Start < rhs.s_Start;
                     });
    return windows;
}

std::string CCsvIntensityDataSource::fileName(const std::string& region,
                                              const std::string& suffix) const {
    boost::filesystem::path path{m_DataDir};
    path /= region + suffix;
    return path.string();
}
}
}
