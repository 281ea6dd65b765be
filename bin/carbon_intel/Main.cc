/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Report on the carbon intensity of electricity grid regions
//!
//! DESCRIPTION:\n
//! Reads historical, current and forecast carbon intensity from CSV files,
//! learns each requested region's daily pattern and writes one JSON result
//! per region to STDOUT or a file.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.  A region which fails is reported as an error
//! document and the program carries on with the next one.
//!
#include <core/CDeadline.h>
#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CoreTypes.h>

#include <ver/CBuildInfo.h>

#include <carbon/CIntelligenceConfig.h>
#include <carbon/CIntelligenceService.h>

#include <api/CCsvIntensityDataSource.h>
#include <api/CJsonResultWriter.h>

#include "CCmdLineParser.h"

#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include <stdlib.h>

int main(int argc, char** argv) {
    using TStrVec = greenweb::carbon_intel::CCmdLineParser::TStrVec;
    using TJsonResultWriter = greenweb::api::CJsonResultWriter;

    // Read command line options
    std::string configFile;
    std::string logProperties;
    std::string dataDir{"."};
    TStrVec regions;
    std::string operation{TJsonResultWriter::RELATIVE};
    std::string period{"daily"};
    int days{7};
    int hours{24};
    greenweb::core_t::TTime timeout{30};
    std::string outputFileName;
    if (greenweb::carbon_intel::CCmdLineParser::parse(argc, argv, configFile, logProperties,
                                                      dataDir, regions, operation, period, days,
                                                      hours, timeout, outputFileName) == false) {
        return EXIT_FAILURE;
    }

    if (logProperties.empty() == false &&
        greenweb::core::CLogger::instance().reconfigureFromFile(logProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    // Log the program version immediately after reconfiguring the logger
    LOG_DEBUG(<< greenweb::ver::CBuildInfo::fullInfo());

    greenweb::carbon::CIntelligenceConfig config;
    if (configFile.empty() == false && config.init(configFile) == false) {
        LOG_FATAL(<< "Config file '" << configFile << "' could not be loaded");
        return EXIT_FAILURE;
    }

    std::ofstream outputFile;
    if (outputFileName.empty() == false) {
        outputFile.open(outputFileName);
        if (!outputFile.is_open()) {
            LOG_FATAL(<< "Could not open output file '" << outputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::ostream& output = outputFileName.empty() ? std::cout : outputFile;

    greenweb::api::CCsvIntensityDataSource source{dataDir};
    greenweb::carbon::CIntelligenceService service{source, config};
    TJsonResultWriter writer{output};

    std::size_t failures{0};
    for (const auto& region : regions) {
        auto deadline = greenweb::core::CDeadline::fromNow(std::chrono::seconds(timeout));
        try {
            if (operation == TJsonResultWriter::RELATIVE) {
                writer.writeRelative(region, service.relativeCarbonIntensity(region, deadline));
            } else if (operation == TJsonResultWriter::GREEN_HOURS) {
                writer.writeGreenHours(region, service.dynamicGreenHours(region, hours, deadline));
            } else if (operation == TJsonResultWriter::TRENDS) {
                writer.writeTrend(region, service.carbonTrends(region, period, days, deadline));
            } else if (operation == TJsonResultWriter::STRATEGY) {
                writer.writeStrategy(region, service.regionalStrategy(region));
            } else {
                writer.writePattern(region, *service.updatePattern(region, deadline));
            }
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to get " << operation << " for " << region << ": " << e.what());
            writer.writeError(region, operation, e.what());
            ++failures;
        }
    }

    // Print out the runtime counters generated during this execution context
    LOG_DEBUG(<< greenweb::core::CProgramCounters::instance());

    LOG_DEBUG(<< "carbon_intel wrote " << writer.numberWritten()
              << " result(s) and is exiting with " << failures << " failed region(s)");

    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
