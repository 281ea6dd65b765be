/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <core/CStringUtils.h>

#include <ver/CBuildInfo.h>

#include <boost/program_options.hpp>

#include <algorithm>
#include <iostream>

namespace greenweb {
namespace carbon_intel {

const std::string CCmdLineParser::DESCRIPTION = "Usage: carbon_intel [options]\n"
                                                "Options:";

const CCmdLineParser::TStrVec CCmdLineParser::OPERATIONS{"relative", "greenhours", "trends",
                                                         "strategy", "pattern"};

bool CCmdLineParser::parse(int argc,
                           const char* const* argv,
                           std::string& configFile,
                           std::string& logProperties,
                           std::string& dataDir,
                           TStrVec& regions,
                           std::string& operation,
                           std::string& period,
                           int& days,
                           int& hours,
                           core_t::TTime& timeout,
                           std::string& outputFileName) {
    try {
        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("version", "Display version information and exit")
            ("config", boost::program_options::value<std::string>(),
                    "Optional ini file of engine settings")
            ("logProperties", boost::program_options::value<std::string>(),
                    "Optional logger properties file")
            ("dataDir", boost::program_options::value<std::string>(),
                    "Directory holding <region>.csv and <region>_forecast.csv files - default is the current directory")
            ("region", boost::program_options::value<TStrVec>(),
                    "Region to report on - may be given more than once")
            ("operation", boost::program_options::value<std::string>(),
                    "One of relative, greenhours, trends, strategy or pattern - default is relative")
            ("period", boost::program_options::value<std::string>(),
                    "Label of the trend period - default is daily")
            ("days", boost::program_options::value<int>(),
                    "Number of days of history for trends - default is 7")
            ("hours", boost::program_options::value<int>(),
                    "Number of hours of green hours forecast - default is 24")
            ("timeout", boost::program_options::value<core_t::TTime>(),
                    "Seconds to wait for each region's result - default is 30")
            ("output", boost::program_options::value<std::string>(),
                    "Optional file to write results to - not present means write to STDOUT")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc),
                                      vm);
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("version") > 0) {
            std::cerr << ver::CBuildInfo::fullInfo() << std::endl;
            return false;
        }
        if (vm.count("config") > 0) {
            configFile = vm["config"].as<std::string>();
        }
        if (vm.count("logProperties") > 0) {
            logProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("dataDir") > 0) {
            dataDir = vm["dataDir"].as<std::string>();
        }
        if (vm.count("region") > 0) {
            regions = vm["region"].as<TStrVec>();
        }
        if (vm.count("operation") > 0) {
            operation = vm["operation"].as<std::string>();
        }
        if (vm.count("period") > 0) {
            period = vm["period"].as<std::string>();
        }
        if (vm.count("days") > 0) {
            days = vm["days"].as<int>();
        }
        if (vm.count("hours") > 0) {
            hours = vm["hours"].as<int>();
        }
        if (vm.count("timeout") > 0) {
            timeout = vm["timeout"].as<core_t::TTime>();
        }
        if (vm.count("output") > 0) {
            outputFileName = vm["output"].as<std::string>();
        }
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    if (regions.empty()) {
        std::cerr << "At least one --region must be given" << std::endl;
        return false;
    }
    if (std::find(OPERATIONS.begin(), OPERATIONS.end(), operation) == OPERATIONS.end()) {
        std::cerr << "Unknown operation '" << operation << "' - must be one of "
                  << core::CStringUtils::join(OPERATIONS, ", ") << std::endl;
        return false;
    }
    if (days <= 0 || hours <= 0 || timeout <= 0) {
        std::cerr << "--days, --hours and --timeout must be positive" << std::endl;
        return false;
    }

    return true;
}
}
}
