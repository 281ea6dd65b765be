/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_carbon_intel_CCmdLineParser_h
#define INCLUDED_greenweb_carbon_intel_CCmdLineParser_h

#include <core/CoreTypes.h>

#include <string>
#include <vector>

namespace greenweb {
namespace carbon_intel {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Very simple command line parser.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
//!
class CCmdLineParser {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc,
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
                      std::string& outputFileName);

private:
    static const std::string DESCRIPTION;
    static const TStrVec OPERATIONS;
};
}
}

#endif // INCLUDED_greenweb_carbon_intel_CCmdLineParser_h
