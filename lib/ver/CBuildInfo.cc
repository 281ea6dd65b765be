/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <ver/CBuildInfo.h>

#ifndef GREENWEB_VERSION_NUMBER
#define GREENWEB_VERSION_NUMBER "development"
#endif

#ifndef GREENWEB_BUILD_NUMBER
#define GREENWEB_BUILD_NUMBER "unknown"
#endif

namespace greenweb {
namespace ver {

const std::string CBuildInfo::VERSION_NUMBER{GREENWEB_VERSION_NUMBER};
const std::string CBuildInfo::BUILD_NUMBER{GREENWEB_BUILD_NUMBER};
const std::string CBuildInfo::COPYRIGHT{"Copyright (c) Elasticsearch BV"};

const std::string& CBuildInfo::versionNumber() {
    return VERSION_NUMBER;
}

const std::string& CBuildInfo::buildNumber() {
    return BUILD_NUMBER;
}

const std::string& CBuildInfo::copyright() {
    return COPYRIGHT;
}

std::string CBuildInfo::fullInfo() {
    return "GreenWeb carbon intelligence (" + VERSION_NUMBER + ") Build " +
           BUILD_NUMBER + "\n" + COPYRIGHT;
}
}
}
