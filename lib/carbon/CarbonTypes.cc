/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <carbon/CarbonTypes.h>

#include <ostream>

namespace greenweb {
namespace carbon {
namespace {
const double GREEN_THRESHOLD{150.0};
const double YELLOW_THRESHOLD{300.0};
}

const std::string& print(ETrendDirection direction) {
    static const std::string IMPROVING{"improving"};
    static const std::string WORSENING{"worsening"};
    static const std::string STABLE{"stable"};
    switch (direction) {
    case E_Improving:
        return IMPROVING;
    case E_Worsening:
        return WORSENING;
    case E_Stable:
        break;
    }
    return STABLE;
}

const std::string& print(ERelativeMode mode) {
    static const std::string CLEAN{"clean"};
    static const std::string AVERAGE{"average"};
    static const std::string DIRTY{"dirty"};
    switch (mode) {
    case E_Clean:
        return CLEAN;
    case E_Dirty:
        return DIRTY;
    case E_Average:
        break;
    }
    return AVERAGE;
}

std::ostream& operator<<(std::ostream& o, ETrendDirection direction) {
    return o << print(direction);
}

std::ostream& operator<<(std::ostream& o, ERelativeMode mode) {
    return o << print(mode);
}

std::string SCurrentIntensity::absoluteMode(double carbonIntensity) {
    if (carbonIntensity < GREEN_THRESHOLD) {
        return "green";
    }
    if (carbonIntensity < YELLOW_THRESHOLD) {
        return "yellow";
    }
    return "red";
}

std::string SCurrentIntensity::recommendation(double carbonIntensity) {
    if (carbonIntensity < GREEN_THRESHOLD) {
        return "optimal";
    }
    if (carbonIntensity < YELLOW_THRESHOLD) {
        return "reduce";
    }
    return "defer";
}
}
}
