/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CTools.h>

#include <cmath>

namespace greenweb {
namespace maths {

double CTools::roundToDecimalPlaces(double x, int decimalPlaces) {
    double scale{std::pow(10.0, decimalPlaces)};
    return std::round(x * scale) / scale;
}
}
}
