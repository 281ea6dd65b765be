/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSimpleLinearRegression.h>

namespace greenweb {
namespace maths {

void CSimpleLinearRegression::add(double x, double y) {
    m_N += 1.0;
    m_SumX += x;
    m_SumY += y;
    m_SumXY += x * y;
    m_SumXX += x * x;
}

double CSimpleLinearRegression::slope() const {
    double denominator{m_N * m_SumXX - m_SumX * m_SumX};
    if (m_N < 2.0 || denominator == 0.0) {
        return 0.0;
    }
    return (m_N * m_SumXY - m_SumX * m_SumY) / denominator;
}
}
}
