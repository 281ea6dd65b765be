/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CDeadline.h>

namespace greenweb {
namespace core {

CDeadline::CDeadline() : m_When{TTimePoint::max()} {
}

CDeadline::CDeadline(TTimePoint when) : m_When{when} {
}

CDeadline CDeadline::never() {
    return CDeadline{};
}

bool CDeadline::expired() const {
    return this->isNever() == false && TClock::now() >= m_When;
}

bool CDeadline::isNever() const {
    return m_When == TTimePoint::max();
}

CDeadline::TTimePoint CDeadline::when() const {
    return m_When;
}
}
}
