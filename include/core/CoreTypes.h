/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_t_CoreTypes_h
#define INCLUDED_greenweb_core_t_CoreTypes_h

#include <time.h>

namespace greenweb {
namespace core_t {

//! Seconds since the epoch are the time granularity throughout.
//! This is a UTC value
using TTime = time_t;

//! The standard line ending for the platform
#ifdef Windows
const char* const LINE_ENDING = "\r\n";
#else
const char* const LINE_ENDING = "\n";
#endif
}
}

#endif // INCLUDED_greenweb_core_t_CoreTypes_h
