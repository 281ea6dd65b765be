/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_maths_ImportExport_h
#define INCLUDED_greenweb_maths_ImportExport_h

//! On Windows, it's necessary to explicitly export functions from
//! DLLs.  The macro expands to __declspec(dllexport) when the DLL
//! containing the class is being built and to __declspec(dllimport)
//! when other code that uses the class is being built.  On Unix the
//! macro must evaluate to an empty string.

#ifdef Windows

#ifdef BUILDING_libGreenWebMaths
#define MATHS_EXPORT __declspec(dllexport)
#else
#define MATHS_EXPORT __declspec(dllimport)
#endif

#else

// Empty string on Unix
#define MATHS_EXPORT

#endif

#endif // INCLUDED_greenweb_maths_ImportExport_h
