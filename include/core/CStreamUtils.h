/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CStreamUtils_h
#define INCLUDED_greenweb_core_CStreamUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <iosfwd>
#include <string>

namespace greenweb {
namespace core {

//! \brief
//! Stream utility functions.
class CORE_EXPORT CStreamUtils : private CNonInstantiatable {
public:
    //! Skip a UTF-8 byte order marker if the stream is positioned at its
    //! start and one is present.
    static void skipUtf8Bom(std::istream& strm);

    //! Read a line, stripping any trailing carriage return so that files
    //! with Windows line endings read the same as Unix ones.
    static bool readLine(std::istream& strm, std::string& line);
};
}
}

#endif // INCLUDED_greenweb_core_CStreamUtils_h
