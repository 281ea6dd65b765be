/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStreamUtils.h>

#include <core/CLogger.h>

#include <istream>

namespace greenweb {
namespace core {

void CStreamUtils::skipUtf8Bom(std::istream& strm) {
    if (strm.tellg() != std::streampos(0)) {
        return;
    }
    std::ios_base::iostate origState(strm.rdstate());
    // The 3 bytes 0xEF, 0xBB, 0xBF form a UTF-8 byte order marker (BOM)
    if (strm.get() == 0xEF && strm.get() == 0xBB && strm.get() == 0xBF) {
        LOG_DEBUG(<< "Skipping UTF-8 BOM");
        return;
    }
    strm.clear(origState);
    strm.seekg(0);
}

bool CStreamUtils::readLine(std::istream& strm, std::string& line) {
    if (std::getline(strm, line).fail()) {
        return false;
    }
    if (line.empty() == false && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}
}
}
