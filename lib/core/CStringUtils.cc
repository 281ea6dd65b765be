/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

#include <errno.h>
#include <stdlib.h>
#include <string.h>

namespace greenweb {
namespace core {

const std::string CStringUtils::WHITESPACE_CHARS(" \t\r\n\v\f");

namespace {
//! Check the outcome of one of the strto* family of functions.
bool conversionSucceeded(bool silent, const std::string& str, const char* endPtr, const char* type) {
    if (errno == ERANGE || errno == EINVAL) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << type
                      << ": " << ::strerror(errno));
        }
        return false;
    }
    if (endPtr == str.c_str() || (endPtr != nullptr && *endPtr != '\0')) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << type
                      << ": first invalid character " << endPtr);
        }
        return false;
    }
    return true;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}
}

void CStringUtils::trimWhitespace(std::string& str) {
    if (str.empty()) {
        return;
    }

    std::string::size_type pos{str.find_last_not_of(WHITESPACE_CHARS)};
    if (pos == std::string::npos) {
        // Special case - entire string is being trimmed
        str.clear();
        return;
    }

    str.erase(pos + 1);

    pos = str.find_first_not_of(WHITESPACE_CHARS);
    if (pos != std::string::npos && pos > 0) {
        str.erase(0, pos);
    }
}

void CStringUtils::tokenise(const std::string& delim,
                            const std::string& str,
                            TStrVec& tokens,
                            std::string& remainder) {
    std::string::size_type pos{0};
    for (;;) {
        std::string::size_type next{str.find(delim, pos)};
        if (next == std::string::npos) {
            remainder.assign(str, pos, str.size() - pos);
            break;
        }
        tokens.push_back(str.substr(pos, next - pos));
        pos = next + delim.size();
    }
}

std::string CStringUtils::_typeToString(const unsigned long long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const unsigned long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const unsigned int& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const long long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const long& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const int& i) {
    return std::to_string(i);
}

std::string CStringUtils::_typeToString(const bool& b) {
    return b ? "true" : "false";
}

std::string CStringUtils::_typeToString(const double& d) {
    std::ostringstream strm;
    strm.precision(std::numeric_limits<double>::digits10);
    strm << d;
    return strm.str();
}

std::string CStringUtils::_typeToString(const char* str) {
    return str == nullptr ? std::string{} : std::string{str};
}

const std::string& CStringUtils::_typeToString(const std::string& str) {
    return str;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& ret) {
    if (str.empty() || str[0] == '-') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to unsigned long long");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    unsigned long long value{::strtoull(str.c_str(), &endPtr, 10)};
    if (conversionSucceeded(silent, str, endPtr, "unsigned long long") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& ret) {
    unsigned long long value{0};
    if (_stringToType(silent, str, value) == false) {
        return false;
    }
    if (value > std::numeric_limits<unsigned long>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long: out of range");
        }
        return false;
    }
    ret = static_cast<unsigned long>(value);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long long& ret) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to long long");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    long long value{::strtoll(str.c_str(), &endPtr, 10)};
    if (conversionSucceeded(silent, str, endPtr, "long long") == false) {
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& ret) {
    long long value{0};
    if (_stringToType(silent, str, value) == false) {
        return false;
    }
    if (value < std::numeric_limits<long>::min() || value > std::numeric_limits<long>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to long: out of range");
        }
        return false;
    }
    ret = static_cast<long>(value);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& ret) {
    long long value{0};
    if (_stringToType(silent, str, value) == false) {
        return false;
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int: out of range");
        }
        return false;
    }
    ret = static_cast<int>(value);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{toLower(str)};
    if (lower == "true" || lower == "yes" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        ret = false;
        return true;
    }
    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& ret) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to double");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    double value{::strtod(str.c_str(), &endPtr)};
    if (conversionSucceeded(silent, str, endPtr, "double") == false) {
        return false;
    }
    if (std::isfinite(value) == false) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to a finite double");
        }
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool /*silent*/, const std::string& str, std::string& ret) {
    ret = str;
    return true;
}
}
}
