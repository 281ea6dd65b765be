/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CStringUtils_h
#define INCLUDED_greenweb_core_CStringUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <string>
#include <vector>

namespace greenweb {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! Conversions between strings and numbers, trimming and tokenising.
//!
//! IMPLEMENTATION DECISIONS:\n
//! stringToType() logs the reason for a failed conversion at error level,
//! stringToTypeSilent() doesn't.  Both require the whole string to be
//! consumed, so "12abc" is not a valid integer.
//!
class CORE_EXPORT CStringUtils : private CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;

    static const std::string WHITESPACE_CHARS;

public:
    //! Convert a type to a string
    template<typename T>
    static std::string typeToString(const T& type) {
        return CStringUtils::_typeToString(type);
    }

    //! Convert a string to a type
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type without logging on failure
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Join the elements of a string container with the given delimiter
    template<typename CONTAINER>
    static std::string join(const CONTAINER& strings, const std::string& delimiter) {
        std::string result;
        bool first{true};
        for (const auto& str : strings) {
            if (first == false) {
                result += delimiter;
            }
            result += str;
            first = false;
        }
        return result;
    }

    //! Trim whitespace characters from the start and end of a string
    static void trimWhitespace(std::string& str);

    //! Tokenise a string on a delimiter.  Everything after the final
    //! delimiter goes in remainder.
    static void tokenise(const std::string& delim,
                         const std::string& str,
                         TStrVec& tokens,
                         std::string& remainder);

private:
    static std::string _typeToString(const unsigned long long& i);
    static std::string _typeToString(const unsigned long& i);
    static std::string _typeToString(const unsigned int& i);
    static std::string _typeToString(const long long& i);
    static std::string _typeToString(const long& i);
    static std::string _typeToString(const int& i);
    static std::string _typeToString(const bool& b);
    static std::string _typeToString(const double& d);
    static std::string _typeToString(const char* str);
    static const std::string& _typeToString(const std::string& str);

    static bool _stringToType(bool silent, const std::string& str, unsigned long long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long& ret);
    static bool _stringToType(bool silent, const std::string& str, long long& ret);
    static bool _stringToType(bool silent, const std::string& str, long& ret);
    static bool _stringToType(bool silent, const std::string& str, int& ret);
    //! Accepts "true", "false", "yes", "no", "1" and "0" in any case
    static bool _stringToType(bool silent, const std::string& str, bool& ret);
    static bool _stringToType(bool silent, const std::string& str, double& ret);
    static bool _stringToType(bool silent, const std::string& str, std::string& ret);
};
}
}

#endif // INCLUDED_greenweb_core_CStringUtils_h
