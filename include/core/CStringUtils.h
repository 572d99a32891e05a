/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CStringUtils_h
#define INCLUDED_rca_core_CStringUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace rca {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! A holder of string utility methods.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Numeric conversions are implemented with the C library strto* functions
//! so that trailing garbage and overflow are detected.
//!
class CORE_EXPORT CStringUtils : private CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! We should only have one definition of whitespace across the whole
    //! product - this definition matches what ::isspace() considers as
    //! whitespace in the "C" locale
    static const std::string WHITESPACE_CHARS;

public:
    //! Convert a type to a string
    template<typename T>
    static std::string typeToString(const T& type) {
        std::ostringstream strm;
        strm << type;
        return strm.str();
    }

    //! Convert a double to a string with the specified precision
    static std::string typeToStringPrecise(double d, int precision);

    //! Convert a string to a type
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type, and don't print an
    //! error message if the conversion fails
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Joins the strings in the container with the \p delimiter.
    //! CONTAINER must be a container of std::string.
    template<typename CONTAINER>
    static std::string join(const CONTAINER& strings, const std::string& delimiter) {
        std::string result;
        bool first{true};
        for (const auto& string : strings) {
            if (first == false) {
                result += delimiter;
            }
            result += string;
            first = false;
        }
        return result;
    }

    //! Convert a string to lower case
    static std::string toLower(std::string str);

    //! How many times does word occur in str?
    static std::size_t numMatches(const std::string& str, const std::string& word);

    //! Trim whitespace characters from the beginning and end of a string
    static void trimWhitespace(std::string& str);

    //! Tokenise a std::string based on a delimiter.
    //! This does NOT behave like strtok - it matches
    //! the entire delimiter not just characters in it
    static void tokenise(const std::string& delim,
                         const std::string& str,
                         TStrVec& tokens,
                         std::string& remainder);

private:
    //! Internal calls for public templated methods
    static bool _stringToType(bool silent, const std::string& str, int& ret);
    static bool _stringToType(bool silent, const std::string& str, long& ret);
    static bool _stringToType(bool silent, const std::string& str, long long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long long& ret);
    static bool _stringToType(bool silent, const std::string& str, double& ret);
    static bool _stringToType(bool silent, const std::string& str, bool& ret);
    static bool _stringToType(bool silent, const std::string& str, std::string& ret);
};
}
}

#endif // INCLUDED_rca_core_CStringUtils_h
