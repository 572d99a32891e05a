/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>

namespace rca {
namespace core {

const std::string CStringUtils::WHITESPACE_CHARS{" \t\r\n\v\f"};

std::string CStringUtils::typeToStringPrecise(double d, int precision) {
    std::ostringstream strm;
    strm << std::setprecision(precision) << d;
    return strm.str();
}

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

std::size_t CStringUtils::numMatches(const std::string& str, const std::string& word) {
    if (word.empty()) {
        return 0;
    }
    std::size_t count{0};
    for (std::size_t pos = str.find(word); pos != std::string::npos;
         pos = str.find(word, pos + word.length())) {
        ++count;
    }
    return count;
}

void CStringUtils::trimWhitespace(std::string& str) {
    std::size_t first{str.find_first_not_of(WHITESPACE_CHARS)};
    if (first == std::string::npos) {
        str.clear();
        return;
    }
    std::size_t last{str.find_last_not_of(WHITESPACE_CHARS)};
    str = str.substr(first, last - first + 1);
}

void CStringUtils::tokenise(const std::string& delim,
                            const std::string& str,
                            TStrVec& tokens,
                            std::string& remainder) {
    tokens.clear();
    remainder.clear();
    if (delim.empty()) {
        remainder = str;
        return;
    }

    std::size_t start{0};
    std::size_t end{str.find(delim)};
    while (end != std::string::npos) {
        tokens.push_back(str.substr(start, end - start));
        start = end + delim.length();
        end = str.find(delim, start);
    }
    remainder = str.substr(start);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& ret) {
    long long value{0};
    if (_stringToType(silent, str, value) == false) {
        return false;
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int - out of range");
        }
        return false;
    }
    ret = static_cast<int>(value);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& ret) {
    long long value{0};
    if (_stringToType(silent, str, value) == false) {
        return false;
    }
    ret = static_cast<long>(value);
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
    long long value{std::strtoll(str.c_str(), &endPtr, 10)};
    if (errno != 0 || endPtr == nullptr || *endPtr != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to long long");
        }
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
    ret = static_cast<unsigned long>(value);
    return true;
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
    unsigned long long value{std::strtoull(str.c_str(), &endPtr, 10)};
    if (errno != 0 || endPtr == nullptr || *endPtr != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to unsigned long long");
        }
        return false;
    }
    ret = value;
    return true;
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
    double value{std::strtod(str.c_str(), &endPtr)};
    if (errno != 0 || endPtr == nullptr || *endPtr != '\0' || std::isfinite(value) == false) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to double");
        }
        return false;
    }
    ret = value;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{toLower(str)};
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        ret = false;
        return true;
    }
    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}

bool CStringUtils::_stringToType(bool, const std::string& str, std::string& ret) {
    ret = str;
    return true;
}
}
}
