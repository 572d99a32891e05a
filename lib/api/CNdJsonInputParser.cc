/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CNdJsonInputParser.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CStringUtils.h>

#include <rapidjson/error/en.h>

#include <istream>

namespace rca {
namespace api {

CNdJsonInputParser::CNdJsonInputParser(std::istream& strmIn) : m_StrmIn(strmIn) {
}

bool CNdJsonInputParser::readStream(const TReaderFunc& readerFunc) {
    std::string line;
    while (std::getline(m_StrmIn, line)) {
        ++m_LineNumber;
        core::CStringUtils::trimWhitespace(line);
        if (line.empty()) {
            continue;
        }

        rapidjson::Document document;
        if (this->parseDocument(line, document) == false) {
            ++m_RecordsRejected;
            ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
            continue;
        }

        ++m_RecordsRead;
        if (readerFunc(document) == false) {
            LOG_ERROR(<< "Record handler function forced exit at line " << m_LineNumber);
            return false;
        }
    }

    if (m_StrmIn.bad()) {
        LOG_ERROR(<< "Input stream is bad after reading " << m_LineNumber << " lines");
        return false;
    }

    return true;
}

std::size_t CNdJsonInputParser::numberRecordsRead() const {
    return m_RecordsRead;
}

std::size_t CNdJsonInputParser::numberRecordsRejected() const {
    return m_RecordsRejected;
}

bool CNdJsonInputParser::parseDocument(const std::string& line,
                                       rapidjson::Document& document) const {
    if (document.Parse<rapidjson::kParseDefaultFlags>(line.c_str()).HasParseError()) {
        LOG_WARN(<< "JSON parse error at line " << m_LineNumber << ": "
                 << rapidjson::GetParseError_En(document.GetParseError())
                 << " (offset " << document.GetErrorOffset() << ")");
        return false;
    }

    if (document.IsObject() == false) {
        LOG_WARN(<< "Top level of JSON document at line " << m_LineNumber
                 << " is not an object: " << line);
        return false;
    }

    return true;
}
}
}
