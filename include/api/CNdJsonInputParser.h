/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CNdJsonInputParser_h
#define INCLUDED_rca_api_CNdJsonInputParser_h

#include <core/CNonCopyable.h>

#include <api/ImportExport.h>

#include <rapidjson/document.h>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

namespace rca {
namespace api {

//! \brief
//! Parse JSON input where each line is a separate JSON document
//!
//! DESCRIPTION:\n
//! Since newline characters within values are represented as \n in JSON, it
//! is always possible to write a whole JSON document to a single line. Each
//! line of the stream is expected to be a complete JSON object describing one
//! telemetry record, label or control instruction.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Using the RapidJson library to do the heavy lifting. The parsed document
//! is passed straight to the reader function rather than being copied into
//! string maps because records carry typed values and nested objects.
//!
//! A line which is not valid JSON, or is valid JSON but not an object, is
//! logged, counted as a rejected record and skipped. Blank lines are ignored.
//!
class API_EXPORT CNdJsonInputParser : private core::CNonCopyable {
public:
    using TReaderFunc = std::function<bool(const rapidjson::Document&)>;

public:
    //! Construct with an input stream to be parsed. Once a stream is
    //! passed to this constructor, no other object should read from it.
    explicit CNdJsonInputParser(std::istream& strmIn);

    //! Read records from the stream. The supplied reader function is called
    //! once per record. If the supplied reader function returns false,
    //! reading will stop. Returns true if the end of the stream is reached.
    bool readStream(const TReaderFunc& readerFunc);

    //! Get the number of documents passed to the reader function.
    std::size_t numberRecordsRead() const;

    //! Get the number of lines which couldn't be parsed.
    std::size_t numberRecordsRejected() const;

private:
    //! Attempt to parse a line into a JSON object.
    bool parseDocument(const std::string& line, rapidjson::Document& document) const;

private:
    std::istream& m_StrmIn;
    std::size_t m_LineNumber{0};
    std::size_t m_RecordsRead{0};
    std::size_t m_RecordsRejected{0};
};
}
}

#endif // INCLUDED_rca_api_CNdJsonInputParser_h
