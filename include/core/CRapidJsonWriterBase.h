/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CRapidJsonWriterBase_h
#define INCLUDED_rca_core_CRapidJsonWriterBase_h

#include <core/CTimeUtils.h>
#include <core/CoreTypes.h>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdint>
#include <string>

namespace rca {
namespace core {

//! \brief
//! A Json writer with fixed length allocator pool
//! With utility functions for adding fields to JSON objects.
//!
//! DESCRIPTION:\n
//! Wraps a rapidjson writer so that the writing of common field types is
//! less verbose and so that values which JSON can't represent are never
//! emitted.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Templatized on the actual rapidjson writer type - defaults to rapidjson::Writer
//!
//! Timestamps are written as W3C date time strings in UTC.
//!
template<typename OUTPUT_STREAM,
         typename SOURCE_ENCODING = rapidjson::UTF8<>,
         typename TARGET_ENCODING = rapidjson::UTF8<>,
         typename STACK_ALLOCATOR = rapidjson::CrtAllocator,
         unsigned WRITE_FLAGS = rapidjson::kWriteDefaultFlags,
         template<typename, typename, typename, typename, unsigned> class JSON_WRITER = rapidjson::Writer>
class CRapidJsonWriterBase
    : public JSON_WRITER<OUTPUT_STREAM, SOURCE_ENCODING, TARGET_ENCODING, STACK_ALLOCATOR, WRITE_FLAGS> {
public:
    using TRapidJsonWriterBase =
        JSON_WRITER<OUTPUT_STREAM, SOURCE_ENCODING, TARGET_ENCODING, STACK_ALLOCATOR, WRITE_FLAGS>;
    using TRapidJsonWriterBase::Key;
    using TRapidJsonWriterBase::String;

public:
    explicit CRapidJsonWriterBase(OUTPUT_STREAM& os) : TRapidJsonWriterBase(os) {}

    virtual ~CRapidJsonWriterBase() = default;

    bool String(const std::string& str) {
        return TRapidJsonWriterBase::String(
            str.c_str(), static_cast<rapidjson::SizeType>(str.length()));
    }

    bool Key(const std::string& key) {
        return TRapidJsonWriterBase::Key(
            key.c_str(), static_cast<rapidjson::SizeType>(key.length()));
    }

    bool Double(double d) {
        // rewrite NaN and Infinity to 0
        if (std::isfinite(d) == false) {
            return TRapidJsonWriterBase::Int(0);
        }

        return TRapidJsonWriterBase::Double(d);
    }

    //! Writes an epoch second timestamp as a W3C date time
    bool Time(core_t::TTime t) { return this->String(CTimeUtils::toIso8601(t)); }

    //! Write JSON document to outputstream
    virtual void write(const rapidjson::Value& doc) { doc.Accept(*this); }

    //! \name Object Fields
    //! Write a key and value pair to the current object.
    //@{
    void addStringField(const std::string& name, const std::string& value) {
        this->Key(name);
        this->String(value);
    }

    void addDoubleField(const std::string& name, double value) {
        this->Key(name);
        this->Double(value);
    }

    void addIntField(const std::string& name, std::int64_t value) {
        this->Key(name);
        this->Int64(value);
    }

    void addUIntField(const std::string& name, std::uint64_t value) {
        this->Key(name);
        this->Uint64(value);
    }

    void addBoolField(const std::string& name, bool value) {
        this->Key(name);
        this->Bool(value);
    }

    void addTimeField(const std::string& name, core_t::TTime value) {
        this->Key(name);
        this->Time(value);
    }

    //! Writes null if \p value isn't set.
    template<typename OPTIONAL_TIME>
    void addOptionalTimeField(const std::string& name, const OPTIONAL_TIME& value) {
        this->Key(name);
        if (value) {
            this->Time(*value);
        } else {
            this->Null();
        }
    }
    //@}
};
}
}

#endif // INCLUDED_rca_core_CRapidJsonWriterBase_h
